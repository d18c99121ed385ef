#include "sn/note_model.h"
#include <random>
#include <sstream>
#include <iomanip>
#include <array>
#include <cstdint>

namespace sn {

CanvasTemplate CanvasTemplate::none() {
    return CanvasTemplate{};
}

CanvasTemplate CanvasTemplate::lined() {
    CanvasTemplate t;
    t.type = Type::Lined;
    t.spacing = 24.0;
    return t;
}

CanvasTemplate CanvasTemplate::graph() {
    CanvasTemplate t;
    t.type = Type::Graph;
    t.spacing = 20.0;
    return t;
}

CanvasTemplate CanvasTemplate::dotted() {
    CanvasTemplate t;
    t.type = Type::Dotted;
    t.spacing = 20.0;
    return t;
}

bool CanvasTemplate::operator==(const CanvasTemplate& other) const {
    return type == other.type
        && spacing == other.spacing
        && colorHex == other.colorHex
        && lineWidth == other.lineWidth;
}

const char* templateTypeName(CanvasTemplate::Type type) {
    switch (type) {
    case CanvasTemplate::Type::None:   return "None";
    case CanvasTemplate::Type::Lined:  return "Lined Paper";
    case CanvasTemplate::Type::Graph:  return "Graph Paper";
    case CanvasTemplate::Type::Dotted: return "Dotted Paper";
    }
    return "None";
}

std::optional<CanvasTemplate::Type> templateTypeFromName(const std::string& name) {
    for (auto type : {CanvasTemplate::Type::None, CanvasTemplate::Type::Lined,
                      CanvasTemplate::Type::Graph, CanvasTemplate::Type::Dotted}) {
        if (name == templateTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

void Subject::touch(Timestamp now) {
    lastModified = now;
}

std::string generateUUID() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<int> dis(0, 255);

    std::array<uint8_t, 16> bytes;
    for (int i = 0; i < 16; i++) {
        bytes[i] = static_cast<uint8_t>(dis(gen));
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    // Format: 8-4-4-4-12
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << "-";
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return ss.str();
}

Subject createSubject(const std::string& name, const std::string& colorName) {
    Subject subject;
    subject.id = generateUUID();
    subject.name = name;
    subject.colorName = colorName;
    subject.lastModified = std::chrono::system_clock::now();
    return subject;
}

Page createPage(std::optional<CanvasTemplate> pageTemplate, int pageNumber) {
    Page page;
    page.id = generateUUID();
    page.pageTemplate = std::move(pageTemplate);
    page.pageNumber = pageNumber;
    return page;
}

Note createNote(const std::string& title, std::optional<CanvasTemplate> noteTemplate) {
    auto now = std::chrono::system_clock::now();
    Note note;
    note.id = generateUUID();
    note.title = title;
    note.dateCreated = now;
    note.lastModified = now;
    note.pages.push_back(createPage(noteTemplate, 1));
    note.noteTemplate = std::move(noteTemplate);
    return note;
}

} // namespace sn
