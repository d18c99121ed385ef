#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

namespace sn {

using EntityId = std::string;
using SubjectId = EntityId;
using NoteId = EntityId;
using PageId = EntityId;
using Timestamp = std::chrono::system_clock::time_point;
using DrawingData = std::vector<std::uint8_t>;

struct CanvasTemplate {
    enum class Type {
        None,
        Lined,
        Graph,
        Dotted
    };

    Type type = Type::None;
    double spacing = 24.0;
    std::string colorHex = "#CCCCCC";
    double lineWidth = 0.5;

    static CanvasTemplate none();
    static CanvasTemplate lined();
    static CanvasTemplate graph();
    static CanvasTemplate dotted();

    bool operator==(const CanvasTemplate& other) const;
    bool operator!=(const CanvasTemplate& other) const { return !(*this == other); }
};

// "None", "Lined Paper", "Graph Paper", "Dotted Paper"
[[nodiscard]] const char* templateTypeName(CanvasTemplate::Type type);
[[nodiscard]] std::optional<CanvasTemplate::Type> templateTypeFromName(const std::string& name);

// Entities compare by identifier only.
struct Page {
    PageId id;
    DrawingData drawingData;
    std::optional<CanvasTemplate> pageTemplate;
    int pageNumber = 1;
    bool isBookmarked = false;

    bool operator==(const Page& other) const { return id == other.id; }
    bool operator!=(const Page& other) const { return id != other.id; }
};

struct Note {
    NoteId id;
    std::string title;
    DrawingData drawingData;
    Timestamp dateCreated;
    Timestamp lastModified;
    std::vector<Page> pages;
    std::optional<CanvasTemplate> noteTemplate;

    bool operator==(const Note& other) const { return id == other.id; }
    bool operator!=(const Note& other) const { return id != other.id; }
};

struct Subject {
    SubjectId id;
    std::string name;
    std::vector<Note> notes;
    std::string colorName = "blue";
    Timestamp lastModified;

    bool operator==(const Subject& other) const { return id == other.id; }
    bool operator!=(const Subject& other) const { return id != other.id; }

    // Marks the subject as modified at the given time.
    void touch(Timestamp now);
};

[[nodiscard]] std::string generateUUID();

Subject createSubject(const std::string& name, const std::string& colorName = "blue");
Page createPage(std::optional<CanvasTemplate> pageTemplate = std::nullopt, int pageNumber = 1);
Note createNote(const std::string& title, std::optional<CanvasTemplate> noteTemplate = std::nullopt);

} // namespace sn
