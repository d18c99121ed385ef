#include "sn/storage.h"

#include <algorithm>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include "sn/logging.h"

namespace sn {

namespace {

constexpr int kFormatVersion = 1;

qint64 toMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp fromMillis(const QJsonValue& value) {
    // Qt's JSON parser keeps large integers as doubles
    auto millis = static_cast<qint64>(value.toDouble(0));
    return Timestamp(std::chrono::milliseconds(millis));
}

QString encodeDrawing(const DrawingData& data) {
    QByteArray bytes(static_cast<int>(data.size()), Qt::Uninitialized);
    std::copy(data.begin(), data.end(), bytes.begin());
    return QString::fromLatin1(bytes.toBase64());
}

DrawingData decodeDrawing(const QJsonValue& value) {
    QByteArray bytes = QByteArray::fromBase64(value.toString().toLatin1());
    return DrawingData(bytes.begin(), bytes.end());
}

QJsonObject templateToJson(const CanvasTemplate& t) {
    QJsonObject obj;
    obj["type"] = QString::fromLatin1(templateTypeName(t.type));
    obj["spacing"] = t.spacing;
    obj["colorHex"] = QString::fromStdString(t.colorHex);
    obj["lineWidth"] = t.lineWidth;
    return obj;
}

std::optional<CanvasTemplate> templateFromJson(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject obj = value.toObject();
    auto type = templateTypeFromName(obj["type"].toString().toStdString());
    if (!type) {
        return std::nullopt;
    }
    CanvasTemplate t;
    t.type = *type;
    t.spacing = obj["spacing"].toDouble(t.spacing);
    t.colorHex = obj["colorHex"].toString(QString::fromStdString(t.colorHex)).toStdString();
    t.lineWidth = obj["lineWidth"].toDouble(t.lineWidth);
    return t;
}

QJsonObject pageToJson(const Page& page) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(page.id);
    obj["drawingData"] = encodeDrawing(page.drawingData);
    obj["pageNumber"] = page.pageNumber;
    obj["isBookmarked"] = page.isBookmarked;
    if (page.pageTemplate) {
        obj["template"] = templateToJson(*page.pageTemplate);
    }
    return obj;
}

QJsonObject noteToJson(const Note& note) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(note.id);
    obj["title"] = QString::fromStdString(note.title);
    obj["drawingData"] = encodeDrawing(note.drawingData);
    obj["dateCreated"] = toMillis(note.dateCreated);
    obj["lastModified"] = toMillis(note.lastModified);
    if (note.noteTemplate) {
        obj["template"] = templateToJson(*note.noteTemplate);
    }
    QJsonArray pages;
    for (const auto& page : note.pages) {
        pages.append(pageToJson(page));
    }
    obj["pages"] = pages;
    return obj;
}

QJsonObject subjectToJson(const Subject& subject) {
    QJsonObject obj;
    obj["id"] = QString::fromStdString(subject.id);
    obj["name"] = QString::fromStdString(subject.name);
    obj["colorName"] = QString::fromStdString(subject.colorName);
    obj["lastModified"] = toMillis(subject.lastModified);
    QJsonArray notes;
    for (const auto& note : subject.notes) {
        notes.append(noteToJson(note));
    }
    obj["notes"] = notes;
    return obj;
}

bool hasId(const QJsonObject& obj) {
    return obj["id"].isString() && !obj["id"].toString().isEmpty();
}

std::optional<Page> pageFromJson(const QJsonObject& obj) {
    if (!hasId(obj)) {
        return std::nullopt;
    }
    Page page;
    page.id = obj["id"].toString().toStdString();
    page.drawingData = decodeDrawing(obj["drawingData"]);
    page.pageNumber = obj["pageNumber"].toInt(1);
    page.isBookmarked = obj["isBookmarked"].toBool(false);
    page.pageTemplate = templateFromJson(obj["template"]);
    return page;
}

std::optional<Note> noteFromJson(const QJsonObject& obj) {
    if (!hasId(obj) || !obj["pages"].isArray()) {
        return std::nullopt;
    }
    Note note;
    note.id = obj["id"].toString().toStdString();
    note.title = obj["title"].toString().toStdString();
    note.drawingData = decodeDrawing(obj["drawingData"]);
    note.dateCreated = fromMillis(obj["dateCreated"]);
    note.lastModified = fromMillis(obj["lastModified"]);
    note.noteTemplate = templateFromJson(obj["template"]);
    for (const auto& value : obj["pages"].toArray()) {
        auto page = pageFromJson(value.toObject());
        if (!page) {
            return std::nullopt;
        }
        note.pages.push_back(std::move(*page));
    }
    return note;
}

std::optional<Subject> subjectFromJson(const QJsonObject& obj) {
    if (!hasId(obj) || !obj["notes"].isArray()) {
        return std::nullopt;
    }
    Subject subject;
    subject.id = obj["id"].toString().toStdString();
    subject.name = obj["name"].toString().toStdString();
    subject.colorName = obj["colorName"].toString("blue").toStdString();
    subject.lastModified = fromMillis(obj["lastModified"]);
    for (const auto& value : obj["notes"].toArray()) {
        auto note = noteFromJson(value.toObject());
        if (!note) {
            return std::nullopt;
        }
        subject.notes.push_back(std::move(*note));
    }
    return subject;
}

} // namespace

const char* storageErrorName(StorageError error) {
    switch (error) {
    case StorageError::None: return "None";
    case StorageError::ReadFailed: return "ReadFailed";
    case StorageError::WriteFailed: return "WriteFailed";
    case StorageError::CorruptFile: return "CorruptFile";
    case StorageError::DiskFull: return "DiskFull";
    }
    return "Unknown";
}

JsonFileStorage::JsonFileStorage(const QString& filePath)
    : file_path_(filePath) {
}

QByteArray JsonFileStorage::toJson(const std::vector<Subject>& subjects) {
    QJsonArray array;
    for (const auto& subject : subjects) {
        array.append(subjectToJson(subject));
    }
    QJsonObject root;
    root["version"] = kFormatVersion;
    root["subjects"] = array;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

Result<std::vector<Subject>> JsonFileStorage::fromJson(const QByteArray& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(lcPersistence) << "JSON parse error at offset" << parseError.offset << ":" << parseError.errorString();
        return StorageError::CorruptFile;
    }
    if (!doc.isObject() || !doc.object().value("subjects").isArray()) {
        qCWarning(lcPersistence) << "document has no subjects array";
        return StorageError::CorruptFile;
    }

    std::vector<Subject> subjects;
    for (const auto& value : doc.object().value("subjects").toArray()) {
        auto subject = subjectFromJson(value.toObject());
        if (!subject) {
            qCWarning(lcPersistence) << "malformed subject entry";
            return StorageError::CorruptFile;
        }
        subjects.push_back(std::move(*subject));
    }
    return subjects;
}

Result<std::vector<Subject>> JsonFileStorage::loadSubjects() {
    QFile file(file_path_);
    if (!file.exists()) {
        qCInfo(lcPersistence) << "no data file at" << file_path_ << "- starting empty";
        return std::vector<Subject>{};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPersistence) << "cannot open" << file_path_ << ":" << file.errorString();
        return StorageError::ReadFailed;
    }
    return fromJson(file.readAll());
}

VoidResult JsonFileStorage::saveSubjects(const std::vector<Subject>& subjects) {
    QFileInfo info(file_path_);
    if (!QDir().mkpath(info.absolutePath())) {
        qCWarning(lcPersistence) << "cannot create directory" << info.absolutePath();
        return StorageError::WriteFailed;
    }

    QSaveFile file(file_path_);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPersistence) << "cannot open" << file_path_ << "for writing:" << file.errorString();
        return StorageError::WriteFailed;
    }

    const QByteArray data = toJson(subjects);
    if (file.write(data) != data.size()) {
        StorageError error = file.error() == QFileDevice::ResourceError ? StorageError::DiskFull
                                                                         : StorageError::WriteFailed;
        qCWarning(lcPersistence) << "write failed:" << file.errorString();
        file.cancelWriting();
        return error;
    }
    if (!file.commit()) {
        qCWarning(lcPersistence) << "commit failed:" << file.errorString();
        return StorageError::WriteFailed;
    }

    qCDebug(lcPersistence) << "saved" << subjects.size() << "subjects to" << file_path_;
    return SuccessType{};
}

} // namespace sn
