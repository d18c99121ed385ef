#pragma once

#include <string>
#include <variant>
#include <vector>
#include <QByteArray>
#include <QString>

#include "note_model.h"

namespace sn {

enum class StorageError {
    None,
    ReadFailed,
    WriteFailed,
    CorruptFile,
    DiskFull
};

[[nodiscard]] const char* storageErrorName(StorageError error);

struct SuccessType {};

template<typename T>
using Result = std::variant<T, StorageError>;

template<typename T>
inline bool isSuccess(const Result<T>& r) {
    return std::holds_alternative<T>(r);
}

template<typename T>
inline const T& getSuccess(const Result<T>& r) {
    return std::get<T>(r);
}

template<typename T>
inline StorageError getError(const Result<T>& r) {
    return std::get<StorageError>(r);
}

// Result<void> spelled with a tag type
using VoidResult = std::variant<SuccessType, StorageError>;

inline bool isSuccess(const VoidResult& r) {
    return std::holds_alternative<SuccessType>(r);
}

// Persistence collaborator of the SaveMiddleware. saveSubjects() is called
// from a worker thread and must not touch shared mutable state.
class IStateStorage {
public:
    virtual ~IStateStorage() = default;
    virtual Result<std::vector<Subject>> loadSubjects() = 0;
    virtual VoidResult saveSubjects(const std::vector<Subject>& subjects) = 0;
};

// Whole subject list in a single JSON document. Drawing data is base64.
class JsonFileStorage : public IStateStorage {
public:
    explicit JsonFileStorage(const QString& filePath);

    Result<std::vector<Subject>> loadSubjects() override;
    VoidResult saveSubjects(const std::vector<Subject>& subjects) override;

    [[nodiscard]] const QString& filePath() const { return file_path_; }

    static QByteArray toJson(const std::vector<Subject>& subjects);
    static Result<std::vector<Subject>> fromJson(const QByteArray& json);

private:
    QString file_path_;
};

} // namespace sn
