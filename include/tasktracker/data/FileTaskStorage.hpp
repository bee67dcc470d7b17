#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "tasktracker/data/StorageError.hpp"
#include "tasktracker/data/Task.hpp"

namespace tasktracker {
namespace data {

// Reads and writes the task file: a JSON array of {id, name, due} objects.
class FileTaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() = default;

    const QString &filePath() const;

    // A missing file loads as an empty collection.
    std::optional<std::vector<TaskItem>> load();
    bool save(const std::vector<TaskItem> &tasks);

    StorageError lastError() const;
    QString errorString() const;

private:
    void setError(StorageError error, const QString &message);
    void clearError();

    static QByteArray encode(const std::vector<TaskItem> &tasks);
    static std::optional<std::vector<TaskItem>> decode(const QByteArray &json, QString *errorMessage);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    StorageError m_lastError = StorageError::NoError;
    QString m_errorString;
};

} // namespace data
} // namespace tasktracker
