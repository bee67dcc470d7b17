#include "tasktracker/data/FileTaskStorage.hpp"

#include "tasktracker/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QObject>
#include <QSaveFile>
#include <QSet>

namespace tasktracker {
namespace data {

namespace {
const QLatin1String ID_KEY("id");
const QLatin1String NAME_KEY("name");
const QLatin1String DUE_KEY("due");

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value);
    QUuid id(withBraces);
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}
} // namespace

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileTaskStorage::filePath() const
{
    return m_filePath;
}

std::optional<std::vector<TaskItem>> FileTaskStorage::load()
{
    clearError();

    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcStorage) << "No task file at" << m_filePath << "- starting empty";
        return std::vector<TaskItem>{};
    }
    if (!QFileInfo(m_filePath).isFile()) {
        setError(StorageError::ReadFailed,
                 QObject::tr("Cannot read %1: not a regular file").arg(m_filePath));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(StorageError::ReadFailed,
                 QObject::tr("Cannot read %1: %2").arg(m_filePath, file.errorString()));
        return std::nullopt;
    }

    QString message;
    auto tasks = decode(file.readAll(), &message);
    if (!tasks) {
        setError(StorageError::MalformedData,
                 QObject::tr("Malformed task file %1: %2").arg(m_filePath, message));
        return std::nullopt;
    }
    return tasks;
}

bool FileTaskStorage::save(const std::vector<TaskItem> &tasks)
{
    clearError();

    if (m_filePath.isEmpty()) {
        setError(StorageError::WriteFailed, QObject::tr("No task file configured"));
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(StorageError::WriteFailed,
                 QObject::tr("Cannot create directory %1").arg(dir.path()));
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(StorageError::WriteFailed,
                 QObject::tr("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    const QByteArray json = encode(tasks);
    if (file.write(json) != json.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        setError(StorageError::WriteFailed,
                 QObject::tr("Cannot write %1: %2").arg(m_filePath, reason));
        return false;
    }
    if (!file.commit()) {
        setError(StorageError::WriteFailed,
                 QObject::tr("Cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    qCDebug(lcStorage) << "Saved" << tasks.size() << "tasks to" << m_filePath;
    return true;
}

StorageError FileTaskStorage::lastError() const
{
    return m_lastError;
}

QString FileTaskStorage::errorString() const
{
    return m_errorString;
}

void FileTaskStorage::setError(StorageError error, const QString &message)
{
    m_lastError = error;
    m_errorString = message;
    qCWarning(lcStorage).noquote() << message;
}

void FileTaskStorage::clearError()
{
    m_lastError = StorageError::NoError;
    m_errorString.clear();
}

QByteArray FileTaskStorage::encode(const std::vector<TaskItem> &tasks)
{
    QJsonArray array;
    for (const TaskItem &task : tasks) {
        QJsonObject object;
        object.insert(ID_KEY, prepareUid(task.id));
        object.insert(NAME_KEY, task.name);
        object.insert(DUE_KEY, formatDateTime(task.due));
        array.append(object);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

std::optional<std::vector<TaskItem>> FileTaskStorage::decode(const QByteArray &json, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) -> std::optional<std::vector<TaskItem>> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(parseError.errorString());
    }
    if (!document.isArray()) {
        return fail(QObject::tr("expected a list of tasks"));
    }

    const QJsonArray array = document.array();
    std::vector<TaskItem> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    QSet<QUuid> seenIds;
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue value = array.at(i);
        if (!value.isObject()) {
            return fail(QObject::tr("entry %1 is not an object").arg(i));
        }
        const QJsonObject object = value.toObject();

        const QJsonValue name = object.value(NAME_KEY);
        if (!name.isString() || name.toString().trimmed().isEmpty()) {
            return fail(QObject::tr("entry %1 has no name").arg(i));
        }
        const QJsonValue due = object.value(DUE_KEY);
        if (!due.isString()) {
            return fail(QObject::tr("entry %1 has no due date").arg(i));
        }
        const QDateTime dueDate = parseDateTime(due.toString());
        if (!dueDate.isValid()) {
            return fail(QObject::tr("entry %1 has an invalid due date '%2'").arg(i).arg(due.toString()));
        }

        TaskItem task;
        const QJsonValue id = object.value(ID_KEY);
        if (id.isString()) {
            task.id = parseUid(id.toString());
        }
        // Ids must stay unique; a repeated id gets a fresh one.
        if (seenIds.contains(task.id)) {
            task.id = QUuid::createUuid();
        }
        seenIds.insert(task.id);
        task.name = name.toString();
        task.due = dueDate;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

QString FileTaskStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toLocalTime().toString(Qt::ISODate);
}

QDateTime FileTaskStorage::parseDateTime(const QString &value)
{
    QDateTime dt = QDateTime::fromString(value, Qt::ISODate);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    }
    if (!dt.isValid()) {
        return dt;
    }
    return dt.toLocalTime();
}

} // namespace data
} // namespace tasktracker
