#include "tasktracker/core/AppConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QObject>
#include <QSettings>
#include <QStringList>

namespace tasktracker {
namespace core {

namespace {
constexpr auto FILE_OPTION = "file";
constexpr auto VERBOSE_OPTION = "verbose";
constexpr auto TASKS_FILE_KEY = "storage/tasksFile";
constexpr auto DEFAULT_TASKS_FILE = "tasks.json";
} // namespace

void AppConfig::addOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(QStringList{ QStringLiteral("f"), QLatin1String(FILE_OPTION) },
                                        QObject::tr("Task file to load and save."),
                                        QObject::tr("path")));
    parser.addOption(QCommandLineOption(QStringList{ QStringLiteral("v"), QLatin1String(VERBOSE_OPTION) },
                                        QObject::tr("Print debug logging to stderr.")));
}

AppConfig AppConfig::fromParser(const QCommandLineParser &parser, const QSettings &settings)
{
    AppConfig config;
    config.verbose = parser.isSet(QLatin1String(VERBOSE_OPTION));

    if (parser.isSet(QLatin1String(FILE_OPTION))) {
        config.tasksFilePath = parser.value(QLatin1String(FILE_OPTION));
    } else {
        config.tasksFilePath = settings.value(QLatin1String(TASKS_FILE_KEY)).toString();
    }
    if (config.tasksFilePath.trimmed().isEmpty()) {
        config.tasksFilePath = QLatin1String(DEFAULT_TASKS_FILE);
    }
    return config;
}

} // namespace core
} // namespace tasktracker
