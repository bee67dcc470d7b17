#pragma once

#include <QString>

class QCommandLineParser;
class QSettings;

namespace tasktracker {
namespace core {

struct AppConfig
{
    QString tasksFilePath;
    bool verbose = false;

    static void addOptions(QCommandLineParser &parser);

    // --file wins over the "storage/tasksFile" setting, which wins over tasks.json
    // in the working directory.
    static AppConfig fromParser(const QCommandLineParser &parser, const QSettings &settings);
};

} // namespace core
} // namespace tasktracker
