#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>
#include <utility>

#include "version.h"

#include "tasktracker/core/AppConfig.hpp"
#include "tasktracker/core/AppContext.hpp"
#include "tasktracker/ui/ConsoleMenu.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("TaskTracker"));
    QCoreApplication::setApplicationName(QStringLiteral("tasktracker"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskTrackerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Track tasks by due date."));
    parser.addHelpOption();
    parser.addVersionOption();
    tasktracker::core::AppConfig::addOptions(parser);
    parser.process(app);

    const QSettings settings;
    auto config = tasktracker::core::AppConfig::fromParser(parser, settings);
    if (config.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("tasktracker.*.debug=true"));
    }

    tasktracker::core::AppContext context(std::move(config));
    if (context.load() != tasktracker::data::StorageError::NoError) {
        QTextStream err(stderr);
        err << QObject::tr("Could not load tasks: %1").arg(context.errorString()) << '\n';
        return 1;
    }

    QTextStream in(stdin);
    QTextStream out(stdout);
    in.setCodec("UTF-8");
    out.setCodec("UTF-8");

    tasktracker::ui::ConsoleMenu menu(context.taskStore(), in, out);
    return menu.run();
}
