#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "tasktracker/cli/AppConfig.hpp"
#include "tasktracker/cli/ConsoleOutputHandler.hpp"
#include "tasktracker/core/OutputHandler.hpp"
#include "tasktracker/core/Session.hpp"
#include "tasktracker/data/FileTaskStorage.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("Task Tracker"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskTrackerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Keeps a list of todos, deadlines and events."));
    parser.addHelpOption();
    parser.addVersionOption();
    tasktracker::cli::addAppOptions(parser);
    parser.process(app);

    const QSettings settings;
    const auto config = tasktracker::cli::resolveAppConfig(parser, settings);
    tasktracker::cli::applyLogging(config);

    tasktracker::data::FileTaskStorage storage(config.dataFile);
    tasktracker::cli::ConsoleOutputHandler output;
    tasktracker::core::Session session(storage, output);
    session.start();

    const QString divider(tasktracker::core::DividerWidth, QLatin1Char('_'));
    output.print(divider);
    output.print(QObject::tr("Hello! I'm %1").arg(QCoreApplication::applicationName()));
    output.print(QObject::tr("What can I do for you?"));
    output.print(divider);

    QTextStream input(stdin, QIODevice::ReadOnly);
    input.setCodec("UTF-8");
    QString line;
    while (input.readLineInto(&line)) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (!session.handleLine(line)) {
            break;
        }
    }

    if (config.saveOnExit && !session.finish()) {
        return 1;
    }
    return 0;
}
