#include "tasktracker/cli/AppConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QLoggingCategory>
#include <QObject>
#include <QSettings>
#include <QStandardPaths>

namespace tasktracker {
namespace cli {

namespace {
const QString DataFileOption = QStringLiteral("data-file");
const QString NoSaveOption = QStringLiteral("no-save");
const QString VerboseOption = QStringLiteral("verbose");
const QString DataFileSetting = QStringLiteral("storage/dataFile");
} // namespace

void addAppOptions(QCommandLineParser &parser)
{
    parser.addOption(QCommandLineOption(DataFileOption,
                                        QObject::tr("Read and write tasks from <file>."),
                                        QObject::tr("file")));
    parser.addOption(QCommandLineOption(NoSaveOption, QObject::tr("Do not save tasks on exit.")));
    parser.addOption(QCommandLineOption(VerboseOption, QObject::tr("Print debug logging to stderr.")));
}

AppConfig resolveAppConfig(const QCommandLineParser &parser, const QSettings &settings)
{
    AppConfig config;
    if (parser.isSet(DataFileOption)) {
        config.dataFile = parser.value(DataFileOption);
    } else {
        config.dataFile = settings.value(DataFileSetting).toString();
    }
    if (config.dataFile.isEmpty()) {
        config.dataFile = defaultDataFile();
    }
    config.saveOnExit = !parser.isSet(NoSaveOption);
    config.verbose = parser.isSet(VerboseOption);
    return config;
}

QString defaultDataFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/task-tracker");
    }
    return QDir(storageFolder).filePath(QStringLiteral("tasks.ics"));
}

void applyLogging(const AppConfig &config)
{
    if (config.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("tasktracker.*.debug=true"));
    }
}

} // namespace cli
} // namespace tasktracker
