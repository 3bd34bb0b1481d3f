#pragma once

#include <QString>

class QCommandLineParser;
class QSettings;

namespace tasktracker {
namespace cli {

struct AppConfig
{
    QString dataFile;
    bool saveOnExit = true;
    bool verbose = false;
};

void addAppOptions(QCommandLineParser &parser);

// Command line first, then the "storage/dataFile" setting, then the
// platform data directory.
AppConfig resolveAppConfig(const QCommandLineParser &parser, const QSettings &settings);

QString defaultDataFile();

void applyLogging(const AppConfig &config);

} // namespace cli
} // namespace tasktracker
