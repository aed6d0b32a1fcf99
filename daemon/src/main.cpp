#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include <memory>

#include "ecotrace_daemon.hpp"

#include "ecotrace/settings.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ecotrace-daemon"));
    app.setOrganizationName(QStringLiteral("ecotrace"));

    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-ddThh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}"
        "%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} %{message}"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("EcoTrace page-visit telemetry daemon"));
    parser.addHelpOption();

    QCommandLineOption configOption(QStringLiteral("config"),
                                    QStringLiteral("Settings file (INI)."),
                                    QStringLiteral("path"));
    QCommandLineOption dbOption(QStringLiteral("db"),
                                QStringLiteral("SQLite visit store."),
                                QStringLiteral("path"));
    QCommandLineOption noPersistOption(QStringLiteral("no-persist"),
                                       QStringLiteral("Keep visits in memory only."));
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOption(noPersistOption);
    parser.process(app);

    std::unique_ptr<QSettings> config;
    if (parser.isSet(configOption)) {
        config = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        config = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope,
                                             QStringLiteral("ecotrace"),
                                             QStringLiteral("ecotrace"));
    }
    const ecotrace::Settings settings = ecotrace::loadSettings(*config);
    qInfo() << "EcoTrace daemon starting, settings:" << config->fileName();

    QString dbPath;
    if (!parser.isSet(noPersistOption)) {
        if (parser.isSet(dbOption)) {
            dbPath = parser.value(dbOption);
        } else {
            const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
            QDir().mkpath(dataDir);
            dbPath = dataDir + QStringLiteral("/visits.db");
        }
        QDir().mkpath(QFileInfo(dbPath).absolutePath());
        qInfo() << "EcoTrace daemon DB path:" << dbPath;
    }

    ecotrace::EcoTraceDaemon daemon(settings, dbPath, config.get());
    if (!daemon.init()) {
        qCritical() << "Failed to initialize EcoTraceDaemon";
        return 1;
    }

    if (!daemon.registerOnBus()) {
        return 1;
    }

    qInfo() << "EcoTrace daemon initialized and D-Bus service registered";
    return app.exec();
}
