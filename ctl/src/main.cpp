#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QDebug>

#include "ecotrace/ipc_client.hpp"
#include "ecotrace/snapshot_json.hpp"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QString formatKB(qint64 bytes)
{
    return QString::number(static_cast<double>(bytes) / 1024.0, 'f', 1);
}

int intArgument(const QStringList &args, int index, int fallback)
{
    if (args.size() <= index) {
        return fallback;
    }
    bool ok = false;
    const int v = args.at(index).toInt(&ok);
    return ok ? v : fallback;
}

int printSummary(ecotrace::IpcClient &client)
{
    const auto totals = client.getTotals();
    if (!totals) {
        qCritical() << "ecotrace-ctl:" << client.lastError();
        return 1;
    }
    out() << "Visits: " << totals->visitCount << "\n"
          << "Data:   " << formatKB(totals->totalBytes) << " KB\n"
          << "CO2:    " << QString::number(totals->totalCO2_g, 'f', 3) << " g\n";
    return 0;
}

int printDays(ecotrace::IpcClient &client, int days)
{
    const auto series = client.getDaySeries(days);
    if (series.empty() && !client.lastError().isEmpty()) {
        qCritical() << "ecotrace-ctl:" << client.lastError();
        return 1;
    }
    for (const auto &point : series) {
        out() << point.day.toString(Qt::ISODate) << "  "
              << QString::number(point.co2_g, 'f', 4) << " g\n";
    }
    return 0;
}

int printTop(ecotrace::IpcClient &client, int topK)
{
    const auto origins = client.getTopOrigins(topK);
    if (origins.empty() && !client.lastError().isEmpty()) {
        qCritical() << "ecotrace-ctl:" << client.lastError();
        return 1;
    }
    for (const auto &entry : origins) {
        out() << entry.origin << "  " << formatKB(entry.totals.totalBytes) << " KB  "
              << QString::number(entry.totals.totalCO2_g, 'f', 4) << " g  "
              << entry.totals.visitCount << " visits\n";
    }
    return 0;
}

int importFile(ecotrace::IpcClient &client, const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qCritical() << "ecotrace-ctl: cannot open" << path;
        return 1;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll());
    if (!doc.isArray()) {
        qCritical() << "ecotrace-ctl:" << path << "is not a JSON array of visits";
        return 1;
    }

    const auto summary = client.importVisits(ecotrace::visitsFromJson(doc.array()));
    if (!summary) {
        qCritical() << "ecotrace-ctl:" << client.lastError();
        return 1;
    }
    out() << "accepted " << summary->accepted
          << ", duplicates " << summary->duplicates
          << ", invalid " << summary->invalid << "\n";
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ecotrace-ctl"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Query and feed the EcoTrace daemon"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("summary | days [N] | top [K] | visits | "
                                                "import FILE | state ORIGIN | watch"));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    ecotrace::IpcClient client;
    if (!client.connectToDaemon()) {
        qCritical() << "ecotrace-ctl: daemon not reachable:" << client.lastError();
        return 1;
    }

    const QString command = args.first();

    if (command == QLatin1String("summary")) {
        return printSummary(client);
    }
    if (command == QLatin1String("days")) {
        return printDays(client, intArgument(args, 1, 7));
    }
    if (command == QLatin1String("top")) {
        return printTop(client, intArgument(args, 1, 10));
    }
    if (command == QLatin1String("visits")) {
        const auto visits = client.getVisits();
        out() << QJsonDocument(ecotrace::visitsToJson(visits)).toJson(QJsonDocument::Indented);
        return 0;
    }
    if (command == QLatin1String("import") && args.size() > 1) {
        return importFile(client, args.at(1));
    }
    if (command == QLatin1String("state") && args.size() > 1) {
        const QString json = client.getAlertStateJson(args.at(1));
        if (json.isEmpty()) {
            qCritical() << "ecotrace-ctl:" << client.lastError();
            return 1;
        }
        out() << json << "\n";
        return 0;
    }
    if (command == QLatin1String("watch")) {
        // Console notifier: one line per alert until interrupted.
        QObject::connect(&client, &ecotrace::IpcClient::alertReceived,
                         [](const ecotrace::AlertEvent &event) {
                             out() << event.firedAt.toString(Qt::ISODate)
                                   << "  High CO2 on " << event.origin << ": "
                                   << QString::number(event.windowSum_g, 'f', 2)
                                   << " g in last " << event.windowMinutes << " min\n";
                             out().flush();
                         });
        QObject::connect(&client, &ecotrace::IpcClient::connectionChanged,
                         &app, [](bool connected) {
                             if (!connected) {
                                 qWarning() << "ecotrace-ctl: lost connection to daemon";
                             }
                         });
        return app.exec();
    }

    parser.showHelp(1);
}
