#include "ecotrace/ipc_client.hpp"

#include "ecotrace/snapshot_json.hpp"

#include <QDBusConnection>
#include <QDBusError>
#include <QDBusInterface>
#include <QDBusMessage>
#include <QDBusReply>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace {

// Must match the service/object/interface used in EcoTraceDaemon
constexpr const char *kServiceName  = "org.ecotrace.Daemon";
constexpr const char *kObjectPath   = "/org/ecotrace/Daemon";
constexpr const char *kInterface    = "org.ecotrace.Daemon";
constexpr const char *kAlertSignal  = "AlertFired";
constexpr const char *kVisitSignal  = "VisitAdded";

} // namespace

namespace ecotrace {

IpcClient::IpcClient(QObject *parent)
    : QObject(parent)
{
}

IpcClient::~IpcClient()
{
    delete iface_;
    iface_ = nullptr;
}

void IpcClient::setConnected(bool c)
{
    if (connected_ == c)
        return;
    connected_ = c;
    emit connectionChanged(connected_);
}

bool IpcClient::connectToDaemon()
{
    delete iface_;
    iface_ = nullptr;

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        lastError_ = QStringLiteral("DBus session bus not connected");
        setConnected(false);
        return false;
    }

    iface_ = new QDBusInterface(
        QString::fromUtf8(kServiceName),
        QString::fromUtf8(kObjectPath),
        QString::fromUtf8(kInterface),
        bus,
        this
    );

    if (!iface_->isValid()) {
        lastError_ = QStringLiteral("Failed to create DBus interface: %1")
                         .arg(iface_->lastError().message());
        qWarning() << "IpcClient:" << lastError_;
        delete iface_;
        iface_ = nullptr;
        setConnected(false);
        return false;
    }

    const bool alertsOk = bus.connect(
        QString::fromUtf8(kServiceName),
        QString::fromUtf8(kObjectPath),
        QString::fromUtf8(kInterface),
        QString::fromUtf8(kAlertSignal),
        this,
        SLOT(handleAlertJson(QString))
    );
    const bool visitsOk = bus.connect(
        QString::fromUtf8(kServiceName),
        QString::fromUtf8(kObjectPath),
        QString::fromUtf8(kInterface),
        QString::fromUtf8(kVisitSignal),
        this,
        SLOT(handleVisitJson(QString))
    );

    if (!alertsOk || !visitsOk) {
        // Still usable for pull-based calls.
        qWarning() << "IpcClient: failed to subscribe to daemon signals";
    }

    lastError_.clear();
    setConnected(true);
    return true;
}

bool IpcClient::ensureInterface()
{
    return iface_ || connectToDaemon();
}

std::optional<QString> IpcClient::callForString(const QString &method,
                                                const QList<QVariant> &args)
{
    if (!ensureInterface()) {
        return std::nullopt;
    }

    QDBusReply<QString> reply = iface_->callWithArgumentList(QDBus::Block, method, args);
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient:" << method << "failed:" << lastError_;
        setConnected(false);
        return std::nullopt;
    }

    lastError_.clear();
    return reply.value();
}

std::optional<IngestResult> IpcClient::ingest(const VisitRecord &record)
{
    const auto reply = callForString(QStringLiteral("Ingest"),
                                     {visitToJsonString(record)});
    if (!reply) {
        return std::nullopt;
    }
    if (*reply == QLatin1String("accepted"))
        return IngestResult::Accepted;
    if (*reply == QLatin1String("duplicate"))
        return IngestResult::Duplicate;
    return IngestResult::Invalid;
}

std::optional<BulkLoadSummary> IpcClient::importVisits(const std::vector<VisitRecord> &records)
{
    QJsonArray arr;
    for (const auto &record : records) {
        arr.append(visitToJson(record));
    }

    const auto reply = callForString(QStringLiteral("Import"), {toCompactString(arr)});
    if (!reply) {
        return std::nullopt;
    }

    const QJsonObject obj = QJsonDocument::fromJson(reply->toUtf8()).object();
    BulkLoadSummary summary;
    summary.accepted   = obj.value(QStringLiteral("accepted")).toInt();
    summary.duplicates = obj.value(QStringLiteral("duplicates")).toInt();
    summary.invalid    = obj.value(QStringLiteral("invalid")).toInt();
    return summary;
}

bool IpcClient::reportActivity(const QString &origin, bool active)
{
    if (!ensureInterface()) {
        return false;
    }

    const QDBusMessage reply = iface_->call(QStringLiteral("ReportActivity"), origin, active);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        lastError_ = reply.errorMessage();
        qWarning() << "IpcClient: ReportActivity failed:" << lastError_;
        return false;
    }
    return true;
}

std::vector<VisitRecord> IpcClient::getVisits()
{
    const auto reply = callForString(QStringLiteral("GetVisits"), {});
    if (!reply) {
        return {};
    }

    QJsonDocument doc = QJsonDocument::fromJson(reply->toUtf8());
    if (!doc.isArray()) {
        lastError_ = QStringLiteral("GetVisits returned non-array JSON");
        qWarning() << "IpcClient:" << lastError_;
        return {};
    }
    return visitsFromJson(doc.array());
}

std::vector<DayPoint> IpcClient::getDaySeries(int days)
{
    const auto reply = callForString(QStringLiteral("GetDaySeries"), {days});
    if (!reply) {
        return {};
    }
    return daySeriesFromJson(QJsonDocument::fromJson(reply->toUtf8()).array());
}

std::vector<OriginAggregate> IpcClient::getTopOrigins(int topK)
{
    const auto reply = callForString(QStringLiteral("GetTopOrigins"), {topK});
    if (!reply) {
        return {};
    }
    return originsFromJson(QJsonDocument::fromJson(reply->toUtf8()).array());
}

std::optional<AggregateTotals> IpcClient::getTotals()
{
    const auto reply = callForString(QStringLiteral("GetTotals"), {});
    if (!reply) {
        return std::nullopt;
    }
    return totalsFromJson(QJsonDocument::fromJson(reply->toUtf8()).object());
}

QString IpcClient::getAlertStateJson(const QString &origin)
{
    return callForString(QStringLiteral("GetAlertState"), {origin}).value_or(QString());
}

void IpcClient::handleAlertJson(const QString &json)
{
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject())
        return;

    emit alertReceived(alertEventFromJson(doc.object()));
}

void IpcClient::handleVisitJson(const QString &json)
{
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject())
        return;

    emit visitReceived(visitFromJson(doc.object()));
}

} // namespace ecotrace
