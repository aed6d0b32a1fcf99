#include "ecotrace/issues.hpp"

#include <QJsonObject>

namespace ecotrace {

namespace {
constexpr qint64 kHeavyPageBytes   = 5000000;
constexpr int    kManyResources    = 150;
constexpr int    kManyLongTasks    = 3;
} // namespace

std::vector<PageIssue> detectIssues(const VisitRecord &record)
{
    std::vector<PageIssue> issues;

    if (record.transferBytes > kHeavyPageBytes) {
        issues.push_back({QStringLiteral("page_weight"), 0.8,
                          QStringLiteral("This page is heavy (>5MB). Optimize large images and assets.")});
    }

    if (record.resourceCount > kManyResources) {
        issues.push_back({QStringLiteral("too_many_resources"), 0.6,
                          QStringLiteral("Many resources loaded. Consider reducing third-party scripts or bundling.")});
    }

    if (record.longTasks > kManyLongTasks) {
        issues.push_back({QStringLiteral("long_tasks"), 0.7,
                          QStringLiteral("Long JavaScript tasks detected. Reduce heavy synchronous work.")});
    }

    return issues;
}

QJsonArray issuesToJson(const std::vector<PageIssue> &issues)
{
    QJsonArray arr;
    for (const auto &issue : issues) {
        QJsonObject obj;
        obj.insert(QStringLiteral("code"), issue.code);
        obj.insert(QStringLiteral("severity"), issue.severity);
        obj.insert(QStringLiteral("message"), issue.message);
        arr.append(obj);
    }
    return arr;
}

} // namespace ecotrace
