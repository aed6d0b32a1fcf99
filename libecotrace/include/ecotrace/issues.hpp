#pragma once

#include <QJsonArray>
#include <QString>
#include <vector>

#include "ecotrace/visit.hpp"

namespace ecotrace {

// Page-level optimisation hints derived from a visit's own numbers.
struct PageIssue
{
    QString code;
    double  severity = 0.0;   // 0..1, higher is worse
    QString message;
};

std::vector<PageIssue> detectIssues(const VisitRecord &record);

QJsonArray issuesToJson(const std::vector<PageIssue> &issues);

} // namespace ecotrace
