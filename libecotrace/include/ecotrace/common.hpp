#pragma once

#include <QDate>
#include <QDateTime>

namespace ecotrace {

// Current wall-clock instant in UTC.
QDateTime nowUtc();

// UTC calendar date of an instant (the day bucket key).
QDate utcDay(const QDateTime &ts);

} // namespace ecotrace
