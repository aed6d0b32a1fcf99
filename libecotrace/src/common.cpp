#include "ecotrace/common.hpp"

#include <QTimeZone>

namespace ecotrace {

QDateTime nowUtc()
{
    return QDateTime::currentDateTimeUtc();
}

QDate utcDay(const QDateTime &ts)
{
    return ts.toTimeZone(QTimeZone::utc()).date();
}

} // namespace ecotrace
