#include "ecotrace/clock.hpp"

#include "ecotrace/common.hpp"

namespace ecotrace {

QDateTime SystemClock::now() const
{
    return nowUtc();
}

} // namespace ecotrace
