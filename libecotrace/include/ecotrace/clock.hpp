#pragma once

#include <QDateTime>

namespace ecotrace {

// Source of "now" for windowing and cooldown decisions. Injected so tests
// can drive time explicitly.
class Clock
{
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

} // namespace ecotrace
