#include "snowflake/clock.hpp"

#include "utils/time_format.hpp"

namespace flakeid {
int64_t SystemClock::nowMillis() const
{
    return utils::currentUnixMillis();
}
} // namespace flakeid
