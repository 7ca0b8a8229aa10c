#include "snowflake/age.hpp"

#include "utils/compiler.hpp"

namespace {
constexpr double MS_PER_SECOND = 1000.0;
constexpr double MS_PER_MINUTE = 60.0 * MS_PER_SECOND;
constexpr double MS_PER_HOUR = 60.0 * MS_PER_MINUTE;
constexpr double MS_PER_DAY = 24.0 * MS_PER_HOUR;
constexpr double MS_PER_WEEK = 7.0 * MS_PER_DAY;
constexpr double MS_PER_MONTH = 30.44 * MS_PER_DAY;
constexpr double MS_PER_YEAR = 365.25 * MS_PER_DAY;
constexpr double MS_PER_DECADE = 10.0 * MS_PER_YEAR;
} // namespace

namespace flakeid {
double unitMilliseconds(AgeUnit unit)
{
    switch (unit) {
    case AgeUnit::SECONDS:
        return MS_PER_SECOND;
    case AgeUnit::MINUTES:
        return MS_PER_MINUTE;
    case AgeUnit::HOURS:
        return MS_PER_HOUR;
    case AgeUnit::DAYS:
        return MS_PER_DAY;
    case AgeUnit::WEEKS:
        return MS_PER_WEEK;
    case AgeUnit::MONTHS:
        return MS_PER_MONTH;
    case AgeUnit::YEARS:
        return MS_PER_YEAR;
    case AgeUnit::DECADES:
        return MS_PER_DECADE;
    }
    UNREACHABLE("Unsupported AgeUnit");
}

double ageIn(const Codec &codec, SnowflakeId id, int64_t nowMillis, AgeUnit unit)
{
    const auto elapsed = static_cast<int64_t>(static_cast<uint64_t>(nowMillis)
                                              - static_cast<uint64_t>(codec.decode(id).timestamp));
    return static_cast<double>(elapsed) / unitMilliseconds(unit);
}
} // namespace flakeid
