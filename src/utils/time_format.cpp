#include "utils/time_format.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
constexpr int64_t MILLIS_PER_SECOND = 1000;

// Разбивает миллисекунды на секунды и остаток с округлением вниз,
// чтобы метки до 1970 года давали неотрицательный остаток
void splitMillis(int64_t unixMillis, std::time_t &seconds, int &millis)
{
    int64_t whole = unixMillis / MILLIS_PER_SECOND;
    int64_t rest = unixMillis % MILLIS_PER_SECOND;
    if (rest < 0) {
        rest += MILLIS_PER_SECOND;
        whole -= 1;
    }
    seconds = static_cast<std::time_t>(whole);
    millis = static_cast<int>(rest);
}

bool toCalendar(std::time_t seconds, bool utc, std::tm &out)
{
#if defined(FLAKEID_PLATFORM_WINDOWS)
    return (utc ? gmtime_s(&out, &seconds) : localtime_s(&out, &seconds)) == 0;
#else
    return (utc ? gmtime_r(&seconds, &out) : localtime_r(&seconds, &out)) != nullptr;
#endif
}

std::string format(int64_t unixMillis, bool utc)
{
    std::time_t seconds;
    int millis;
    splitMillis(unixMillis, seconds, millis);

    std::tm calendar{};
    if (!toCalendar(seconds, utc, calendar)) {
        return {};
    }

    std::ostringstream oss;
    oss << std::put_time(&calendar, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis;
    if (utc) {
        oss << " UTC";
    }
    return oss.str();
}
} // namespace

namespace flakeid::utils {
int64_t currentUnixMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string formatTimestampUtc(int64_t unixMillis)
{
    return format(unixMillis, true);
}

std::string formatTimestampLocal(int64_t unixMillis)
{
    return format(unixMillis, false);
}
} // namespace flakeid::utils
