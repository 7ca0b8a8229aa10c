#include "testing_utils.hpp"

#include <chrono>
#include <random>

namespace flakeid::tests {
int64_t getRandomInt(int64_t min, int64_t max)
{
    // Для каждого потока создаем свой экземпляр генератора
    thread_local std::mt19937_64 rng(std::chrono::system_clock::now().time_since_epoch().count());
    std::uniform_int_distribution<int64_t> dist(min, max);
    return dist(rng);
}

ManualClock::ManualClock(int64_t startMillis)
    : reads_(0)
    , current_(startMillis)
{
}

int64_t ManualClock::nowMillis() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    reads_++;
    if (!script_.empty()) {
        const auto value = script_.front();
        script_.pop_front();
        return value;
    }
    return current_;
}

void ManualClock::set(int64_t millis)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = millis;
}

void ManualClock::advance(int64_t millis)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_ += millis;
}

void ManualClock::script(std::initializer_list<int64_t> readings)
{
    std::lock_guard<std::mutex> lock(mutex_);
    script_.insert(script_.end(), readings.begin(), readings.end());
}

size_t ManualClock::readCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reads_;
}

LogCapture::LogCapture(utils::LogLevel minLevel)
{
    auto &logger = utils::Logger::getInstance();
    logger.setSink([this](utils::LogLevel level, const std::string &message) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.emplace_back(level, message);
    });
    logger.enable(false, std::nullopt, minLevel, false);
}

LogCapture::~LogCapture()
{
    auto &logger = utils::Logger::getInstance();
    logger.disable();
    logger.setSink(nullptr);
}

std::vector<std::pair<utils::LogLevel, std::string>>
LogCapture::find(const std::string &needle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<utils::LogLevel, std::string>> result;
    for (const auto &record : records_) {
        if (record.second.find(needle) != std::string::npos) {
            result.push_back(record);
        }
    }
    return result;
}
} // namespace flakeid::tests
