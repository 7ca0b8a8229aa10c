#include "snowflake/generator.hpp"

#include <thread>

#include "utils/logger.hpp"

namespace {
// Количество чтений часов подряд, после которого ожидание уступает процессор
constexpr int SPINS_BEFORE_YIELD = 64;

int64_t checkedWorkerId(int64_t workerId)
{
    if (workerId < 0 || workerId > flakeid::MAX_WORKER_ID) {
        LOG_ERROR << "Отклонён идентификатор воркера " << workerId;
        throw flakeid::InvalidWorkerIdError(workerId);
    }
    return workerId;
}
} // namespace

namespace flakeid {
Generator::Generator(GeneratorOptions options)
    : clock_(options.clock ? std::move(options.clock) : std::make_shared<SystemClock>())
    , workerId_(checkedWorkerId(options.workerId))
    , epoch_(options.epoch)
    , lastTimestamp_(std::nullopt)
    , sequence_(0)
    , debug_(options.debug)
{
    LOG_DEBUG << "Генератор создан (воркер: " << workerId_ << ", эпоха: " << epoch_ << ")";
}

/**
 * Порядок выдачи:
 *  - часы раньше последней метки — ClockRegressionError без изменения состояния;
 *  - та же миллисекунда — порядковый номер увеличивается по модулю 4096, при
 *    переполнении ждём следующую миллисекунду и выдаём в ней номер 0;
 *  - новая миллисекунда — номер сбрасывается в 0.
 */
SnowflakeId Generator::newId()
{
    // Логирование и исключения только без захваченного мьютекса
    std::unique_lock<std::mutex> lock(mutex_);

    auto now = clock_->nowMillis();
    int64_t sequence = 0;
    std::optional<int64_t> exhaustedMillis;

    if (lastTimestamp_.has_value()) {
        const auto last = *lastTimestamp_;
        if (now < last) {
            lock.unlock();
            LOG_ERROR << "Обнаружен сдвиг часов назад на "
                      << (static_cast<uint64_t>(last) - static_cast<uint64_t>(now)) << " мс";
            throw ClockRegressionError(last, now);
        }

        if (now == last) {
            sequence = (sequence_ + 1) & MAX_SEQUENCE;
            if (sequence == 0) {
                exhaustedMillis = last;
                now = waitNextMillis(last);
            }
        }
    }

    const auto epoch = epoch_;
    if (now < epoch) {
        lock.unlock();
        LOG_ERROR << "Текущее время " << now << " мс раньше эпохи " << epoch << " мс";
        throw TimestampBeforeEpochError(now, epoch);
    }

    lastTimestamp_ = now;
    sequence_ = sequence;
    const auto id = Codec(epoch).encode(now, workerId_, sequence);
    lock.unlock();

    if (exhaustedMillis.has_value()) {
        LOG_TRACE << "Исчерпаны порядковые номера в миллисекунде " << *exhaustedMillis
                  << ", выдана метка " << now;
    }
    return id;
}

std::string Generator::newIdString()
{
    return toString(newId());
}

int64_t Generator::waitNextMillis(int64_t lastTimestamp) const
{
    int spins = 0;
    auto now = clock_->nowMillis();
    while (now <= lastTimestamp) {
        if (spins < SPINS_BEFORE_YIELD) {
            spins++;
        }
        else {
            std::this_thread::yield();
        }
        now = clock_->nowMillis();
    }
    return now;
}

ParsedId Generator::parse(SnowflakeId id) const
{
    bool debug;
    Codec snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        debug = debug_;
        snapshot = Codec(epoch_);
    }

    auto parsed = snapshot.parse(id);
    if (debug) {
        LOG_INFO << "Snowflake " << parsed.id << ": " << parsed.humanTimestamp
                 << " (воркер: " << parsed.workerId << ", номер: " << parsed.sequence << ")";
    }
    return parsed;
}

ValidationResult Generator::validate(SnowflakeId id) const
{
    return codec().validate(id);
}

ValidationResult Generator::validate(std::string_view text) const
{
    return codec().validate(text);
}

int Generator::compare(SnowflakeId a, SnowflakeId b) const
{
    return codec().compare(a, b);
}

bool Generator::isNewer(SnowflakeId a, SnowflakeId b) const
{
    return codec().isNewer(a, b);
}

void Generator::setWorkerId(int64_t workerId)
{
    checkedWorkerId(workerId);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workerId_ = workerId;
    }
    LOG_INFO << "Идентификатор воркера изменён на " << workerId;
}

int64_t Generator::getWorkerId() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return workerId_;
}

void Generator::setEpoch(int64_t epoch)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch_ = epoch;
    }
    LOG_INFO << "Эпоха изменена на " << epoch << " мс";
}

int64_t Generator::getEpoch() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

void Generator::setDebug(bool debug)
{
    std::lock_guard<std::mutex> lock(mutex_);
    debug_ = debug;
}

bool Generator::isDebug() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return debug_;
}

Codec Generator::codec() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return Codec(epoch_);
}

double Generator::ageIn(SnowflakeId id, AgeUnit unit) const
{
    return flakeid::ageIn(codec(), id, clock_->nowMillis(), unit);
}

double Generator::ageInSeconds(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::SECONDS);
}

double Generator::ageInMinutes(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::MINUTES);
}

double Generator::ageInHours(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::HOURS);
}

double Generator::ageInDays(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::DAYS);
}

double Generator::ageInWeeks(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::WEEKS);
}

double Generator::ageInMonths(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::MONTHS);
}

double Generator::ageInYears(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::YEARS);
}

double Generator::ageInDecades(SnowflakeId id) const
{
    return ageIn(id, AgeUnit::DECADES);
}
} // namespace flakeid
