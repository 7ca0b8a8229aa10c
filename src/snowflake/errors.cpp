#include "snowflake/errors.hpp"

#include "snowflake/codec.hpp"

namespace flakeid {
SnowflakeError::SnowflakeError(const std::string &message)
    : std::runtime_error(message)
{
}

ClockRegressionError::ClockRegressionError(int64_t lastTimestamp, int64_t observedTimestamp)
    : SnowflakeError("Часы сдвинулись назад: последняя метка " + std::to_string(lastTimestamp)
                     + " мс, текущая " + std::to_string(observedTimestamp) + " мс (разница "
                     + std::to_string(static_cast<uint64_t>(lastTimestamp)
                                      - static_cast<uint64_t>(observedTimestamp))
                     + " мс)")
    , lastTimestamp_(lastTimestamp)
    , observedTimestamp_(observedTimestamp)
{
}

InvalidWorkerIdError::InvalidWorkerIdError(int64_t workerId)
    : SnowflakeError("Некорректный идентификатор воркера " + std::to_string(workerId)
                     + ": допустимый диапазон [0, " + std::to_string(MAX_WORKER_ID) + "]")
    , workerId_(workerId)
{
}

TimestampBeforeEpochError::TimestampBeforeEpochError(int64_t timestamp, int64_t epoch)
    : SnowflakeError("Временная метка " + std::to_string(timestamp) + " мс раньше эпохи "
                     + std::to_string(epoch) + " мс")
    , timestamp_(timestamp)
    , epoch_(epoch)
{
}
} // namespace flakeid
