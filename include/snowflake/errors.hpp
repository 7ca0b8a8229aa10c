#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace flakeid {
/**
 * @class SnowflakeError
 * @brief Базовый класс ошибок генерации идентификаторов
 */
class SnowflakeError : public std::runtime_error {
public:
    explicit SnowflakeError(const std::string &message);
};

/**
 * @class ClockRegressionError
 * @brief Системные часы вернули время раньше последнего выданного идентификатора.
 *
 * Ошибка фатальна для генератора: повторная попытка не выполняется, решение
 * (остановить процесс, поднять тревогу) принимает вызывающий код.
 */
class ClockRegressionError : public SnowflakeError {
public:
    ClockRegressionError(int64_t lastTimestamp, int64_t observedTimestamp);

    int64_t lastTimestamp() const noexcept
    {
        return lastTimestamp_;
    }

    int64_t observedTimestamp() const noexcept
    {
        return observedTimestamp_;
    }

private:
    int64_t lastTimestamp_;
    int64_t observedTimestamp_;
};

/**
 * @class InvalidWorkerIdError
 * @brief Идентификатор воркера вне диапазона [0, MAX_WORKER_ID]
 */
class InvalidWorkerIdError : public SnowflakeError {
public:
    explicit InvalidWorkerIdError(int64_t workerId);

    int64_t workerId() const noexcept
    {
        return workerId_;
    }

private:
    int64_t workerId_;
};

/**
 * @class TimestampBeforeEpochError
 * @brief Текущее время раньше эпохи генератора, идентификатор получился бы отрицательным
 */
class TimestampBeforeEpochError : public SnowflakeError {
public:
    TimestampBeforeEpochError(int64_t timestamp, int64_t epoch);

    int64_t timestamp() const noexcept
    {
        return timestamp_;
    }

    int64_t epoch() const noexcept
    {
        return epoch_;
    }

private:
    int64_t timestamp_;
    int64_t epoch_;
};
} // namespace flakeid
