#pragma once

#include <cstdint>

namespace flakeid {
/**
 * @class Clock
 * @brief Источник времени для генератора идентификаторов.
 *
 * Контракт: nowMillis() возвращает миллисекунды с начала эпохи Unix. Значение может
 * уменьшаться (например, при коррекции NTP), генератор обрабатывает это сам.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Текущее время в миллисекундах с начала эпохи Unix
     */
    virtual int64_t nowMillis() const = 0;

    Clock(const Clock &) = delete;
    Clock &operator=(const Clock &) = delete;

protected:
    Clock() = default;
};

/**
 * @class SystemClock
 * @brief Системные часы реального времени (std::chrono::system_clock)
 */
class SystemClock : public Clock {
public:
    SystemClock() = default;

    int64_t nowMillis() const override;
};
} // namespace flakeid
