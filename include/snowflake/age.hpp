#pragma once

#include <cstdint>

#include "snowflake/codec.hpp"

namespace flakeid {
/**
 * @enum AgeUnit
 * @brief Единицы измерения возраста идентификатора
 */
enum class AgeUnit {
    SECONDS,
    MINUTES,
    HOURS,
    DAYS,
    WEEKS,
    MONTHS, // 30.44 суток
    YEARS, // 365.25 суток
    DECADES,
};

/**
 * @brief Длительность единицы измерения в миллисекундах
 */
double unitMilliseconds(AgeUnit unit);

/**
 * @brief Возраст идентификатора в указанных единицах
 * @param codec Кодек с эпохой, которой был закодирован идентификатор
 * @param id Идентификатор
 * @param nowMillis Текущее время в миллисекундах с начала эпохи Unix
 * @param unit Единица измерения
 * @return (nowMillis - метка идентификатора) / длительность единицы
 */
double ageIn(const Codec &codec, SnowflakeId id, int64_t nowMillis, AgeUnit unit);
} // namespace flakeid
