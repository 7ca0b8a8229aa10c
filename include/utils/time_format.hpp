#pragma once

#include <cstdint>
#include <string>

namespace flakeid::utils {
/**
 * @brief Текущее время системных часов в миллисекундах с начала эпохи Unix
 */
int64_t currentUnixMillis();

/**
 * @brief Форматирует временную метку в UTC
 * @param unixMillis Миллисекунды с начала эпохи Unix (допускаются отрицательные значения)
 * @return Строка вида "YYYY-MM-DD HH:MM:SS.mmm UTC" или пустая строка, если
 * платформа не смогла преобразовать время
 */
std::string formatTimestampUtc(int64_t unixMillis);

/**
 * @brief Форматирует временную метку в локальном часовом поясе
 * @param unixMillis Миллисекунды с начала эпохи Unix
 * @return Строка вида "YYYY-MM-DD HH:MM:SS.mmm" или пустая строка при ошибке
 */
std::string formatTimestampLocal(int64_t unixMillis);
} // namespace flakeid::utils
