#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid {
/**
 * @brief Идентификатор snowflake
 *
 * Раскладка битов (от старших к младшим):
 *  - [63]      — знак, всегда 0 у корректных идентификаторов
 *  - [62..17]  — миллисекунды от эпохи генератора
 *  - [16..12]  — идентификатор воркера
 *  - [11..0]   — порядковый номер внутри миллисекунды
 */
using SnowflakeId = int64_t;

static constexpr int WORKER_ID_BITS = 5;
static constexpr int SEQUENCE_BITS = 12;
static constexpr int WORKER_SHIFT = SEQUENCE_BITS;
static constexpr int TIMESTAMP_SHIFT = WORKER_SHIFT + WORKER_ID_BITS;

static constexpr int64_t MAX_WORKER_ID = (int64_t(1) << WORKER_ID_BITS) - 1; // 31
static constexpr int64_t MAX_SEQUENCE = (int64_t(1) << SEQUENCE_BITS) - 1; // 4095

// 2015-01-01T00:00:00Z
static constexpr int64_t DEFAULT_EPOCH = 1420070400000;

/**
 * @struct SnowflakeParts
 * @brief Составные части идентификатора
 */
struct SnowflakeParts {
    int64_t timestamp; // Миллисекунды с начала эпохи Unix
    int64_t workerId;
    int64_t sequence;

    bool operator==(const SnowflakeParts &other) const
    {
        return timestamp == other.timestamp && workerId == other.workerId
            && sequence == other.sequence;
    }
};

class Codec;

/**
 * @struct ParsedId
 * @brief Результат разбора идентификатора вместе с человекочитаемой датой
 */
struct ParsedId {
    SnowflakeId id;
    int64_t timestamp;
    std::string humanTimestamp; // UTC, "YYYY-MM-DD HH:MM:SS.mmm UTC"
    int64_t workerId;
    int64_t sequence;

    /**
     * @brief Сериализует результат разбора в JSON
     *
     * Идентификатор записывается строкой, чтобы не терять точность у потребителей,
     * хранящих числа в double.
     */
    std::string toJson() const;

    /**
     * @brief Десериализует результат разбора из JSON с эпохой по умолчанию
     * @param jsonStr JSON-строка в формате toJson()
     * @return ParsedId или std::nullopt при ошибке формата
     */
    static std::optional<ParsedId> fromJson(const std::string &jsonStr);

    /**
     * @brief Десериализует результат разбора из JSON
     *
     * Поля timestamp, workerId, sequence и (если есть) humanTimestamp сверяются
     * с разбором id относительно эпохи кодека.
     *
     * @param jsonStr JSON-строка в формате toJson()
     * @param codec Кодек с эпохой, которой был закодирован идентификатор
     * @return ParsedId или std::nullopt при ошибке формата либо расхождении полей
     */
    static std::optional<ParsedId> fromJson(const std::string &jsonStr, const Codec &codec);
};

/**
 * @struct ValidationResult
 * @brief Результат проверки идентификатора. Не является ошибкой, а возвращается вызывающему.
 */
struct ValidationResult {
    bool valid;
    std::string reason;
};

/**
 * @class Codec
 * @brief Кодирование и разбор идентификаторов относительно фиксированной эпохи.
 *
 * Все методы чистые и не требуют синхронизации. Идентификаторы, закодированные
 * с другой эпохой, разбираются некорректно: согласованность эпохи — забота
 * вызывающего кода.
 */
class Codec {
public:
    /**
     * @brief Конструктор кодека
     * @param epoch Эпоха в миллисекундах с начала эпохи Unix
     */
    explicit Codec(int64_t epoch = DEFAULT_EPOCH) noexcept;

    /**
     * @brief Геттер для эпохи кодека
     */
    int64_t epoch() const noexcept
    {
        return epoch_;
    }

    /**
     * @brief Собирает идентификатор из частей
     * @param timestamp Миллисекунды с начала эпохи Unix, не меньше epoch()
     * @param workerId Идентификатор воркера в диапазоне [0, MAX_WORKER_ID]
     * @param sequence Порядковый номер в диапазоне [0, MAX_SEQUENCE]
     * @return Идентификатор
     * @note Диапазоны не проверяются, за них отвечает вызывающий код
     */
    SnowflakeId encode(int64_t timestamp, int64_t workerId, int64_t sequence) const;

    /**
     * @brief Раскладывает идентификатор на части
     *
     * Определена для любого значения SnowflakeId; для значений, не полученных
     * через encode(), результат бессмысленен, но не является ошибкой.
     */
    SnowflakeParts decode(SnowflakeId id) const;

    /**
     * @brief Раскладывает идентификатор на части и форматирует временную метку
     */
    ParsedId parse(SnowflakeId id) const;

    /**
     * @brief Проверяет идентификатор
     * @return {true, "Valid snowflake"} или {false, причина}
     */
    ValidationResult validate(SnowflakeId id) const;

    /**
     * @brief Проверяет идентификатор, записанный десятичной строкой
     *
     * Строка должна состоять только из цифр и помещаться в SnowflakeId.
     */
    ValidationResult validate(std::string_view text) const;

    /**
     * @brief Проверяет диапазоны полей уже разобранного идентификатора
     */
    ValidationResult validateParts(const SnowflakeParts &parts) const;

    /**
     * @brief Сравнивает идентификаторы только по временной метке
     * @return -1, если a раньше b; 1, если позже; 0 для одной и той же миллисекунды
     */
    int compare(SnowflakeId a, SnowflakeId b) const;

    /**
     * @brief Проверяет, что a создан в более поздней миллисекунде, чем b
     */
    bool isNewer(SnowflakeId a, SnowflakeId b) const;

private:
    int64_t epoch_;
};

/**
 * @brief Десятичное представление идентификатора
 */
std::string toString(SnowflakeId id);

/**
 * @brief Разбирает десятичное представление идентификатора
 * @return Идентификатор или std::nullopt, если строка не является неотрицательным числом
 * в диапазоне SnowflakeId
 */
std::optional<SnowflakeId> fromString(std::string_view text);
} // namespace flakeid
