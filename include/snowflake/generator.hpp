#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "snowflake/age.hpp"
#include "snowflake/clock.hpp"
#include "snowflake/codec.hpp"
#include "snowflake/errors.hpp"

namespace flakeid {
/**
 * @struct GeneratorOptions
 * @brief Начальная конфигурация генератора
 */
struct GeneratorOptions {
    int64_t workerId = 0; // [0, MAX_WORKER_ID]
    int64_t epoch = DEFAULT_EPOCH; // Миллисекунды с начала эпохи Unix
    std::shared_ptr<Clock> clock; // Если не задан, используется SystemClock
    bool debug = false; // Логировать результат parse()
};

/**
 * @class Generator
 * @brief Генерирует монотонно возрастающие идентификаторы snowflake.
 *
 * Идентификатор состоит из метки времени в миллисекундах (относительно эпохи),
 * идентификатора воркера и порядкового номера внутри миллисекунды. Уникальность
 * между процессами обеспечивается только различными идентификаторами воркеров.
 *
 * Все методы потокобезопасны: состояние генератора защищено одним мьютексом,
 * который удерживается в том числе во время ожидания следующей миллисекунды.
 */
class Generator {
public:
    /**
     * @brief Конструктор генератора
     * @param options Начальная конфигурация
     * @throws InvalidWorkerIdError если workerId вне диапазона [0, MAX_WORKER_ID]
     */
    explicit Generator(GeneratorOptions options = {});

    // Запрещаем копирование и перемещение
    Generator(const Generator &) = delete;
    Generator &operator=(const Generator &) = delete;
    Generator(Generator &&) = delete;
    Generator &operator=(Generator &&) = delete;

    /**
     * @brief Выдаёт новый идентификатор
     *
     * Если в текущей миллисекунде исчерпаны все порядковые номера, блокирует
     * вызывающий поток до наступления следующей миллисекунды.
     *
     * @return Новый идентификатор
     * @throws ClockRegressionError если часы показывают время раньше последнего
     * выданного идентификатора; состояние генератора при этом не меняется
     * @throws TimestampBeforeEpochError если текущее время раньше эпохи
     */
    SnowflakeId newId();

    /**
     * @brief Выдаёт новый идентификатор в десятичной записи
     * @return Строка с идентификатором
     * @throws ClockRegressionError, TimestampBeforeEpochError как и newId()
     */
    std::string newIdString();

    /**
     * @brief Раскладывает идентификатор на части относительно текущей эпохи
     *
     * В режиме отладки дополнительно логирует дату идентификатора на уровне INFO.
     *
     * @param id Идентификатор
     * @return Метка времени, её UTC-представление, воркер и порядковый номер
     */
    ParsedId parse(SnowflakeId id) const;

    /**
     * @brief Проверяет идентификатор относительно текущей эпохи
     * @param id Идентификатор
     * @return {true, "Valid snowflake"} или {false, причина}
     */
    ValidationResult validate(SnowflakeId id) const;

    /**
     * @brief Проверяет идентификатор, записанный десятичной строкой
     * @param text Десятичная запись идентификатора
     * @return {true, "Valid snowflake"} или {false, причина}
     */
    ValidationResult validate(std::string_view text) const;

    /**
     * @brief Сравнивает идентификаторы по временной метке
     * @return -1, 0 или 1
     */
    int compare(SnowflakeId a, SnowflakeId b) const;

    /**
     * @brief Проверяет, что a создан в более поздней миллисекунде, чем b
     * @return true, если compare(a, b) == 1
     */
    bool isNewer(SnowflakeId a, SnowflakeId b) const;

    /**
     * @brief Изменяет идентификатор воркера для последующих идентификаторов
     * @param workerId Новый идентификатор воркера
     * @throws InvalidWorkerIdError если workerId вне диапазона [0, MAX_WORKER_ID];
     * текущее значение при этом не меняется
     */
    void setWorkerId(int64_t workerId);

    /**
     * @brief Геттер для идентификатора воркера
     * @return Текущий идентификатор воркера
     */
    int64_t getWorkerId() const;

    /**
     * @brief Изменяет эпоху без проверки значения
     *
     * Идентификаторы, выданные до изменения, после него разбираются некорректно.
     *
     * @param epoch Миллисекунды с начала эпохи Unix
     */
    void setEpoch(int64_t epoch);

    /**
     * @brief Геттер для эпохи
     * @return Текущая эпоха в миллисекундах с начала эпохи Unix
     */
    int64_t getEpoch() const;

    /**
     * @brief Включает или отключает логирование результатов parse()
     * @param debug true для включения
     */
    void setDebug(bool debug);

    /**
     * @brief Проверяет, включён ли режим отладки
     * @return true, если parse() логирует результат
     */
    bool isDebug() const;

    /**
     * @brief Снимок кодека с текущей эпохой для разбора без блокировок
     */
    Codec codec() const;

    /**
     * @brief Возраст идентификатора по часам генератора
     * @param id Идентификатор
     * @param unit Единица измерения
     * @return Возраст; отрицательный для идентификаторов из будущего
     */
    double ageIn(SnowflakeId id, AgeUnit unit) const;

    /**
     * @brief Возраст идентификатора в секундах
     * @return ageIn(id, AgeUnit::SECONDS)
     */
    double ageInSeconds(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в минутах
     * @return ageIn(id, AgeUnit::MINUTES)
     */
    double ageInMinutes(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в часах
     * @return ageIn(id, AgeUnit::HOURS)
     */
    double ageInHours(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в сутках
     * @return ageIn(id, AgeUnit::DAYS)
     */
    double ageInDays(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в неделях
     * @return ageIn(id, AgeUnit::WEEKS)
     */
    double ageInWeeks(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в месяцах по 30.44 суток
     * @return ageIn(id, AgeUnit::MONTHS)
     */
    double ageInMonths(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в годах по 365.25 суток
     * @return ageIn(id, AgeUnit::YEARS)
     */
    double ageInYears(SnowflakeId id) const;

    /**
     * @brief Возраст идентификатора в десятилетиях
     * @return ageIn(id, AgeUnit::DECADES)
     */
    double ageInDecades(SnowflakeId id) const;

private:
    /**
     * @brief Ждёт, пока часы не перейдут за lastTimestamp
     * @return Новая метка времени
     * @note Вызывается при захваченном mutex_
     */
    int64_t waitNextMillis(int64_t lastTimestamp) const;

    // Источник времени
    const std::shared_ptr<Clock> clock_;

    // Мьютекс, защищающий всё состояние ниже
    mutable std::mutex mutex_;

    int64_t workerId_;
    int64_t epoch_;
    // Метка последнего выданного идентификатора; пусто, пока ничего не выдано
    std::optional<int64_t> lastTimestamp_;
    // Порядковый номер последнего выданного идентификатора
    int64_t sequence_;
    bool debug_;
};
} // namespace flakeid
