#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace flakeid::utils {
/**
 * @enum LogLevel
 * @brief Уровни логирования, определяющие важность сообщения
 */
enum class LogLevel {
    TRACE, // Детальная трассировка для отладки
    DEBUG, // Отладочные сообщения
    INFO, // Информационные сообщения
    WARNING, // Предупреждения, не являющиеся ошибками
    ERROR, // Ошибки, не прерывающие работу программы
    CRITICAL // Критические ошибки, прерывающие работу программы
};

/**
 * @brief Пользовательский приёмник сообщений лога
 *
 * Получает уровень и текст сообщения без служебного форматирования.
 */
using LogSink = std::function<void(LogLevel level, const std::string &message)>;

/**
 * @class Logger
 * @brief Управляет логированием сообщений библиотеки
 *
 * Logger является синглтоном и обеспечивает потокобезопасное логирование.
 * По умолчанию логирование отключено и должно быть явно включено пользователем.
 * Помимо консоли и файла, сообщения можно перенаправить в пользовательский приёмник.
 */
class Logger {
public:
    /**
     * @brief Получение единственного экземпляра логгера
     * @return Ссылка на экземпляр логгера
     */
    static Logger &getInstance();

    /**
     * @brief Включает логирование
     * @param logToConsole Включить вывод в консоль (stderr)
     * @param logFile Путь к файлу для логирования (опционально)
     * @param minLevel Минимальный уровень сообщений для логирования
     * @param useColors Использовать цветной вывод в консоли (если поддерживается)
     */
    void enable(bool logToConsole = true,
                std::optional<std::filesystem::path> logFile = std::nullopt,
                LogLevel minLevel = LogLevel::INFO, bool useColors = true);

    /**
     * @brief Отключает логирование
     */
    void disable();

    /**
     * @brief Проверяет, включено ли логирование
     * @return true, если логирование включено
     */
    bool isEnabled() const;

    /**
     * @brief Установка минимального уровня логирования
     * @param level Минимальный уровень сообщений
     */
    void setMinLogLevel(LogLevel level);

    /**
     * @brief Получение текущего минимального уровня логирования
     * @return Текущий минимальный уровень
     */
    LogLevel getMinLogLevel() const;

    /**
     * @brief Устанавливает пользовательский приёмник сообщений
     * @param sink Приёмник; пустое значение отключает перенаправление
     */
    void setSink(LogSink sink);

    /**
     * @brief Логирование сообщения с указанным уровнем
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла, из которого вызвана функция логирования
     * @param line Номер строки, из которой вызвана функция логирования
     */
    void log(LogLevel level, const std::string &message, const std::string_view file = {},
             int line = 0);

    /**
     * @brief Преобразует уровень логирования в строку
     * @param level Уровень логирования
     * @return Текстовое представление уровня
     */
    static std::string levelToString(LogLevel level);

private:
    // Запрещаем создание экземпляров класса напрямую
    Logger();
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    std::atomic<bool> enabled_; // Включено ли логирование
    std::atomic<LogLevel> minimumLevel_; // Минимальный уровень логирования
    bool consoleOutput_; // Вывод в консоль
    bool colorOutput_; // Использовать цветной вывод
    std::optional<std::filesystem::path> logFilePath_; // Путь к файлу лога
    LogSink sink_; // Пользовательский приёмник
    std::mutex logMutex_; // Мьютекс для потокобезопасности

    /**
     * @brief Выводит сообщение во все настроенные приёмники
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла
     * @param line Номер строки
     * @note Вызывается только при захваченном logMutex_; приёмник вызывается под ним же
     */
    void writeLocked(LogLevel level, const std::string &message, const std::string_view file,
                     int line);

    /**
     * @brief Форматирует сообщение для вывода в лог
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Имя файла
     * @param line Номер строки
     * @return Строка вида "[ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение"
     */
    static std::string formatLogMessage(LogLevel level, const std::string &message,
                                        const std::string_view file, int line);

    /**
     * @brief Записывает сообщение в файл лога
     * @param formattedMessage Отформатированное сообщение
     * @return true, если запись выполнена успешно
     */
    bool writeToFile(const std::string &formattedMessage);

    /**
     * @brief Выводит сообщение в консоль (stderr)
     * @param formattedMessage Отформатированное сообщение
     * @param level Уровень сообщения (для цветового выделения)
     */
    void writeToConsole(const std::string &formattedMessage, LogLevel level);

    /**
     * @brief Проверяет, поддерживает ли консоль ANSI цвета
     * @return true, если консоль поддерживает ANSI цвета
     */
    static bool isColorSupportedByTerminal();
};

/**
 * @brief Вспомогательный класс для логирования с использованием потокового синтаксиса
 */
class LogStream {
public:
    /**
     * @brief Создает поток логирования для указанного уровня
     * @param level Уровень логирования
     * @param file Имя файла, из которого произведен вызов
     * @param line Номер строки
     */
    LogStream(LogLevel level, const std::string_view file, int line);

    /**
     * @brief Деструктор, который отправляет собранное сообщение в логгер
     */
    ~LogStream();

    /**
     * @brief Оператор перенаправления для потокового формирования сообщения
     * @param val Значение для добавления в сообщение
     * @return Ссылка на текущий поток
     */
    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_; // Уровень логирования
    std::ostringstream stream_; // Поток для формирования сообщения
    std::string_view file_; // Имя файла
    int line_; // Номер строки
};

} // namespace flakeid::utils

#define FLAKEID_LOG_ENABLED(level)                                                                 \
    (flakeid::utils::Logger::getInstance().isEnabled()                                             \
     && flakeid::utils::Logger::getInstance().getMinLogLevel() <= (level))

// Макросы для удобного логирования с автоматическим указанием файла и строки.
// Сообщение не формируется, если уровень отфильтрован.
#define LOG_TRACE                                                                                  \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::TRACE))                                      \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG                                                                                  \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::DEBUG))                                      \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO                                                                                   \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::INFO))                                       \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::INFO, __FILE__, __LINE__)
#define LOG_WARNING                                                                                \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::WARNING))                                    \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::WARNING, __FILE__, __LINE__)
#define LOG_ERROR                                                                                  \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::ERROR))                                      \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_CRITICAL                                                                               \
    if (FLAKEID_LOG_ENABLED(flakeid::utils::LogLevel::CRITICAL))                                   \
    flakeid::utils::LogStream(flakeid::utils::LogLevel::CRITICAL, __FILE__, __LINE__)
