#include "logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#if defined(FLAKEID_PLATFORM_WINDOWS)
#include <windows.h>
#endif

#include "utils/compiler.hpp"
#include "utils/time_format.hpp"

namespace {
/**
 * @brief Извлекает имя файла из полного пути
 * @param fullPath Полный путь к файлу
 * @return Только имя файла без пути
 */
std::string extractFileName(const std::string_view fullPath)
{
    auto pos = fullPath.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(fullPath.substr(pos + 1));
    }
    return std::string(fullPath);
}

/**
 * ANSI коды цветов для консольного вывода
 */
namespace ConsoleColor {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[31m"; // ошибки
constexpr const char *GREEN = "\033[32m"; // информация
constexpr const char *YELLOW = "\033[33m"; // предупреждения
constexpr const char *BLUE = "\033[34m"; // отладка
constexpr const char *MAGENTA = "\033[35m"; // критические ошибки
constexpr const char *CYAN = "\033[36m"; // трассировка
} // namespace ConsoleColor
} // namespace

namespace flakeid::utils {
Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

Logger::Logger()
    : enabled_(false)
    , minimumLevel_(LogLevel::INFO)
    , consoleOutput_(false)
    , colorOutput_(false)
    , logFilePath_(std::nullopt)
{
}

void Logger::enable(bool logToConsole, std::optional<std::filesystem::path> logFile,
                    LogLevel minLevel, bool useColors)
{
    std::lock_guard<std::mutex> lock(logMutex_);

    consoleOutput_ = logToConsole;
    logFilePath_ = std::move(logFile);
    minimumLevel_ = minLevel;
    colorOutput_ = useColors && isColorSupportedByTerminal();

    if (logFilePath_.has_value()) {
        // Создаем директорию для лог-файла, если она не существует
        std::error_code ec;
        const auto dir = logFilePath_->parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
        }
        if (ec) {
            std::cerr << "FLAKEID: Не удалось создать директорию для лога: " << dir << " ("
                      << ec.message() << ")" << std::endl;
        }
    }

    enabled_ = true;

    std::ostringstream configMsg;
    configMsg << "Логирование включено (минимальный уровень: " << levelToString(minLevel)
              << ", вывод в консоль: " << (consoleOutput_ ? "да" : "нет")
              << ", цветной вывод: " << (colorOutput_ ? "да" : "нет") << ")";
    if (minLevel <= LogLevel::INFO) {
        writeLocked(LogLevel::INFO, configMsg.str(), __FILE__, __LINE__);
    }
}

void Logger::disable()
{
    std::lock_guard<std::mutex> lock(logMutex_);
    if (enabled_.load() && minimumLevel_.load() <= LogLevel::INFO) {
        writeLocked(LogLevel::INFO, "Логирование отключено", __FILE__, __LINE__);
    }
    enabled_ = false;
}

bool Logger::isEnabled() const
{
    return enabled_.load();
}

void Logger::setMinLogLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    minimumLevel_ = level;
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_.load();
}

void Logger::setSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(logMutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, const std::string &message, const std::string_view file, int line)
{
    if (!enabled_.load() || level < minimumLevel_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(logMutex_);
    writeLocked(level, message, file, line);
}

void Logger::writeLocked(LogLevel level, const std::string &message, const std::string_view file,
                         int line)
{
    if (sink_) {
        sink_(level, message);
    }

    if (!consoleOutput_ && !logFilePath_.has_value()) {
        return;
    }

    const auto formattedMessage = formatLogMessage(level, message, file, line);
    if (consoleOutput_) {
        writeToConsole(formattedMessage, level);
    }
    if (logFilePath_.has_value()) {
        writeToFile(formattedMessage);
    }
}

std::string Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    case LogLevel::CRITICAL:
        return "CRITICAL";
    }
    UNREACHABLE("Unsupported LogLevel");
}

std::string Logger::formatLogMessage(LogLevel level, const std::string &message,
                                     const std::string_view file, int line)
{
    std::ostringstream oss;
    oss << "[" << formatTimestampLocal(currentUnixMillis()) << "] "
        << "[" << levelToString(level) << "] ";

    if (!file.empty()) {
        oss << "[" << extractFileName(file) << ":" << line << "] ";
    }

    oss << message;
    return oss.str();
}

bool Logger::writeToFile(const std::string &formattedMessage)
{
    std::ofstream file(*logFilePath_, std::ios::out | std::ios::app);
    if (!file) {
        std::cerr << "FLAKEID: Не удалось открыть файл для записи: " << *logFilePath_
                  << std::endl;
        return false;
    }

    file << formattedMessage << std::endl;
    return true;
}

void Logger::writeToConsole(const std::string &formattedMessage, LogLevel level)
{
    const std::string prefix = "FLAKEID: ";

    if (!colorOutput_) {
        std::cerr << prefix << formattedMessage << std::endl;
        return;
    }

    const char *colorCode = ConsoleColor::RESET;
    switch (level) {
    case LogLevel::TRACE:
        colorCode = ConsoleColor::CYAN;
        break;
    case LogLevel::DEBUG:
        colorCode = ConsoleColor::BLUE;
        break;
    case LogLevel::INFO:
        colorCode = ConsoleColor::GREEN;
        break;
    case LogLevel::WARNING:
        colorCode = ConsoleColor::YELLOW;
        break;
    case LogLevel::ERROR:
        colorCode = ConsoleColor::RED;
        break;
    case LogLevel::CRITICAL:
        colorCode = ConsoleColor::MAGENTA;
        break;
    }
    std::cerr << colorCode << prefix << formattedMessage << ConsoleColor::RESET << std::endl;
}

bool Logger::isColorSupportedByTerminal()
{
#if defined(FLAKEID_PLATFORM_WINDOWS)
    // Поддержка ANSI определяется флагом ENABLE_VIRTUAL_TERMINAL_PROCESSING (Windows 10+)
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }
    return (dwMode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    const std::string termName(term);
    return termName != "dumb" && termName != "unknown";
#endif
}

LogStream::LogStream(LogLevel level, const std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}

} // namespace flakeid::utils
