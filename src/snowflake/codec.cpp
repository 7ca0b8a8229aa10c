#include "snowflake/codec.hpp"

#include <charconv>

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"
#include "utils/time_format.hpp"

namespace {
using json = nlohmann::json;

constexpr uint64_t WORKER_MASK = (uint64_t(1) << flakeid::WORKER_ID_BITS) - 1;
constexpr uint64_t SEQUENCE_MASK = (uint64_t(1) << flakeid::SEQUENCE_BITS) - 1;

const char VALID_REASON[] = "Valid snowflake";
const char NOT_INTEGER_REASON[] = "Snowflake must be a non-negative integer";
const char BEFORE_EPOCH_REASON[] = "Snowflake timestamp precedes epoch";
const char WORKER_RANGE_REASON[] = "Snowflake worker id is out of range";
const char SEQUENCE_RANGE_REASON[] = "Snowflake sequence is out of range";
} // namespace

namespace flakeid {
Codec::Codec(int64_t epoch) noexcept
    : epoch_(epoch)
{
}

SnowflakeId Codec::encode(int64_t timestamp, int64_t workerId, int64_t sequence) const
{
    // Вся арифметика беззнаковая: эпоха может быть произвольной
    const auto delta = static_cast<uint64_t>(timestamp) - static_cast<uint64_t>(epoch_);
    return static_cast<SnowflakeId>((delta << TIMESTAMP_SHIFT)
                                    | (static_cast<uint64_t>(workerId) << WORKER_SHIFT)
                                    | static_cast<uint64_t>(sequence));
}

SnowflakeParts Codec::decode(SnowflakeId id) const
{
    // Арифметический сдвиг соответствует делению с округлением вниз,
    // маски — взятию неотрицательного остатка
    const auto bits = static_cast<uint64_t>(id);
    return SnowflakeParts{
        static_cast<int64_t>(static_cast<uint64_t>(id >> TIMESTAMP_SHIFT)
                             + static_cast<uint64_t>(epoch_)),
        static_cast<int64_t>((bits >> WORKER_SHIFT) & WORKER_MASK),
        static_cast<int64_t>(bits & SEQUENCE_MASK),
    };
}

ParsedId Codec::parse(SnowflakeId id) const
{
    const auto parts = decode(id);
    return ParsedId{ id, parts.timestamp, utils::formatTimestampUtc(parts.timestamp),
                     parts.workerId, parts.sequence };
}

ValidationResult Codec::validate(SnowflakeId id) const
{
    if (id < 0) {
        return { false, NOT_INTEGER_REASON };
    }
    return validateParts(decode(id));
}

ValidationResult Codec::validate(std::string_view text) const
{
    const auto id = fromString(text);
    if (!id.has_value()) {
        return { false, NOT_INTEGER_REASON };
    }
    return validate(*id);
}

ValidationResult Codec::validateParts(const SnowflakeParts &parts) const
{
    if (parts.timestamp < epoch_) {
        return { false, BEFORE_EPOCH_REASON };
    }
    if (parts.workerId < 0 || parts.workerId > MAX_WORKER_ID) {
        return { false, WORKER_RANGE_REASON };
    }
    if (parts.sequence < 0 || parts.sequence > MAX_SEQUENCE) {
        return { false, SEQUENCE_RANGE_REASON };
    }
    return { true, VALID_REASON };
}

int Codec::compare(SnowflakeId a, SnowflakeId b) const
{
    const auto first = decode(a).timestamp;
    const auto second = decode(b).timestamp;
    if (first < second) {
        return -1;
    }
    return first > second ? 1 : 0;
}

bool Codec::isNewer(SnowflakeId a, SnowflakeId b) const
{
    return compare(a, b) == 1;
}

std::string toString(SnowflakeId id)
{
    return std::to_string(id);
}

std::optional<SnowflakeId> fromString(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    for (const auto symbol : text) {
        // Знаки и пробелы не допускаются, только десятичные цифры
        if (symbol < '0' || symbol > '9') {
            return std::nullopt;
        }
    }

    SnowflakeId id = 0;
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, id);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return id;
}

std::string ParsedId::toJson() const
{
    json jsonData;
    jsonData["id"] = toString(id);
    jsonData["timestamp"] = timestamp;
    jsonData["humanTimestamp"] = humanTimestamp;
    jsonData["workerId"] = workerId;
    jsonData["sequence"] = sequence;
    return jsonData.dump();
}

std::optional<ParsedId> ParsedId::fromJson(const std::string &jsonStr)
{
    return fromJson(jsonStr, Codec());
}

std::optional<ParsedId> ParsedId::fromJson(const std::string &jsonStr, const Codec &codec)
{
    try {
        const auto jsonData = json::parse(jsonStr);

        if (!jsonData.contains("id") || !jsonData.contains("timestamp")
            || !jsonData.contains("workerId") || !jsonData.contains("sequence")) {
            LOG_ERROR << "JSON не содержит обязательных полей идентификатора";
            return std::nullopt;
        }

        const auto id = fromString(jsonData["id"].get<std::string>());
        if (!id.has_value()) {
            LOG_ERROR << "Поле id не является неотрицательным целым числом";
            return std::nullopt;
        }

        // Производные поля должны совпадать с разбором самого идентификатора
        auto parsed = codec.parse(*id);
        const auto timestamp = jsonData["timestamp"].get<int64_t>();
        const auto workerId = jsonData["workerId"].get<int64_t>();
        const auto sequence = jsonData["sequence"].get<int64_t>();
        if (timestamp != parsed.timestamp || workerId != parsed.workerId
            || sequence != parsed.sequence) {
            LOG_ERROR << "Поля JSON противоречат идентификатору " << *id << " (эпоха "
                      << codec.epoch() << ")";
            return std::nullopt;
        }

        if (jsonData.contains("humanTimestamp")
            && jsonData["humanTimestamp"].get<std::string>() != parsed.humanTimestamp) {
            LOG_ERROR << "Поле humanTimestamp противоречит идентификатору " << *id;
            return std::nullopt;
        }
        return parsed;
    }
    catch (const json::exception &e) {
        LOG_ERROR << "Ошибка при разборе JSON: " << e.what();
        return std::nullopt;
    }
}
} // namespace flakeid
