#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

#include "snowflake/codec.hpp"
#include "testing_utils.hpp"

namespace flakeid::tests {

class CodecTest : public ::testing::Test {
protected:
    Codec codec;

    // 2015-01-01T00:00:01Z
    static constexpr int64_t ONE_SECOND_AFTER_EPOCH = DEFAULT_EPOCH + 1000;
};

// Проверка констант раскладки битов
TEST_F(CodecTest, LayoutConstants)
{
    EXPECT_EQ(5, WORKER_ID_BITS);
    EXPECT_EQ(12, SEQUENCE_BITS);
    EXPECT_EQ(12, WORKER_SHIFT);
    EXPECT_EQ(17, TIMESTAMP_SHIFT);
    EXPECT_EQ(31, MAX_WORKER_ID);
    EXPECT_EQ(4095, MAX_SEQUENCE);
    EXPECT_EQ(1420070400000, DEFAULT_EPOCH);
    EXPECT_EQ(DEFAULT_EPOCH, codec.epoch());
}

// Проверка сборки идентификатора на известных значениях
TEST_F(CodecTest, EncodeKnownValues)
{
    EXPECT_EQ(0, codec.encode(DEFAULT_EPOCH, 0, 0));
    // 1000 << 17 = 131072000, 5 << 12 = 20480
    EXPECT_EQ(131092480, codec.encode(ONE_SECOND_AFTER_EPOCH, 5, 0));
    EXPECT_EQ(131092481, codec.encode(ONE_SECOND_AFTER_EPOCH, 5, 1));
    EXPECT_EQ((int64_t(1) << TIMESTAMP_SHIFT) - 1, codec.encode(DEFAULT_EPOCH, 31, 4095));
}

// Проверка разбора идентификатора на известных значениях
TEST_F(CodecTest, DecodeKnownValues)
{
    EXPECT_EQ((SnowflakeParts{ DEFAULT_EPOCH, 0, 0 }), codec.decode(0));
    EXPECT_EQ((SnowflakeParts{ ONE_SECOND_AFTER_EPOCH, 5, 0 }), codec.decode(131092480));
    EXPECT_EQ((SnowflakeParts{ ONE_SECOND_AFTER_EPOCH, 5, 1 }), codec.decode(131092481));
}

// Проверка обратимости на граничных и случайных значениях
TEST_F(CodecTest, EncodeDecodeRoundTrip)
{
    // ~2000 лет от эпохи, последний бит перед знаковым
    const int64_t maxDelta = (int64_t(1) << (63 - TIMESTAMP_SHIFT)) - 1;
    std::vector<SnowflakeParts> samples = {
        { DEFAULT_EPOCH, 0, 0 },
        { DEFAULT_EPOCH, MAX_WORKER_ID, MAX_SEQUENCE },
        { DEFAULT_EPOCH + maxDelta, MAX_WORKER_ID, MAX_SEQUENCE },
        { DEFAULT_EPOCH + maxDelta, 0, 0 },
    };
    for (size_t i = 0; i < 1000; i++) {
        samples.push_back({ DEFAULT_EPOCH + getRandomInt(0, maxDelta),
                            getRandomInt(0, MAX_WORKER_ID), getRandomInt(0, MAX_SEQUENCE) });
    }

    for (const auto &parts : samples) {
        const auto id = codec.encode(parts.timestamp, parts.workerId, parts.sequence);
        EXPECT_GE(id, 0);
        EXPECT_EQ(parts, codec.decode(id));
    }
}

// Разбор определен для любых значений, включая отрицательные
TEST_F(CodecTest, DecodeIsTotal)
{
    const auto parts = codec.decode(-1);
    EXPECT_EQ(DEFAULT_EPOCH - 1, parts.timestamp);
    EXPECT_EQ(MAX_WORKER_ID, parts.workerId);
    EXPECT_EQ(MAX_SEQUENCE, parts.sequence);

    const auto maxParts = codec.decode(std::numeric_limits<SnowflakeId>::max());
    EXPECT_EQ(MAX_WORKER_ID, maxParts.workerId);
    EXPECT_EQ(MAX_SEQUENCE, maxParts.sequence);
}

// Идентификатор, закодированный с одной эпохой, смещается при разборе с другой
TEST_F(CodecTest, EpochChangesDecoding)
{
    const Codec unixEpochCodec(0);
    const auto id = codec.encode(ONE_SECOND_AFTER_EPOCH, 3, 7);

    const auto parts = unixEpochCodec.decode(id);
    EXPECT_EQ(1000, parts.timestamp);
    EXPECT_EQ(3, parts.workerId);
    EXPECT_EQ(7, parts.sequence);

    EXPECT_EQ(id, unixEpochCodec.encode(1000, 3, 7));
}

// Проверка разбора с человекочитаемой датой
TEST_F(CodecTest, ParseProducesHumanTimestamp)
{
    const auto parsed = codec.parse(131092481);
    EXPECT_EQ(131092481, parsed.id);
    EXPECT_EQ(ONE_SECOND_AFTER_EPOCH, parsed.timestamp);
    EXPECT_EQ("2015-01-01 00:00:01.000 UTC", parsed.humanTimestamp);
    EXPECT_EQ(5, parsed.workerId);
    EXPECT_EQ(1, parsed.sequence);
}

// Проверка корректных и некорректных идентификаторов
TEST_F(CodecTest, ValidateIds)
{
    const auto valid = codec.validate(SnowflakeId(0));
    EXPECT_TRUE(valid.valid);
    EXPECT_EQ("Valid snowflake", valid.reason);

    EXPECT_TRUE(codec.validate(SnowflakeId(131092480)).valid);
    EXPECT_TRUE(codec.validate(std::numeric_limits<SnowflakeId>::max()).valid);

    const auto negative = codec.validate(SnowflakeId(-1));
    EXPECT_FALSE(negative.valid);
    EXPECT_EQ("Snowflake must be a non-negative integer", negative.reason);
    EXPECT_FALSE(codec.validate(std::numeric_limits<SnowflakeId>::min()).valid);
}

// Проверка десятичной записи идентификаторов
TEST_F(CodecTest, ValidateText)
{
    EXPECT_TRUE(codec.validate(std::string_view("0")).valid);
    EXPECT_TRUE(codec.validate(std::string_view("131092480")).valid);
    EXPECT_TRUE(codec.validate(std::string_view("9223372036854775807")).valid);

    const std::vector<std::string> invalid = {
        "", // пустая строка
        "-5", // отрицательное число
        "+5", // знак
        " 5", // пробел
        "12a", // не цифра
        "1.5", // дробное число
        "9223372036854775808", // переполнение
    };
    for (const auto &text : invalid) {
        const auto result = codec.validate(std::string_view(text));
        EXPECT_FALSE(result.valid) << text;
        EXPECT_EQ("Snowflake must be a non-negative integer", result.reason) << text;
    }
}

// Проверка диапазонов полей, недостижимых через decode()
TEST_F(CodecTest, ValidatePartsRanges)
{
    EXPECT_TRUE(codec.validateParts({ DEFAULT_EPOCH, 0, 0 }).valid);
    EXPECT_TRUE(codec.validateParts({ DEFAULT_EPOCH, MAX_WORKER_ID, MAX_SEQUENCE }).valid);

    const auto beforeEpoch = codec.validateParts({ DEFAULT_EPOCH - 1, 0, 0 });
    EXPECT_FALSE(beforeEpoch.valid);
    EXPECT_EQ("Snowflake timestamp precedes epoch", beforeEpoch.reason);

    for (const auto workerId : { int64_t(-1), MAX_WORKER_ID + 1 }) {
        const auto result = codec.validateParts({ DEFAULT_EPOCH, workerId, 0 });
        EXPECT_FALSE(result.valid);
        EXPECT_EQ("Snowflake worker id is out of range", result.reason);
    }

    for (const auto sequence : { int64_t(-1), MAX_SEQUENCE + 1 }) {
        const auto result = codec.validateParts({ DEFAULT_EPOCH, 0, sequence });
        EXPECT_FALSE(result.valid);
        EXPECT_EQ("Snowflake sequence is out of range", result.reason);
    }
}

// Поля любого неотрицательного идентификатора после разбора лежат в допустимых диапазонах
TEST_F(CodecTest, DecodedFieldsAlwaysInRange)
{
    for (size_t i = 0; i < 10000; i++) {
        const auto id = getRandomInt(0, std::numeric_limits<SnowflakeId>::max());
        const auto parts = codec.decode(id);
        EXPECT_GE(parts.timestamp, codec.epoch());
        EXPECT_TRUE(codec.validateParts(parts).valid) << id;
        EXPECT_TRUE(codec.validate(id).valid) << id;
    }
}

// Сравнение учитывает только временную метку
TEST_F(CodecTest, CompareByTimestampOnly)
{
    const auto earlier = codec.encode(ONE_SECOND_AFTER_EPOCH, 31, 4095);
    const auto sameMsLow = codec.encode(ONE_SECOND_AFTER_EPOCH + 1, 0, 0);
    const auto sameMsHigh = codec.encode(ONE_SECOND_AFTER_EPOCH + 1, 17, 900);

    EXPECT_EQ(-1, codec.compare(earlier, sameMsLow));
    EXPECT_EQ(1, codec.compare(sameMsLow, earlier));
    EXPECT_EQ(0, codec.compare(sameMsLow, sameMsHigh));
    EXPECT_EQ(0, codec.compare(sameMsHigh, sameMsLow));
    EXPECT_EQ(0, codec.compare(earlier, earlier));

    EXPECT_TRUE(codec.isNewer(sameMsLow, earlier));
    EXPECT_FALSE(codec.isNewer(earlier, sameMsLow));
    EXPECT_FALSE(codec.isNewer(sameMsHigh, sameMsLow));
}

// Сравнение согласовано с порядком временных меток
TEST_F(CodecTest, CompareConsistentWithTimestamps)
{
    for (size_t i = 0; i < 1000; i++) {
        const auto a = getRandomInt(0, int64_t(1) << 50);
        const auto b = getRandomInt(0, int64_t(1) << 50);
        const auto ta = codec.decode(a).timestamp;
        const auto tb = codec.decode(b).timestamp;
        const int expected = ta < tb ? -1 : (ta > tb ? 1 : 0);
        EXPECT_EQ(expected, codec.compare(a, b));
        EXPECT_EQ(-expected, codec.compare(b, a));
    }
}

// Проверка преобразования в строку и обратно
TEST_F(CodecTest, StringConversion)
{
    EXPECT_EQ("131092480", toString(131092480));
    EXPECT_EQ(SnowflakeId(131092480), fromString("131092480"));
    EXPECT_EQ(SnowflakeId(0), fromString("0"));
    EXPECT_FALSE(fromString("").has_value());
    EXPECT_FALSE(fromString("-1").has_value());
    EXPECT_FALSE(fromString("99999999999999999999").has_value());
}

// Проверка сериализации результата разбора в JSON
TEST_F(CodecTest, ParsedIdJson)
{
    const auto parsed = codec.parse(131092481);
    const auto jsonStr = parsed.toJson();
    EXPECT_NE(std::string::npos, jsonStr.find("\"id\":\"131092481\""));
    EXPECT_NE(std::string::npos, jsonStr.find("\"workerId\":5"));

    const auto restored = ParsedId::fromJson(jsonStr);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(parsed.id, restored->id);
    EXPECT_EQ(parsed.timestamp, restored->timestamp);
    EXPECT_EQ(parsed.humanTimestamp, restored->humanTimestamp);
    EXPECT_EQ(parsed.workerId, restored->workerId);
    EXPECT_EQ(parsed.sequence, restored->sequence);
}

// Некорректный JSON не приводит к исключениям
TEST_F(CodecTest, ParsedIdJsonRejectsMalformedInput)
{
    EXPECT_FALSE(ParsedId::fromJson("not a json").has_value());
    EXPECT_FALSE(ParsedId::fromJson("{}").has_value());
    EXPECT_FALSE(
        ParsedId::fromJson(R"({"id":"abc","timestamp":1,"workerId":0,"sequence":0})").has_value());
    EXPECT_FALSE(
        ParsedId::fromJson(R"({"id":12,"timestamp":1,"workerId":0,"sequence":0})").has_value());
    EXPECT_FALSE(
        ParsedId::fromJson(R"({"id":"12","timestamp":"x","workerId":0,"sequence":0})").has_value());
}

// Поля JSON, противоречащие идентификатору, отклоняются
TEST_F(CodecTest, ParsedIdJsonRejectsContradictoryFields)
{
    EXPECT_FALSE(
        ParsedId::fromJson(R"({"id":"0","timestamp":1420070400000,"workerId":99,"sequence":0})")
            .has_value());
    EXPECT_FALSE(
        ParsedId::fromJson(R"({"id":"0","timestamp":1420070400000,"workerId":0,"sequence":-1})")
            .has_value());
    EXPECT_FALSE(ParsedId::fromJson(R"({"id":"0","timestamp":5,"workerId":0,"sequence":0})")
                     .has_value());
    EXPECT_TRUE(
        ParsedId::fromJson(R"({"id":"0","timestamp":1420070400000,"workerId":0,"sequence":0})")
            .has_value());

    auto parsed = codec.parse(131092481);
    parsed.humanTimestamp = "2000-01-01 00:00:00.000 UTC";
    EXPECT_FALSE(ParsedId::fromJson(parsed.toJson()).has_value());
}

// Идентификатор с другой эпохой разбирается только кодеком с той же эпохой
TEST_F(CodecTest, ParsedIdJsonUsesCodecEpoch)
{
    const Codec unixCodec(0);
    const auto id = unixCodec.encode(ONE_SECOND_AFTER_EPOCH, 7, 3);
    const auto jsonStr = unixCodec.parse(id).toJson();

    const auto restored = ParsedId::fromJson(jsonStr, unixCodec);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(id, restored->id);
    EXPECT_EQ(ONE_SECOND_AFTER_EPOCH, restored->timestamp);
    EXPECT_EQ(7, restored->workerId);
    EXPECT_EQ(3, restored->sequence);

    EXPECT_FALSE(ParsedId::fromJson(jsonStr).has_value());
}

// Разбор определён для любой эпохи, включая крайние значения
TEST_F(CodecTest, ExtremeEpochDecoding)
{
    const Codec minCodec(std::numeric_limits<int64_t>::min());
    const Codec maxCodec(std::numeric_limits<int64_t>::max());
    constexpr auto id = std::numeric_limits<SnowflakeId>::max();

    EXPECT_EQ(std::numeric_limits<int64_t>::min() + (id >> TIMESTAMP_SHIFT),
              minCodec.decode(id).timestamp);
    EXPECT_EQ(std::numeric_limits<int64_t>::max(), maxCodec.decode(0).timestamp);
    EXPECT_EQ(MAX_WORKER_ID, maxCodec.decode(id).workerId);
    EXPECT_EQ(MAX_SEQUENCE, maxCodec.decode(id).sequence);
    EXPECT_EQ(0, minCodec.compare(0, 0));
    EXPECT_TRUE(minCodec.isNewer(id, 0));
}
} // namespace flakeid::tests
