#include <gtest/gtest.h>
#include <cstring>
#include <main/engine/reading_decoder.hpp>
#include <main/config/config.hpp>

TEST(ReadingDecoder, DecodesCompleteJsonReading) {
    const char* json =
        "{\"field\":\"plot-A\",\"ts\":1765411200,\"n\":180,\"p\":32,\"k\":210,"
        "\"ph\":6.1,\"moisture\":58.5,\"temp\":26.4}";
    RawSensorSample s;

    ASSERT_TRUE(ReadingDecoder::fromJson(json, static_cast<int>(std::strlen(json)), s));
    EXPECT_STREQ("plot-A", s.field_id);
    EXPECT_TRUE(s.has_timestamp);
    EXPECT_EQ(1765411200u, s.timestamp_s);
    EXPECT_EQ(kAllParametersMask, s.present);
    EXPECT_FLOAT_EQ(180.0f, s.values[parameterIndex(SoilParameter::NITROGEN)]);
    EXPECT_FLOAT_EQ(6.1f, s.values[parameterIndex(SoilParameter::PH)]);
    EXPECT_FLOAT_EQ(26.4f, s.values[parameterIndex(SoilParameter::TEMPERATURE)]);
}

TEST(ReadingDecoder, AbsentKeysLeavePresenceBitsCleared) {
    const char* json = "{\"field\":\"plot-A\",\"n\":180}";
    RawSensorSample s;

    ASSERT_TRUE(ReadingDecoder::fromJson(json, static_cast<int>(std::strlen(json)), s));
    EXPECT_FALSE(s.has_timestamp);
    EXPECT_FALSE(s.timestamp_malformed);
    EXPECT_EQ(parameterBit(SoilParameter::NITROGEN), s.present);
}

TEST(ReadingDecoder, OverlongFieldIdIsMalformedNotAbsent) {
    const char* json =
        "{\"field\":\"plot-with-a-very-long-identifier\",\"ts\":10,\"n\":180}";
    RawSensorSample s;

    ASSERT_TRUE(ReadingDecoder::fromJson(json, static_cast<int>(std::strlen(json)), s));
    EXPECT_TRUE(s.field_id_malformed);
    EXPECT_FALSE(s.timestamp_malformed);
    EXPECT_TRUE(s.has_timestamp);
}

TEST(ReadingDecoder, NegativeOrOversizedTimestampIsMalformed) {
    const char* negative = "{\"field\":\"plot-A\",\"ts\":-5}";
    RawSensorSample s;
    ASSERT_TRUE(ReadingDecoder::fromJson(negative, static_cast<int>(std::strlen(negative)), s));
    EXPECT_TRUE(s.timestamp_malformed);
    EXPECT_FALSE(s.has_timestamp);
    EXPECT_FALSE(s.field_id_malformed);

    const char* oversized = "{\"field\":\"plot-A\",\"ts\":5000000000}";
    ASSERT_TRUE(ReadingDecoder::fromJson(oversized, static_cast<int>(std::strlen(oversized)), s));
    EXPECT_TRUE(s.timestamp_malformed);

    const char* text = "{\"field\":\"plot-A\",\"ts\":\"yesterday\"}";
    ASSERT_TRUE(ReadingDecoder::fromJson(text, static_cast<int>(std::strlen(text)), s));
    EXPECT_TRUE(s.timestamp_malformed);
}

TEST(ReadingDecoder, RejectsNonObjectPayload) {
    const char* json = "[1,2,3]";
    RawSensorSample s;
    EXPECT_FALSE(ReadingDecoder::fromJson(json, static_cast<int>(std::strlen(json)), s));
    EXPECT_FALSE(ReadingDecoder::fromJson(nullptr, 0, s));
}

TEST(ReadingDecoder, ScalesProbeRegisters) {
    uint16_t regs[Config::Sensor::Registers::count] = {
        264,  // 26.4 degC
        585,  // 58.5 %
        180, 32, 210,
        61,   // pH 6.1
        750,  // air humidity, ignored
    };
    RawSensorSample s;
    ReadingDecoder::fromRegisters(regs, "plot-B", 42, s);

    EXPECT_STREQ("plot-B", s.field_id);
    EXPECT_EQ(42u, s.timestamp_s);
    EXPECT_EQ(kAllParametersMask, s.present);
    EXPECT_FLOAT_EQ(26.4f, s.values[parameterIndex(SoilParameter::TEMPERATURE)]);
    EXPECT_FLOAT_EQ(58.5f, s.values[parameterIndex(SoilParameter::MOISTURE)]);
    EXPECT_FLOAT_EQ(32.0f, s.values[parameterIndex(SoilParameter::PHOSPHORUS)]);
    EXPECT_FLOAT_EQ(6.1f, s.values[parameterIndex(SoilParameter::PH)]);
}

TEST(ReadingDecoder, TemperatureRegisterIsSigned) {
    uint16_t regs[Config::Sensor::Registers::count] = {
        static_cast<uint16_t>(-25), 300, 100, 20, 150, 60, 700,
    };
    RawSensorSample s;
    ReadingDecoder::fromRegisters(regs, "plot-B", 1, s);
    EXPECT_FLOAT_EQ(-2.5f, s.values[parameterIndex(SoilParameter::TEMPERATURE)]);
}
