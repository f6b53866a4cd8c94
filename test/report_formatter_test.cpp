#include <gtest/gtest.h>
#include <cstring>
#include <mjson.h>
#include <main/engine/report_formatter.hpp>
#include <main/config/config.hpp>

namespace {
    HealthScoreRecord makeRecord() {
        HealthScoreRecord r{};
        std::strncpy(r.field_id, "plot-A", sizeof(r.field_id) - 1);
        r.timestamp_s = 1765411200u;
        r.score = 80.0f;
        r.stage = GrowthStage::FLOWERING;
        return r;
    }

    Recommendation makeRecommendation() {
        Recommendation rec{};
        std::strncpy(rec.fertilizer, "NPK 10:26:26", sizeof(rec.fertilizer) - 1);
        std::strncpy(rec.unit, "kg/ha", sizeof(rec.unit) - 1);
        rec.quantity = 120.0f;
        rec.rationale.parameters[0] = SoilParameter::PHOSPHORUS;
        rec.rationale.parameters[1] = SoilParameter::POTASSIUM;
        rec.rationale.count = 2;
        return rec;
    }

    int len(const char* s) { return static_cast<int>(std::strlen(s)); }
}

TEST(ReportFormatter, RecommendationReportCarriesAllFields) {
    char out[384];
    Recommendation rec = makeRecommendation();
    rec.rationale.post_growth_depletion = true;
    ASSERT_TRUE(ReportFormatter::formatRecommendation(makeRecord(), rec, out, sizeof(out)));

    char text[48];
    double number = 0.0;
    int flag = 0;
    ASSERT_GT(mjson_get_string(out, len(out), "$.field", text, sizeof(text)), 0);
    EXPECT_STREQ("plot-A", text);
    ASSERT_EQ(1, mjson_get_number(out, len(out), "$.ts", &number));
    EXPECT_DOUBLE_EQ(1765411200.0, number);
    ASSERT_EQ(1, mjson_get_number(out, len(out), "$.score", &number));
    EXPECT_DOUBLE_EQ(80.0, number);
    ASSERT_GT(mjson_get_string(out, len(out), "$.stage", text, sizeof(text)), 0);
    EXPECT_STREQ("flowering", text);
    ASSERT_GT(mjson_get_string(out, len(out), "$.fertilizer", text, sizeof(text)), 0);
    EXPECT_STREQ("NPK 10:26:26", text);
    ASSERT_EQ(1, mjson_get_number(out, len(out), "$.qty", &number));
    EXPECT_DOUBLE_EQ(120.0, number);

    ASSERT_GT(mjson_get_string(out, len(out), "$.rationale[0]", text, sizeof(text)), 0);
    EXPECT_STREQ("phosphorus", text);
    ASSERT_GT(mjson_get_string(out, len(out), "$.rationale[1]", text, sizeof(text)), 0);
    EXPECT_STREQ("potassium", text);
    ASSERT_GT(mjson_get_string(out, len(out), "$.rationale[2]", text, sizeof(text)), 0);
    EXPECT_STREQ(Config::Recommendation::depletion_label, text);

    ASSERT_EQ(1, mjson_get_bool(out, len(out), "$.depletion", &flag));
    EXPECT_EQ(1, flag);
    ASSERT_EQ(1, mjson_get_bool(out, len(out), "$.overdose_clamped", &flag));
    EXPECT_EQ(0, flag);
}

TEST(ReportFormatter, MaintainReportHasEmptyRationale) {
    char out[384];
    Recommendation rec{};
    std::strncpy(rec.fertilizer, Config::Recommendation::maintain_label, sizeof(rec.fertilizer) - 1);
    std::strncpy(rec.unit, Config::Recommendation::default_unit, sizeof(rec.unit) - 1);
    ASSERT_TRUE(ReportFormatter::formatRecommendation(makeRecord(), rec, out, sizeof(out)));
    EXPECT_NE(nullptr, std::strstr(out, "\"rationale\":[]"));
}

TEST(ReportFormatter, RecommendationFailsWhenBufferTooSmall) {
    char out[32];
    EXPECT_FALSE(ReportFormatter::formatRecommendation(makeRecord(), makeRecommendation(), out, sizeof(out)));
}

TEST(ReportFormatter, RejectionIsCategorized) {
    char out[160];
    ASSERT_TRUE(ReportFormatter::formatRejection("plot-A", EngineError::INVALID_READING, "ph", out, sizeof(out)));

    char text[32];
    ASSERT_GT(mjson_get_string(out, len(out), "$.error", text, sizeof(text)), 0);
    EXPECT_STREQ("INVALID_READING", text);
    ASSERT_GT(mjson_get_string(out, len(out), "$.category", text, sizeof(text)), 0);
    EXPECT_STREQ("input", text);
    ASSERT_GT(mjson_get_string(out, len(out), "$.parameter", text, sizeof(text)), 0);
    EXPECT_STREQ("ph", text);
}

TEST(ReportFormatter, ErrorCategories) {
    EXPECT_EQ(ErrorCategory::INPUT, engineErrorCategory(EngineError::OUT_OF_ORDER_READING));
    EXPECT_EQ(ErrorCategory::INPUT, engineErrorCategory(EngineError::STAGE_REGRESSION));
    EXPECT_EQ(ErrorCategory::RESOURCE, engineErrorCategory(EngineError::FIELD_CAPACITY));
    EXPECT_EQ(ErrorCategory::RESOURCE, engineErrorCategory(EngineError::PERSISTENCE_FAILED));
    EXPECT_STREQ("PERSISTENCE_FAILED", engineErrorName(EngineError::PERSISTENCE_FAILED));
    EXPECT_EQ(ErrorCategory::CONFIGURATION, engineErrorCategory(EngineError::MISSING_RANGE));
    EXPECT_EQ(ErrorCategory::CONFIGURATION, engineErrorCategory(EngineError::INVALID_FERTILIZER_TABLE));
}
