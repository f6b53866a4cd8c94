#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <memory>
#include <main/engine/history_tracker.hpp>

namespace {
    HealthScoreRecord makeRecord(const char* field_id, uint32_t ts, float score) {
        HealthScoreRecord r{};
        std::strncpy(r.field_id, field_id, sizeof(r.field_id) - 1);
        r.timestamp_s = ts;
        r.score = score;
        r.stage = GrowthStage::VEGETATIVE;
        return r;
    }

    class HistoryTrackerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            tracker.reset(new HistoryTracker());
            tracker->init();
        }

        std::unique_ptr<HistoryTracker> tracker;
    };
}

TEST_F(HistoryTrackerTest, RecentReturnsChronologicalTail) {
    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", 100 + i, 50.0f + i)));
    }
    HealthScoreRecord out[3];
    ASSERT_EQ(3u, tracker->recent("plot-A", 3, out));
    EXPECT_EQ(102u, out[0].timestamp_s);
    EXPECT_EQ(104u, out[2].timestamp_s);
    EXPECT_EQ(5u, tracker->size("plot-A"));
}

TEST_F(HistoryTrackerTest, UnknownFieldHasEmptyHistory) {
    HealthScoreRecord out[1];
    EXPECT_EQ(0u, tracker->recent("nowhere", 1, out));
    EXPECT_FALSE(tracker->trend("nowhere").defined);
}

TEST_F(HistoryTrackerTest, RejectsOutOfOrderAndAcceptsEqualTimestamp) {
    ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", 200, 80.0f)));
    EXPECT_EQ(EngineError::OUT_OF_ORDER_READING, tracker->record(makeRecord("plot-A", 199, 70.0f)));
    EXPECT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", 200, 75.0f)));
    EXPECT_EQ(2u, tracker->size("plot-A"));
}

TEST_F(HistoryTrackerTest, FieldsAreIndependent) {
    ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", 500, 80.0f)));
    EXPECT_EQ(EngineError::OK, tracker->record(makeRecord("plot-B", 100, 70.0f)));
}

TEST_F(HistoryTrackerTest, TrendUndefinedBelowTwoRecords) {
    EXPECT_FALSE(tracker->trend("plot-A").defined);
    ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", 1, 80.0f)));
    EXPECT_FALSE(tracker->trend("plot-A").defined);
}

TEST_F(HistoryTrackerTest, DecliningScoresGiveNegativeSlope) {
    const float scores[] = { 80.0f, 70.0f, 60.0f };
    for (uint32_t i = 0; i < 3; ++i) {
        ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", i + 1, scores[i])));
    }
    TrendResult t = tracker->trend("plot-A");
    ASSERT_TRUE(t.defined);
    EXPECT_NEAR(-10.0f, t.slope, 1e-4f);
}

TEST_F(HistoryTrackerTest, RetainsMostRecentRecordsOnly) {
    const std::size_t total = Config::History::records_per_field + 5;
    for (std::size_t i = 0; i < total; ++i) {
        ASSERT_EQ(EngineError::OK, tracker->record(makeRecord("plot-A", static_cast<uint32_t>(i), 1.0f)));
    }
    EXPECT_EQ(Config::History::records_per_field, tracker->size("plot-A"));

    HealthScoreRecord all[Config::History::records_per_field];
    ASSERT_EQ(Config::History::records_per_field,
              tracker->recent("plot-A", Config::History::records_per_field + 10, all));
    EXPECT_EQ(5u, all[0].timestamp_s);
    EXPECT_EQ(static_cast<uint32_t>(total - 1), all[Config::History::records_per_field - 1].timestamp_s);
}

TEST_F(HistoryTrackerTest, FieldCapacityIsEnforced) {
    char id[16];
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        std::snprintf(id, sizeof(id), "plot-%u", static_cast<unsigned>(i));
        ASSERT_EQ(EngineError::OK, tracker->record(makeRecord(id, 1, 50.0f)));
    }
    EXPECT_EQ(EngineError::FIELD_CAPACITY, tracker->record(makeRecord("one-too-many", 1, 50.0f)));

    tracker->clear();
    EXPECT_EQ(EngineError::OK, tracker->record(makeRecord("one-too-many", 1, 50.0f)));
}

TEST(HistoryTrend, LeastSquaresSlope) {
    const float flat[] = { 70.0f, 70.0f, 70.0f, 70.0f };
    EXPECT_FLOAT_EQ(0.0f, HistoryTracker::computeTrend(flat, 4).slope);

    const float rising[] = { 50.0f, 54.0f, 52.0f, 58.0f };
    TrendResult t = HistoryTracker::computeTrend(rising, 4);
    ASSERT_TRUE(t.defined);
    EXPECT_NEAR(2.2f, t.slope, 1e-4f);
}

TEST(HistoryTracker, NotInitializedRefusesRecords) {
    HistoryTracker tracker;
    EXPECT_EQ(EngineError::NOT_INITIALIZED, tracker.record(makeRecord("plot-A", 1, 50.0f)));
}
