#include <gtest/gtest.h>
#include <cstdlib>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <main/engine/soil_health_engine.hpp>
#include <main/config/crop_profile.hpp>
#include <main/config/config.hpp>
#include <main/state/field_stages.hpp>
#include "test_samples.hpp"

// Runs under the FreeRTOS scheduler: the host port calls app_main from its
// main task, so the suite can spawn real tasks.

namespace {
    static constexpr uint32_t kReadingsPerField = 25;

    struct IngestJob {
        SoilHealthEngine* engine;
        const char*       field_id;
        SoilValues        values;
        SemaphoreHandle_t done;
        uint32_t          failures;
    };

    void ingestTask(void* arg) {
        IngestJob* job = static_cast<IngestJob*>(arg);
        for (uint32_t i = 0; i < kReadingsPerField; ++i) {
            IngestResult result{};
            if (job->engine->ingest(makeSample(job->field_id, 1000 + i, job->values), result) != EngineError::OK) {
                ++job->failures;
            }
            taskYIELD();
        }
        xSemaphoreGive(job->done);
        vTaskDelete(nullptr);
    }

    class ConcurrentIngestTest : public ::testing::Test {
    protected:
        void SetUp() override {
            FieldStages::init();
            done = xSemaphoreCreateCounting(2, 0);
            ASSERT_NE(nullptr, done);
            ASSERT_EQ(EngineError::OK, engine.init(EngineConfig{
                CropProfile::rangeTable(),
                CropProfile::fertilizerTable(),
                HealthScorer::defaultWeights(),
                Config::Recommendation::default_depletion_run,
            }));
        }

        void TearDown() override {
            if (done != nullptr) {
                vSemaphoreDelete(done);
            }
        }

        SoilHealthEngine engine;
        SemaphoreHandle_t done = nullptr;
    };
}

TEST_F(ConcurrentIngestTest, FieldsIngestedFromTwoTasksStayIndependent) {
    SoilValues starved;
    starved.n = 100.0f;
    IngestJob low{ &engine, "plot-low", starved, done, 0 };
    IngestJob healthy{ &engine, "plot-ok", SoilValues(), done, 0 };

    ASSERT_EQ(pdPASS, xTaskCreate(ingestTask, "ingest_low", 4096, &low, tskIDLE_PRIORITY + 1, nullptr));
    ASSERT_EQ(pdPASS, xTaskCreate(ingestTask, "ingest_ok", 4096, &healthy, tskIDLE_PRIORITY + 1, nullptr));
    for (int i = 0; i < 2; ++i) {
        ASSERT_EQ(pdTRUE, xSemaphoreTake(done, pdMS_TO_TICKS(10000)));
    }

    EXPECT_EQ(0u, low.failures);
    EXPECT_EQ(0u, healthy.failures);

    HealthScoreRecord low_history[kReadingsPerField];
    HealthScoreRecord ok_history[kReadingsPerField];
    ASSERT_EQ(kReadingsPerField, engine.getHistory("plot-low", kReadingsPerField, low_history));
    ASSERT_EQ(kReadingsPerField, engine.getHistory("plot-ok", kReadingsPerField, ok_history));

    for (uint32_t i = 0; i < kReadingsPerField; ++i) {
        EXPECT_STREQ("plot-low", low_history[i].field_id);
        EXPECT_STREQ("plot-ok", ok_history[i].field_id);
        EXPECT_EQ(1000 + i, low_history[i].timestamp_s);
        EXPECT_EQ(1000 + i, ok_history[i].timestamp_s);
        EXPECT_FLOAT_EQ(low_history[0].score, low_history[i].score);
        EXPECT_FLOAT_EQ(100.0f, ok_history[i].score);
        EXPECT_EQ(NutrientStatus::DEFICIENT, low_history[i].deficiencies[0].status);
        EXPECT_EQ(NutrientStatus::OPTIMAL, ok_history[i].deficiencies[0].status);
    }
    EXPECT_LT(low_history[0].score, 100.0f);
}

extern "C" void app_main(void)
{
    int argc = 1;
    char name[] = "pepper_concurrency_tests";
    char* argv[] = { name, nullptr };
    ::testing::InitGoogleTest(&argc, argv);
    std::exit(RUN_ALL_TESTS());
}
