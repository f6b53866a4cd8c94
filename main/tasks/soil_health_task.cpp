#include <main/tasks/soil_health_task.hpp>
#include <freertos/task.h>
#include <freertos/queue.h>
#include <main/engine/reading_decoder.hpp>
#include <main/engine/report_formatter.hpp>
#include <main/models/recommendation_report.hpp>
#include <main/models/sensor_reading.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>

namespace {
    static const char* TAG = "HEALTH_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[6144 / sizeof(StackType_t)];

    static SoilHealthEngine* s_engine = nullptr;
    static QueueHandle_t q_readings = nullptr;
    static QueueHandle_t q_reports  = nullptr;

    static void emit(const RecommendationReport& report) {
        LOG_DEBUG(TAG, "Report: %s", report.payload);
        if (q_reports == nullptr) {
            return;
        }
        if (xQueueSend(q_reports, &report, 0) != pdTRUE) {
            LOG_WARN(TAG, "%s", "Reports queue full, dropped report");
        }
    }

    static void handleSample(const RawSensorSample& sample) {
        static IngestResult s_result;
        RecommendationReport report{};

        EngineError err = s_engine->ingest(sample, s_result);
        if (err == EngineError::OK) {
            if (!ReportFormatter::formatRecommendation(s_result.record, s_result.recommendation,
                                                       report.payload, sizeof(report.payload))) {
                LOG_ERROR(TAG, "Report for %s does not fit %u bytes", sample.field_id,
                          static_cast<unsigned>(sizeof(report.payload)));
                return;
            }
            emit(report);
            return;
        }

        const ErrorCategory category = engineErrorCategory(err);
        if (category == ErrorCategory::CONFIGURATION) {
            LOG_ERROR(TAG, "Engine refused %s: %s", sample.field_id, engineErrorName(err));
        } else {
            LOG_WARN(TAG, "Rejected reading for %s: %s%s%s", sample.field_id, engineErrorName(err),
                     s_result.offending ? " " : "", s_result.offending ? s_result.offending : "");
        }
        if (ReportFormatter::formatRejection(sample.field_id, err, s_result.offending,
                                             report.payload, sizeof(report.payload))) {
            emit(report);
        }
    }

    static void taskFn(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Soil Health Task started");
        RawSensorSample sample{};
        for (;;) {
            if (xQueueReceive(q_readings, &sample, pdMS_TO_TICKS(Config::Tasks::Health::idle_wait_ms)) == pdTRUE) {
                handleSample(sample);
            }
        }
    }
}

namespace SoilHealthTask {
    void create(SoilHealthEngine& engine, QueueHandle_t readings_queue, QueueHandle_t reports_queue) {
        s_engine = &engine;
        q_readings = readings_queue;
        q_reports = reports_queue;
        xTaskCreateStatic(taskFn, "soil_health",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          Config::TaskPriorities::HIGH, s_task_stack, &s_task_tcb);
    }

    bool submitJson(const char* json, int length) {
        if (q_readings == nullptr) {
            return false;
        }
        RawSensorSample sample{};
        if (!ReadingDecoder::fromJson(json, length, sample)) {
            LOG_WARN(TAG, "%s", "Reading payload is not a JSON object");
            return false;
        }
        if (xQueueSend(q_readings, &sample, 0) != pdTRUE) {
            LOG_WARN(TAG, "Readings queue full, dropped JSON reading for %s", sample.field_id);
            return false;
        }
        return true;
    }
}
