#ifndef HISTORY_TRACKER_HPP
#define HISTORY_TRACKER_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <main/config/config.hpp>
#include <main/models/health_score_record.hpp>
#include <main/engine/engine_error.hpp>
#include <main/utils/history_ring.hpp>

// Signed slope of the score over consecutive records, in points per record.
// 'defined' is false when fewer than two records exist.
struct TrendResult {
    bool  defined;
    float slope;
};

// Append-only per-field store of HealthScoreRecord.
// Each field has its own mutex, so fields never contend with each other;
// the slot table itself is guarded by a separate mutex.
class HistoryTracker {
    struct Slot;

public:
    using Ring = HistoryRing<HealthScoreRecord, Config::History::records_per_field>;

    HistoryTracker();
    ~HistoryTracker();

    HistoryTracker(const HistoryTracker&) = delete;
    HistoryTracker& operator=(const HistoryTracker&) = delete;

    // Create the mutexes. Must run once before any other call.
    void init();

    // Drop every field and record
    void clear();

    // Append 'record' to its field. OUT_OF_ORDER_READING if its timestamp is
    // earlier than the field's latest; FIELD_CAPACITY if the field is new and
    // no slot is free.
    EngineError record(const HealthScoreRecord& record);

    // Copy up to n latest records (chronological) into out; returns the count
    std::size_t recent(const char* field_id, std::size_t n, HealthScoreRecord* out);

    TrendResult trend(const char* field_id);

    std::size_t size(const char* field_id);

    // Least-squares slope of scores (chronological) against record index
    static TrendResult computeTrend(const float* scores, std::size_t count);

    // Exclusive hold on one field for a check-then-append sequence.
    // Released when destroyed.
    class FieldLock {
    public:
        // create=false only attaches to an existing field
        FieldLock(HistoryTracker& tracker, const char* field_id, bool create);
        ~FieldLock();

        FieldLock(const FieldLock&) = delete;
        FieldLock& operator=(const FieldLock&) = delete;

        // OK, FIELD_CAPACITY, or NOT_INITIALIZED; an unknown field with
        // create=false is OK but holds nothing
        EngineError status() const { return err; }
        bool holdsField() const { return slot != nullptr; }

        std::size_t size() const;
        bool latestTimestamp(uint32_t& out) const;
        std::size_t recent(std::size_t n, HealthScoreRecord* out) const;
        // Latest scores, oldest first, at most 'capacity'
        std::size_t scores(float* out, std::size_t capacity) const;
        EngineError append(const HealthScoreRecord& record);

    private:
        Slot* slot;
        EngineError err;
    };

private:
    struct Slot {
        bool              used;
        char              field_id[Config::Fields::id_capacity];
        Ring              records;
        SemaphoreHandle_t mutex;
        StaticSemaphore_t mutex_storage;
    };

    Slot* findSlot(const char* field_id, bool create, EngineError& err);

    Slot              slots[Config::Fields::max_fields];
    SemaphoreHandle_t table_mutex;
    StaticSemaphore_t table_mutex_storage;
    bool              initialized;
};

#endif // HISTORY_TRACKER_HPP
