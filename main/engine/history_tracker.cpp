#include <main/engine/history_tracker.hpp>
#include <main/utils/logger.hpp>
#include <cstring>

static const char* TAG = "HISTORY";

HistoryTracker::HistoryTracker() : table_mutex(nullptr), initialized(false) {
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        slots[i].used = false;
        slots[i].field_id[0] = '\0';
        slots[i].mutex = nullptr;
    }
}

HistoryTracker::~HistoryTracker() {
    if (!initialized) {
        return;
    }
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        vSemaphoreDelete(slots[i].mutex);
    }
    vSemaphoreDelete(table_mutex);
}

void HistoryTracker::init() {
    if (initialized) {
        return;
    }
    table_mutex = xSemaphoreCreateMutexStatic(&table_mutex_storage);
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        slots[i].mutex = xSemaphoreCreateMutexStatic(&slots[i].mutex_storage);
    }
    initialized = true;
}

void HistoryTracker::clear() {
    if (!initialized) {
        return;
    }
    xSemaphoreTake(table_mutex, portMAX_DELAY);
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        xSemaphoreTake(slots[i].mutex, portMAX_DELAY);
        slots[i].used = false;
        slots[i].field_id[0] = '\0';
        slots[i].records.clear();
        xSemaphoreGive(slots[i].mutex);
    }
    xSemaphoreGive(table_mutex);
}

HistoryTracker::Slot* HistoryTracker::findSlot(const char* field_id, bool create, EngineError& err) {
    err = EngineError::OK;
    if (!initialized) {
        err = EngineError::NOT_INITIALIZED;
        return nullptr;
    }
    if (field_id == nullptr || field_id[0] == '\0') {
        return nullptr;
    }
    Slot* found = nullptr;
    Slot* free_slot = nullptr;
    xSemaphoreTake(table_mutex, portMAX_DELAY);
    for (std::size_t i = 0; i < Config::Fields::max_fields; ++i) {
        if (slots[i].used) {
            if (std::strncmp(slots[i].field_id, field_id, sizeof(slots[i].field_id)) == 0) {
                found = &slots[i];
                break;
            }
        } else if (free_slot == nullptr) {
            free_slot = &slots[i];
        }
    }
    if (found == nullptr && create) {
        if (free_slot == nullptr) {
            err = EngineError::FIELD_CAPACITY;
            LOG_WARN(TAG, "No history slot left for field %s", field_id);
        } else {
            std::strncpy(free_slot->field_id, field_id, sizeof(free_slot->field_id) - 1);
            free_slot->field_id[sizeof(free_slot->field_id) - 1] = '\0';
            free_slot->records.clear();
            free_slot->used = true;
            found = free_slot;
            LOG_INFO(TAG, "Tracking new field %s", free_slot->field_id);
        }
    }
    xSemaphoreGive(table_mutex);
    return found;
}

HistoryTracker::FieldLock::FieldLock(HistoryTracker& tracker, const char* field_id, bool create)
    : slot(nullptr), err(EngineError::OK) {
    slot = tracker.findSlot(field_id, create, err);
    if (slot != nullptr) {
        xSemaphoreTake(slot->mutex, portMAX_DELAY);
    }
}

HistoryTracker::FieldLock::~FieldLock() {
    if (slot != nullptr) {
        xSemaphoreGive(slot->mutex);
    }
}

std::size_t HistoryTracker::FieldLock::size() const {
    return slot ? slot->records.size() : 0;
}

bool HistoryTracker::FieldLock::latestTimestamp(uint32_t& out) const {
    if (slot == nullptr || slot->records.isEmpty()) {
        return false;
    }
    out = slot->records.back().timestamp_s;
    return true;
}

std::size_t HistoryTracker::FieldLock::scores(float* out, std::size_t capacity) const {
    if (slot == nullptr || out == nullptr) {
        return 0;
    }
    const std::size_t n = slot->records.size();
    const std::size_t first = (n > capacity) ? n - capacity : 0;
    for (std::size_t i = first; i < n; ++i) {
        out[i - first] = slot->records.at(i).score;
    }
    return n - first;
}

std::size_t HistoryTracker::FieldLock::recent(std::size_t n, HealthScoreRecord* out) const {
    if (slot == nullptr || out == nullptr) {
        return 0;
    }
    return slot->records.copyLatest(n, out);
}

EngineError HistoryTracker::FieldLock::append(const HealthScoreRecord& record) {
    if (slot == nullptr) {
        return (err != EngineError::OK) ? err : EngineError::MISSING_FIELD;
    }
    uint32_t latest = 0;
    if (latestTimestamp(latest) && record.timestamp_s < latest) {
        LOG_WARN(TAG, "Out-of-order record for %s: ts=%u < latest=%u", slot->field_id,
                 static_cast<unsigned>(record.timestamp_s), static_cast<unsigned>(latest));
        return EngineError::OUT_OF_ORDER_READING;
    }
    if (slot->records.append(record)) {
        LOG_DEBUG(TAG, "History for %s full, oldest record dropped", slot->field_id);
    }
    return EngineError::OK;
}

EngineError HistoryTracker::record(const HealthScoreRecord& record) {
    FieldLock lock(*this, record.field_id, true);
    if (lock.status() != EngineError::OK) {
        return lock.status();
    }
    return lock.append(record);
}

std::size_t HistoryTracker::recent(const char* field_id, std::size_t n, HealthScoreRecord* out) {
    FieldLock lock(*this, field_id, false);
    return lock.recent(n, out);
}

std::size_t HistoryTracker::size(const char* field_id) {
    FieldLock lock(*this, field_id, false);
    return lock.size();
}

TrendResult HistoryTracker::trend(const char* field_id) {
    float scores[Config::History::records_per_field];
    std::size_t n = 0;
    {
        FieldLock lock(*this, field_id, false);
        n = lock.scores(scores, Config::History::records_per_field);
    }
    return computeTrend(scores, n);
}

TrendResult HistoryTracker::computeTrend(const float* scores, std::size_t count) {
    TrendResult t{ false, 0.0f };
    if (scores == nullptr || count < 2) {
        return t;
    }
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        mean_x += static_cast<double>(i);
        mean_y += static_cast<double>(scores[i]);
    }
    mean_x /= static_cast<double>(count);
    mean_y /= static_cast<double>(count);

    double num = 0.0;
    double den = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double dx = static_cast<double>(i) - mean_x;
        num += dx * (static_cast<double>(scores[i]) - mean_y);
        den += dx * dx;
    }
    t.defined = true;
    t.slope = static_cast<float>(num / den);
    return t;
}
