#include <main/engine/engine_error.hpp>

const char* engineErrorName(EngineError err) {
    switch (err) {
        case EngineError::OK:                       return "OK";
        case EngineError::INVALID_READING:          return "INVALID_READING";
        case EngineError::MISSING_FIELD:            return "MISSING_FIELD";
        case EngineError::OUT_OF_ORDER_READING:     return "OUT_OF_ORDER_READING";
        case EngineError::STAGE_REGRESSION:         return "STAGE_REGRESSION";
        case EngineError::FIELD_CAPACITY:           return "FIELD_CAPACITY";
        case EngineError::PERSISTENCE_FAILED:       return "PERSISTENCE_FAILED";
        case EngineError::MISSING_RANGE:            return "MISSING_RANGE";
        case EngineError::INVALID_RANGE:            return "INVALID_RANGE";
        case EngineError::INVALID_WEIGHTS:          return "INVALID_WEIGHTS";
        case EngineError::INVALID_FERTILIZER_TABLE: return "INVALID_FERTILIZER_TABLE";
        case EngineError::NOT_INITIALIZED:          return "NOT_INITIALIZED";
    }
    return "UNKNOWN";
}

ErrorCategory engineErrorCategory(EngineError err) {
    switch (err) {
        case EngineError::OK:
            return ErrorCategory::NONE;
        case EngineError::INVALID_READING:
        case EngineError::MISSING_FIELD:
        case EngineError::OUT_OF_ORDER_READING:
        case EngineError::STAGE_REGRESSION:
            return ErrorCategory::INPUT;
        case EngineError::FIELD_CAPACITY:
        case EngineError::PERSISTENCE_FAILED:
            return ErrorCategory::RESOURCE;
        case EngineError::MISSING_RANGE:
        case EngineError::INVALID_RANGE:
        case EngineError::INVALID_WEIGHTS:
        case EngineError::INVALID_FERTILIZER_TABLE:
        case EngineError::NOT_INITIALIZED:
            return ErrorCategory::CONFIGURATION;
    }
    return ErrorCategory::CONFIGURATION;
}

const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:          return "none";
        case ErrorCategory::INPUT:         return "input";
        case ErrorCategory::RESOURCE:      return "resource";
        case ErrorCategory::CONFIGURATION: return "configuration";
    }
    return "unknown";
}
