#ifndef ENGINE_ERROR_HPP
#define ENGINE_ERROR_HPP

#include <cstdint>

// Result code of every fallible engine operation (OK on success).
enum class EngineError : uint8_t {
    OK = 0,

    // Input: the single reading or command is rejected, nothing is mutated
    INVALID_READING      = 1,
    MISSING_FIELD        = 2,
    OUT_OF_ORDER_READING = 3,
    STAGE_REGRESSION     = 4,

    // Resource: fixed-size tables are full, or flash refused a write
    FIELD_CAPACITY       = 10,
    PERSISTENCE_FAILED   = 11,

    // Configuration: fatal, the engine refuses to operate
    MISSING_RANGE            = 20,
    INVALID_RANGE            = 21,
    INVALID_WEIGHTS          = 22,
    INVALID_FERTILIZER_TABLE = 23,
    NOT_INITIALIZED          = 24,
};

enum class ErrorCategory : uint8_t {
    NONE          = 0,
    INPUT         = 1,
    RESOURCE      = 2,
    CONFIGURATION = 3,
};

const char* engineErrorName(EngineError err);
ErrorCategory engineErrorCategory(EngineError err);
const char* errorCategoryName(ErrorCategory category);

#endif // ENGINE_ERROR_HPP
