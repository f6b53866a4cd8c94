#include <main/utils/logger.hpp>
#include <cstdio>

LogLevel Logger::s_level = LogLevel::INFO;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

LogLevel Logger::levelFromInt(int level) {
    if (level <= static_cast<int>(LogLevel::ERROR)) return LogLevel::ERROR;
    if (level >= static_cast<int>(LogLevel::DEBUG)) return LogLevel::DEBUG;
    return static_cast<LogLevel>(level);
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(s_level);
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!isEnabled(level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    const char* text = buffer;
    if (vsnprintf(buffer, sizeof(buffer), fmt, args) < 0) {
        text = "formatting error";
    } else {
        // Long messages are truncated, not dropped
        buffer[sizeof(buffer) - 1] = '\0';
    }

    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", text); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", text); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", text); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", text); break;
    }
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
