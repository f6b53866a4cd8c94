#include <main/tasks/console_task.hpp>
#include <main/tasks/command_task.hpp>
#include <main/tasks/soil_health_task.hpp>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <mjson.h>
#include <cstdio>
#include <cstring>

static const char* TAG = "CONSOLE";

namespace {
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static char s_line[Config::Console::max_line_length + 2];

    static int trimmedLength(char* line) {
        int len = static_cast<int>(std::strlen(line));
        while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r' || line[len - 1] == ' ')) {
            line[--len] = '\0';
        }
        return len;
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Console ingress started");
        bool discarding = false;
        for (;;) {
            if (std::fgets(s_line, sizeof(s_line), stdin) == nullptr) {
                // No input yet (non-blocking console); poll again later
                clearerr(stdin);
                vTaskDelay(pdMS_TO_TICKS(Config::Console::poll_ms));
                continue;
            }
            const bool complete = std::strchr(s_line, '\n') != nullptr;
            if (discarding || !complete) {
                // Skip the rest of an oversized line up to its newline
                if (!discarding) {
                    LOG_WARN(TAG, "Dropped console line longer than %d bytes", Config::Console::max_line_length);
                }
                discarding = !complete;
                continue;
            }
            const int len = trimmedLength(s_line);
            switch (ConsoleTask::classify(s_line, len)) {
                case ConsoleTask::Route::COMMAND:
                    (void)CommandTask::submitJson(s_line, len);
                    break;
                case ConsoleTask::Route::READING:
                    (void)SoilHealthTask::submitJson(s_line, len);
                    break;
                case ConsoleTask::Route::IGNORED:
                    break;
            }
        }
    }
}

namespace ConsoleTask {
    void create() {
        xTaskCreateStatic(taskFunction,
                          "console",
                          sizeof(s_task_stack) / sizeof(StackType_t),
                          nullptr,
                          Config::TaskPriorities::NORMAL,
                          s_task_stack,
                          &s_task_tcb);
    }

    Route classify(const char* line, int length) {
        if (line == nullptr || length <= 0 || length > Config::Console::max_line_length) {
            return Route::IGNORED;
        }
        const char* tok = nullptr;
        int tok_len = 0;
        if (mjson_find(line, length, "$.command", &tok, &tok_len) != MJSON_TOK_INVALID) {
            return Route::COMMAND;
        }
        return Route::READING;
    }
}
