#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace logsys {
    void init_console_logs(spdlog::level::level_enum level = spdlog::level::info);
    // Console plus a truncating file sink at `path`. Falls back to console only
    // (with a warning) if the file cannot be opened.
    void init_file_logs(const std::string& path, spdlog::level::level_enum level = spdlog::level::info);
    std::shared_ptr<spdlog::logger> get();  // "meetpoint"
}
