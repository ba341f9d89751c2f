#include "Log.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static void install(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
    g_logger = std::make_shared<spdlog::logger>("meetpoint", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void logsys::init_console_logs(spdlog::level::level_enum level) {
    install({ std::make_shared<spdlog::sinks::stdout_color_sink_mt>() }, level);
}

void logsys::init_file_logs(const std::string& path, spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks{ std::make_shared<spdlog::sinks::stdout_color_sink_mt>() };
    std::string failure;
    try {
        const fs::path dir = fs::path(path).parent_path();
        if (!dir.empty()) {
            std::error_code ec; fs::create_directories(dir, ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true));
    } catch (const spdlog::spdlog_ex& e) {
        failure = e.what();
    }
    install(std::move(sinks), level);
    if (!failure.empty())
        spdlog::warn("Could not open log file '{}': {}", path, failure);
}

std::shared_ptr<spdlog::logger> logsys::get() {
    if (!g_logger) init_console_logs();
    return g_logger;
}
