// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <syslog.h>
#include <system_error>
#include <vector>

namespace openfixture {
namespace logging {

namespace {

constexpr size_t LOG_FILE_SIZE = 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

LogTarget resolve_target(LogTarget target) {
    if (target != LogTarget::Auto) {
        return target;
    }
    std::error_code ec;
    if (std::filesystem::exists("/dev/log", ec)) {
        return LogTarget::Syslog;
    }
    return LogTarget::File;
}

spdlog::sink_ptr make_file_sink(const std::string& override_path) {
    std::string path = override_path.empty() ? default_log_file() : override_path;

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_SIZE,
                                                                      LOG_FILE_COUNT);
    } catch (const spdlog::spdlog_ex& e) {
        // Console logging still works; report once there
        spdlog::warn("[Logging] Cannot open log file {}: {}", path, e.what());
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        if (config.color) {
            sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }
    }

    LogTarget target = resolve_target(config.target);
    switch (target) {
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(
            "openfixture", LOG_PID, LOG_USER, true));
        break;
    case LogTarget::File:
        if (auto sink = make_file_sink(config.file_path)) {
            sinks.push_back(sink);
        }
        break;
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }

    auto logger = std::make_shared<spdlog::logger>("openfixture", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: level {}, target {}",
                  spdlog::level::to_string_view(config.level), log_target_name(target));
}

spdlog::level::level_enum level_for_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

std::string default_log_file() {
    const char* state_home = std::getenv("XDG_STATE_HOME");
    if (state_home && *state_home) {
        return (std::filesystem::path(state_home) / "openfixture" / "openfixture.log").string();
    }
    return "/tmp/openfixture.log";
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog") {
        return LogTarget::Syslog;
    }
    if (str == "file") {
        return LogTarget::File;
    }
    if (str == "console") {
        return LogTarget::Console;
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace openfixture
