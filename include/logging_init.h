// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace openfixture {
namespace logging {

/**
 * @brief Log destination targets
 *
 * Auto picks syslog when /dev/log exists and a rotating file otherwise.
 */
enum class LogTarget {
    Auto,   ///< Detect best available (default)
    Syslog, ///< Traditional syslog
    File,   ///< Rotating file log
    Console ///< Console only (disable system logging)
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;         ///< Always show console output
    bool color = true;                  ///< Colored console output
    LogTarget target = LogTarget::Auto; ///< System log destination
    std::string file_path;              ///< Override file path (empty = auto)
};

/**
 * @brief Initialize logging subsystem
 *
 * Call once at startup before any log calls. Creates a multi-sink logger
 * that writes to both console (if enabled) and the selected system target,
 * and installs it as the spdlog default logger.
 *
 * @param config Logging configuration
 */
void init(const LogConfig& config);

/**
 * @brief Map -v count to a level (0 warn, 1 info, 2 debug, 3+ trace)
 */
spdlog::level::level_enum level_for_verbosity(int verbosity);

/**
 * @brief Default rotating log file path
 *
 * $XDG_STATE_HOME/openfixture/openfixture.log when XDG_STATE_HOME is set,
 * /tmp/openfixture.log otherwise.
 */
std::string default_log_file();

/**
 * @brief Parse log target from string
 *
 * @param str One of: "auto", "syslog", "file", "console"
 * @return Corresponding LogTarget enum value (Auto if unrecognized)
 */
LogTarget parse_log_target(const std::string& str);

/**
 * @brief Get string name for log target
 *
 * @param target LogTarget enum value
 * @return Lower-case name (e.g., "syslog")
 */
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace openfixture
