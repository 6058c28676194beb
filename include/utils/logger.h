// logger.h - logging setup for the catalog service, on top of spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace modelcat::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Textual name of the current default logger level.
std::string current_level();

// Get the log directory path (~/.modelcat/logs by default).
std::string get_log_dir();

// Get today's log file path (modelcat.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// Get retention days from environment (default: 7).
int get_retention_days();

// Remove modelcat.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// MODELCAT_LOG_DIR (log directory, default: ~/.modelcat/logs)
// MODELCAT_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// MODELCAT_LOG_RETENTION_DAYS (retention days, default: 7)
void init_from_env();

}  // namespace modelcat::logger
