#ifndef UTILS_HPP
#define UTILS_HPP

// import pforge
#include "pforge/mount_sequencer.hpp"
#include "pforge/partition_plan.hpp"

#include <ctime>        // for tm
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace utils {

/// Log file prefix of the partitioning tool.
inline constexpr std::string_view PARTITION_LOG_PREFIX{"partition_tool"};
/// Log file prefix of the mount tool.
inline constexpr std::string_view MOUNT_LOG_PREFIX{"mount_and_activate"};

[[nodiscard]] bool check_root() noexcept;

/// @brief Builds log file name, e.g partition_tool_20240131_235959.log
[[nodiscard]] auto make_log_filename(std::string_view prefix, const std::tm& local_time) noexcept -> std::string;

/// @brief Sets up console and file logging in log_dir, creating the directory if missing.
/// @return Path of the log file on success.
[[nodiscard]] auto init_logger(std::string_view log_dir, std::string_view prefix) noexcept -> std::expected<std::string, std::string>;

/// @brief Summary of the plan shown before anything is written.
[[nodiscard]] auto plan_summary(std::string_view device, const pforge::plan::PartitionPlan& plan) noexcept -> std::string;

/// @brief Summary of the devices and mount points shown before mounting.
[[nodiscard]] auto mount_summary(const pforge::mount::MountRequest& request) noexcept -> std::string;

/// @brief Checks that every tool is available, reports the missing ones.
[[nodiscard]] bool check_dependencies(const std::vector<std::string>& tools) noexcept;

/// @brief Runs the command and writes its output to console and log.
void dump_command_to_log(const std::vector<std::string>& cmd) noexcept;

}  // namespace utils

#endif  // UTILS_HPP
