#include "utils.hpp"
#include "definitions.hpp"

// import pforge
#include "pforge/dependencies.hpp"
#include "pforge/io_utils.hpp"

#include <unistd.h>  // for geteuid

#include <chrono>        // for seconds
#include <cstddef>       // for size_t
#include <ctime>         // for time, localtime_r
#include <filesystem>    // for create_directories, path
#include <memory>        // for make_shared
#include <system_error>  // for error_code

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/common.h>                   // for debug, info
#include <spdlog/sinks/basic_file_sink.h>    // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h> // for stdout_color_sink_mt
#include <spdlog/spdlog.h>                   // for set_default_logger, set_level

namespace utils {

bool check_root() noexcept {
#ifdef NDEVENV
    return geteuid() == 0;
#else
    return true;
#endif
}

auto make_log_filename(std::string_view prefix, const std::tm& local_time) noexcept -> std::string {
    return fmt::format("{}_{:%Y%m%d_%H%M%S}.log", prefix, local_time);
}

auto init_logger(std::string_view log_dir, std::string_view prefix) noexcept -> std::expected<std::string, std::string> {
    std::error_code err{};
    std::filesystem::create_directories(log_dir, err);
    if (err) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create log directory '{}': {}"), log_dir, err.message()));
    }

    const auto now = std::time(nullptr);
    std::tm local_time{};
    localtime_r(&now, &local_time);
    const auto& log_path = (std::filesystem::path{log_dir} / make_log_filename(prefix, local_time)).string();

    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink{};
    try {
        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
    } catch (const spdlog::spdlog_ex& ex) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open log file '{}': {}"), log_path, ex.what()));
    }
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);

    auto logger = std::make_shared<spdlog::logger>("partforge", spdlog::sinks_init_list{console_sink, file_sink});
    // pforge logs through the default logger
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::debug);
    spdlog::flush_every(std::chrono::seconds(5));
    return log_path;
}

auto plan_summary(std::string_view device, const pforge::plan::PartitionPlan& plan) noexcept -> std::string {
    std::string summary{"SUMMARY:\n"};
    summary += fmt::format(FMT_COMPILE("Disk: {}\n"), device);
    for (const auto& spec : plan) {
        summary += fmt::format(FMT_COMPILE("{}. {} partition: {} ({})\n"), spec.index, pforge::plan::display_name(spec),
            pforge::plan::size_to_string(spec.size), pforge::fs::filesystem_type_to_string(spec.filesystem));
    }
    return summary;
}

auto mount_summary(const pforge::mount::MountRequest& request) noexcept -> std::string {
    std::string summary{"SUMMARY:\n"};
    summary += fmt::format(FMT_COMPILE("Swap Partition: {}\n"), request.swap_device);
    summary += fmt::format(FMT_COMPILE("Root Partition: {}\n"), request.root_device);
    summary += fmt::format(FMT_COMPILE("EFI Partition: {}\n"), request.efi_device);
    for (std::size_t i = 0; i < request.custom_mounts.size(); ++i) {
        const auto& custom = request.custom_mounts[i];
        summary += fmt::format(FMT_COMPILE("Custom Partition {}: {} mounted at {}\n"), i + 1, custom.device, custom.mountpoint);
    }
    summary += fmt::format(FMT_COMPILE("Mount point: {}\n"), request.root_mountpoint);
    return summary;
}

bool check_dependencies(const std::vector<std::string>& tools) noexcept {
    const auto& missing_tools = pforge::utils::find_missing_tools(tools);
    if (missing_tools.empty()) {
        spdlog::debug("All required tools found: {}", tools);
        return true;
    }
    error_inter("Missing required tools: {}\n", fmt::join(missing_tools, ", "));
    return false;
}

void dump_command_to_log(const std::vector<std::string>& cmd) noexcept {
    const auto& result = pforge::utils::exec_capture(cmd);
    if (!result.success()) {
        spdlog::warn("{} exited with {}: {}", cmd, result.exit_code, result.output);
        return;
    }
    spdlog::info("[DUMP_TO_LOG] {} :=\n{}", fmt::join(cmd, " "), result.output);
}

}  // namespace utils
