#include "definitions.hpp"  // for error_inter, success_inter
#include "prompts.hpp"      // for select_disk, prompt_partition_plan
#include "spinner.hpp"      // for Spinner
#include "tool_config.hpp"  // for load_tool_config
#include "utils.hpp"        // for init_logger, check_dependencies

// import pforge
#include "pforge/block_devices.hpp"
#include "pforge/dependencies.hpp"
#include "pforge/device_target.hpp"
#include "pforge/disk_operations.hpp"
#include "pforge/format_dispatcher.hpp"
#include "pforge/layout_executor.hpp"
#include "pforge/mtab.hpp"

#include <expected>     // for expected, unexpected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>  // for shutdown

namespace {

// Either the chosen disk or std::nullopt when the operator quit.
auto choose_disk(const partforge::ToolConfig& config) noexcept -> std::expected<std::optional<std::string>, std::string> {
    const auto& system_disk = pforge::disk::get_system_disk();
    if (system_disk) {
        spdlog::info("System disk {} is excluded", *system_disk);
    } else {
        spdlog::warn("Could not determine the system disk");
    }

    if (config.headless_mode) {
        const auto& device = *config.device;
        if (system_disk && device == *system_disk) {
            return std::unexpected(fmt::format(FMT_COMPILE("Refusing to overwrite the system disk {}"), device));
        }
        return std::optional<std::string>{device};
    }

    const auto& disks = pforge::disk::list_disks();
    if (!disks) {
        return std::unexpected("Failed to list block devices");
    }
    const auto& candidates = pforge::disk::filter_candidate_disks(*disks, system_disk.value_or(std::string{}));
    if (candidates.empty()) {
        return std::unexpected("No available disks found (excluding system disk)");
    }
    return tui::select_disk(candidates);
}

// Returns false when the operation must not continue.
auto check_mounted_partitions(const partforge::ToolConfig& config, std::string_view device, bool& aborted) noexcept -> bool {
    const auto& mtab_entries = pforge::mtab::parse_mtab();
    if (!mtab_entries) {
        spdlog::warn("Could not read mount table, skipping mounted partition check");
        return true;
    }

    const auto& mounted = pforge::mtab::mounted_partitions(*mtab_entries, device);
    if (mounted.empty()) {
        return true;
    }
    for (const auto& entry : mounted) {
        spdlog::warn("{} is mounted at {}", entry.device, entry.mountpoint);
    }
    spdlog::warn("Warning: The selected disk has mounted partitions.");

    if (config.headless_mode) {
        spdlog::error("Refusing to partition {} in HEADLESS mode while it has mounted partitions", device);
        return false;
    }
    if (!tui::confirm("The selected disk has mounted partitions.\nAre you sure you want to continue?")) {
        aborted = true;
        return false;
    }
    return true;
}

auto run() noexcept -> int {
    auto config = partforge::load_tool_config();
    if (!config) {
        error_inter("Failed to load configuration: {}\n", config.error());
        return 1;
    }

    const auto& log_path = utils::init_logger(config->log_dir, utils::PARTITION_LOG_PREFIX);
    if (!log_path) {
        error_inter("{}\n", log_path.error());
        return 1;
    }
    spdlog::info("Logging to {}", *log_path);
    spdlog::warn("WARNING: This tool will overwrite the selected disk.");

    if (auto res = partforge::validate_partition_headless(*config); !res) {
        spdlog::error("{}", res.error());
        return 1;
    }

    const std::vector<std::string> base_tools(pforge::utils::PARTITION_TOOLS.begin(), pforge::utils::PARTITION_TOOLS.end());
    if (!utils::check_dependencies(base_tools)) {
        return 1;
    }

    const auto& disk = choose_disk(*config);
    if (!disk) {
        spdlog::error("{}", disk.error());
        return 1;
    }
    if (!*disk) {
        spdlog::info("Aborted by user.");
        return 0;
    }
    const auto& device = **disk;

    bool aborted{false};
    if (!check_mounted_partitions(*config, device, aborted)) {
        if (aborted) {
            spdlog::info("Aborted by user.");
            return 0;
        }
        return 1;
    }

    pforge::plan::PartitionPlan plan{};
    if (config->headless_mode) {
        auto built = partforge::build_plan_from_config(*config);
        if (!built) {
            spdlog::error("Invalid partition layout: {}", built.error());
            return 1;
        }
        plan = std::move(*built);
    } else {
        auto prompted = tui::prompt_partition_plan(*config);
        if (!prompted) {
            spdlog::info("Aborted by user.");
            return 0;
        }
        plan = std::move(*prompted);
    }

    // e.g mkfs.ntfs is only needed when the plan uses it
    if (!utils::check_dependencies(pforge::utils::required_tools_for_plan(plan))) {
        return 1;
    }
    if (auto res = pforge::disk::FormatDispatcher::validate(plan); !res) {
        spdlog::error("Invalid partition layout: {}: {}", pforge::disk::format_failure_to_string(res.error()), res.error().diagnostic);
        return 1;
    }

    const auto& summary = utils::plan_summary(device, plan);
    spdlog::info("\n{}", summary);
    if (!config->headless_mode && !tui::confirm(fmt::format(FMT_COMPILE("{}\nProceed with these settings?"), summary))) {
        spdlog::info("Aborted by user.");
        return 0;
    }
    spdlog::info("Proceeding...");

    pforge::disk::ProcessDiskOperations disk_ops{};
    const pforge::disk::DeviceTarget target{.device = device};
    tui::Spinner spinner{};

    pforge::disk::LayoutExecutor layout_executor{disk_ops, target, spinner.progress_callback()};
    if (auto res = layout_executor.run(plan); !res) {
        spdlog::error("Partitioning failed at {}: {}", pforge::disk::layout_failure_to_string(res.error()), res.error().diagnostic);
        return 1;
    }

    pforge::disk::FormatDispatcher format_dispatcher{disk_ops, target, spinner.progress_callback()};
    if (auto res = format_dispatcher.run(plan); !res) {
        spdlog::error("Formatting failed at {}: {}", pforge::disk::format_failure_to_string(res.error()), res.error().diagnostic);
        return 1;
    }

    success_inter("Partitioning and formatting completed successfully.\n");
    spdlog::info("Partitioning and formatting of {} completed", device);
    utils::dump_command_to_log({"lsblk", device});
    return 0;
}

}  // namespace

int main() {
    const auto status = run();
    spdlog::shutdown();
    return status;
}
