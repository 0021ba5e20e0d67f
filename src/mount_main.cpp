#include "definitions.hpp"  // for error_inter, success_inter
#include "prompts.hpp"      // for prompt_mount_request, confirm
#include "spinner.hpp"      // for Spinner
#include "tool_config.hpp"  // for load_tool_config
#include "utils.hpp"        // for check_root, init_logger

// import pforge
#include "pforge/dependencies.hpp"
#include "pforge/disk_operations.hpp"
#include "pforge/mount_sequencer.hpp"

#include <string>   // for string
#include <utility>  // for move
#include <vector>   // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>  // for shutdown

namespace {

auto run() noexcept -> int {
    // Check if tool has enough permissions.
    if (!utils::check_root()) {
        error_inter("Please run this tool with sudo or as root.\n");
        return 1;
    }

    auto config = partforge::load_tool_config();
    if (!config) {
        error_inter("Failed to load configuration: {}\n", config.error());
        return 1;
    }

    const auto& log_path = utils::init_logger(config->log_dir, utils::MOUNT_LOG_PREFIX);
    if (!log_path) {
        error_inter("{}\n", log_path.error());
        return 1;
    }
    spdlog::info("Logging to {}", *log_path);

    if (auto res = partforge::validate_mount_headless(*config); !res) {
        spdlog::error("{}", res.error());
        return 1;
    }

    const std::vector<std::string> tools(pforge::utils::MOUNT_TOOLS.begin(), pforge::utils::MOUNT_TOOLS.end());
    if (!utils::check_dependencies(tools)) {
        return 1;
    }

    pforge::mount::MountRequest request{};
    if (config->headless_mode) {
        request = partforge::mount_request_from_config(*config);
    } else {
        auto prompted = tui::prompt_mount_request(*config);
        if (!prompted) {
            spdlog::info("Aborted by user.");
            return 0;
        }
        request = std::move(*prompted);
    }

    if (auto res = pforge::mount::validate_mount_request(request); !res) {
        spdlog::error("Invalid mount request: {}", res.error());
        return 1;
    }

    const auto& summary = utils::mount_summary(request);
    spdlog::info("\n{}", summary);
    if (!config->headless_mode && !tui::confirm(fmt::format(FMT_COMPILE("{}\nProceed with activating and mounting partitions?"), summary))) {
        spdlog::info("Aborted by user.");
        return 0;
    }
    spdlog::info("Proceeding...");

    pforge::disk::ProcessDiskOperations disk_ops{};
    tui::Spinner spinner{};
    pforge::mount::MountSequencer sequencer{disk_ops, spinner.progress_callback()};
    if (auto res = sequencer.run(request); !res) {
        spdlog::error("Mounting failed at {}: {}", pforge::mount::mount_failure_to_string(res.error()), res.error().diagnostic);
        return 1;
    }

    success_inter("All partitions have been activated and mounted successfully.\n");
    spdlog::info("Mounting below {} completed", request.root_mountpoint);
    utils::dump_command_to_log({"findmnt", "-R", request.root_mountpoint});
    return 0;
}

}  // namespace

int main() {
    const auto status = run();
    spdlog::shutdown();
    return status;
}
