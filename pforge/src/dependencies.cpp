#include "pforge/dependencies.hpp"
#include "pforge/io_utils.hpp"
#include "pforge/string_utils.hpp"

#include <unistd.h>  // for access, X_OK

#include <algorithm>  // for find
#include <filesystem>    // for is_regular_file
#include <system_error>  // for error_code

#include <spdlog/spdlog.h>

namespace pforge::utils {

auto required_tools_for_plan(const plan::PartitionPlan& plan) noexcept -> std::vector<std::string> {
    std::vector<std::string> tools{PARTITION_TOOLS.begin(), PARTITION_TOOLS.end()};
    for (const auto& spec : plan) {
        std::string mkfs_bin{fs::get_mkfs_binary(spec.filesystem)};
        if (!mkfs_bin.empty() && std::ranges::find(tools, mkfs_bin) == tools.end()) {
            tools.emplace_back(std::move(mkfs_bin));
        }
    }
    return tools;
}

auto find_executable(std::string_view name, std::string_view search_path) noexcept -> std::optional<std::filesystem::path> {
    for (auto&& dir : utils::make_split_view(search_path, ':')) {
        const auto& candidate = std::filesystem::path{dir} / name;

        std::error_code err{};
        if (std::filesystem::is_regular_file(candidate, err) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto find_missing_tools(const std::vector<std::string>& tools) noexcept -> std::vector<std::string> {
    const auto search_path = utils::safe_getenv("PATH");

    std::vector<std::string> missing{};
    for (const auto& tool : tools) {
        if (!find_executable(tool, search_path)) {
            spdlog::error("Required command '{}' is not installed.", tool);
            missing.push_back(tool);
        }
    }
    return missing;
}

}  // namespace pforge::utils
