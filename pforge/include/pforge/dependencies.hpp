#ifndef DEPENDENCIES_HPP
#define DEPENDENCIES_HPP

#include "pforge/partition_plan.hpp"

#include <array>        // for array
#include <filesystem>   // for path
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::utils {

/// Tools needed to partition and format any plan.
inline constexpr std::array<std::string_view, 9> PARTITION_TOOLS{
    "lsblk", "sgdisk", "mkfs.fat", "mkswap", "mkfs.ext4", "mkfs.xfs", "mkfs.btrfs", "partprobe", "wipefs"};

/// Tools needed to activate swap and mount.
inline constexpr std::array<std::string_view, 2> MOUNT_TOOLS{"swapon", "mount"};

/// @brief Partition tools plus formatters the plan uses beyond the common set (mkfs.ntfs, mkfs.exfat).
auto required_tools_for_plan(const plan::PartitionPlan& plan) noexcept -> std::vector<std::string>;

/// @brief Looks up executable in the colon separated search path.
/// @param search_path Directories, e.g the value of PATH.
auto find_executable(std::string_view name, std::string_view search_path) noexcept -> std::optional<std::filesystem::path>;

/// @brief Returns the tools which are not found in PATH.
auto find_missing_tools(const std::vector<std::string>& tools) noexcept -> std::vector<std::string>;

}  // namespace pforge::utils

#endif  // DEPENDENCIES_HPP
