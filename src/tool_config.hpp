#ifndef TOOL_CONFIG_HPP
#define TOOL_CONFIG_HPP

// import pforge
#include "pforge/mount_sequencer.hpp"
#include "pforge/partition_plan.hpp"
#include "pforge/partition_spec.hpp"

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace partforge {

/// Default path of the configuration, relative to the working directory.
inline constexpr std::string_view DEFAULT_CONFIG_PATH{"settings.json"};

/// Root, Home or custom partition requested by the configuration.
struct PartitionEntry {
    pforge::plan::PartitionRole role{pforge::plan::PartitionRole::Custom};
    std::string size;
    pforge::fs::FilesystemType filesystem{pforge::fs::FilesystemType::Unknown};
    /// Custom partition name, e.g /var
    std::string name;
};

/// Configuration of both tools.
struct ToolConfig {
    bool headless_mode{false};
    std::string log_dir{"."};
    std::string mountpoint{"/mnt/gentoo"};

    // Partitioning
    std::string efi_size{"512M"};
    std::string swap_size{"8G"};
    std::optional<std::string> device{};
    std::vector<PartitionEntry> partitions{};

    // Mounting
    std::optional<std::string> swap_device{};
    std::optional<std::string> root_device{};
    std::optional<std::string> efi_device{};
    std::vector<pforge::mount::CustomMount> custom_mounts{};
};

/// Returns configuration used when no file is present.
[[nodiscard]] auto get_default_config() noexcept -> ToolConfig;

/// Parses tool configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return ToolConfig on success, or error string on failure.
[[nodiscard]] auto parse_tool_config(std::string_view json_content) noexcept
    -> std::expected<ToolConfig, std::string>;

/// Loads configuration from PARTFORGE_CONFIG, falls back to settings.json.
/// A missing file yields the defaults.
[[nodiscard]] auto load_tool_config() noexcept -> std::expected<ToolConfig, std::string>;

/// Validates that all fields required to partition without prompts are present.
/// @return void on success, or error string listing every missing field.
[[nodiscard]] auto validate_partition_headless(const ToolConfig& config) noexcept
    -> std::expected<void, std::string>;

/// Validates that all fields required to mount without prompts are present.
[[nodiscard]] auto validate_mount_headless(const ToolConfig& config) noexcept
    -> std::expected<void, std::string>;

/// Builds the partition plan: EFI and Swap from efi_size/swap_size, then the configured partitions.
[[nodiscard]] auto build_plan_from_config(const ToolConfig& config) noexcept
    -> std::expected<pforge::plan::PartitionPlan, std::string>;

/// Builds the mount request from the configured devices.
[[nodiscard]] auto mount_request_from_config(const ToolConfig& config) noexcept -> pforge::mount::MountRequest;

}  // namespace partforge

#endif  // TOOL_CONFIG_HPP
