#ifndef PROMPTS_HPP
#define PROMPTS_HPP

#include "tool_config.hpp"

// import pforge
#include "pforge/block_devices.hpp"
#include "pforge/mount_sequencer.hpp"
#include "pforge/partition_plan.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace tui {

// All prompts return std::nullopt when the operator cancels.

[[nodiscard]] auto select_disk(const std::vector<pforge::disk::DiskInfo>& disks) noexcept -> std::optional<std::string>;
[[nodiscard]] bool confirm(std::string_view question) noexcept;
[[nodiscard]] auto prompt_partition_plan(const partforge::ToolConfig& config) noexcept -> std::optional<pforge::plan::PartitionPlan>;
[[nodiscard]] auto prompt_mount_request(const partforge::ToolConfig& config) noexcept -> std::optional<pforge::mount::MountRequest>;

}  // namespace tui

#endif  // PROMPTS_HPP
