#ifndef FORMAT_DISPATCHER_HPP
#define FORMAT_DISPATCHER_HPP

#include "pforge/device_target.hpp"
#include "pforge/disk_operations.hpp"
#include "pforge/partition_plan.hpp"
#include "pforge/progress.hpp"

#include <cstdint>      // for uint8_t, uint32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace pforge::disk {

enum class FormatStage : std::uint8_t {
    /// Plan rejected before any destructive call
    UnsupportedFilesystemForRole,
    WipeSignature,
    Format
};

struct FormatFailure final {
    FormatStage stage{FormatStage::Format};
    std::uint32_t index{};
    std::string diagnostic{};

    bool operator==(const FormatFailure&) const = default;
};

auto format_stage_to_string(FormatStage stage) noexcept -> std::string_view;

/// @brief Formats failure, e.g "format: 3"
auto format_failure_to_string(const FormatFailure& failure) -> std::string;

/// @brief Whether formatting of the spec is skipped.
/// Only the EFI partition is formatted as FAT32, any other FAT32 slot is left untouched.
constexpr auto is_format_skipped(const plan::PartitionSpec& spec) noexcept -> bool {
    return spec.filesystem == fs::FilesystemType::Fat32 && spec.role != plan::PartitionRole::Efi;
}

/// @brief Creates filesystems for every partition of the plan.
class FormatDispatcher final {
 public:
    FormatDispatcher(DiskOperations& disk_ops, DeviceTarget target, ProgressCallback progress = {}) noexcept;

    /// @brief Validates the whole plan, then wipes signatures and formats each partition in order.
    /// Already formatted partitions stay formatted when a later one fails.
    auto run(const plan::PartitionPlan& plan) noexcept -> std::expected<void, FormatFailure>;

    /// @brief Checks role/filesystem combinations without touching the device.
    [[nodiscard]] static auto validate(const plan::PartitionPlan& plan) noexcept -> std::expected<void, FormatFailure>;

 private:
    auto format_one(const plan::PartitionSpec& spec) noexcept -> std::expected<void, FormatFailure>;
    void notify(ProgressEvent event, std::string_view description) const noexcept;

    DiskOperations& m_disk_ops;
    DeviceTarget m_target;
    ProgressCallback m_progress;
};

}  // namespace pforge::disk

#endif  // FORMAT_DISPATCHER_HPP
