#ifndef LAYOUT_EXECUTOR_HPP
#define LAYOUT_EXECUTOR_HPP

#include "pforge/device_target.hpp"
#include "pforge/disk_operations.hpp"
#include "pforge/partition_plan.hpp"
#include "pforge/progress.hpp"

#include <cstdint>      // for uint8_t, uint32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace pforge::disk {

enum class LayoutState : std::uint8_t {
    Unwiped,
    Wiped,
    PartitionsCreated,
    TableRefreshed,
    Failed
};

/// @brief Stage at which the layout failed
enum class LayoutStage : std::uint8_t {
    Wipe,
    CreatePartition,
    Refresh
};

struct LayoutFailure final {
    LayoutStage stage{LayoutStage::Wipe};
    /// Partition index for CreatePartition, 0 otherwise.
    std::uint32_t index{};
    /// Output of the failed tool.
    std::string diagnostic{};

    bool operator==(const LayoutFailure&) const = default;
};

auto layout_state_to_string(LayoutState state) noexcept -> std::string_view;
auto layout_stage_to_string(LayoutStage stage) noexcept -> std::string_view;

/// @brief Formats failure, e.g "createPartition: 2"
auto layout_failure_to_string(const LayoutFailure& failure) -> std::string;

/// @brief Writes partition table of the plan onto the device.
///
/// Runs wipe, create (in plan order) and refresh. Halts at the first failing
/// step, nothing is retried. The executor is single use: once it reached a
/// terminal state, run() returns the recorded outcome again.
class LayoutExecutor final {
 public:
    LayoutExecutor(DiskOperations& disk_ops, DeviceTarget target, ProgressCallback progress = {}) noexcept;

    auto run(const plan::PartitionPlan& plan) noexcept -> std::expected<void, LayoutFailure>;

    [[nodiscard]] auto state() const noexcept -> LayoutState {
        return m_state;
    }
    [[nodiscard]] auto failure() const noexcept -> const std::optional<LayoutFailure>& {
        return m_failure;
    }

 private:
    auto fail(LayoutStage stage, std::uint32_t index, std::string diagnostic) noexcept -> std::expected<void, LayoutFailure>;
    void notify(ProgressEvent event, std::string_view description) const noexcept;

    DiskOperations& m_disk_ops;
    DeviceTarget m_target;
    ProgressCallback m_progress;
    LayoutState m_state{LayoutState::Unwiped};
    std::optional<LayoutFailure> m_failure{};
};

}  // namespace pforge::disk

#endif  // LAYOUT_EXECUTOR_HPP
