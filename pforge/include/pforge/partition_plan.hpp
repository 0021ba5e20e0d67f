#ifndef PARTITION_PLAN_HPP
#define PARTITION_PLAN_HPP

#include "pforge/partition_spec.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t, uint32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace pforge::plan {

enum class PlanError : std::uint8_t {
    DuplicateRemainingSpace,
    RemainingSpaceNotLast,
    InvalidFilesystemForRole,
    InvalidRoleForOperation,
    RoleOutOfOrder,
    ZeroSize,
    MissingPartitionName,
    IncompletePlan,
    PlanAlreadyFinalized
};

auto plan_error_to_string(PlanError error) noexcept -> std::string_view;

/// @brief Immutable ordered list of partition specs.
/// Built by PlanBuilder, which guarantees contiguous indices starting at 1.
class PartitionPlan final {
 public:
    using const_iterator = std::vector<PartitionSpec>::const_iterator;

    PartitionPlan() = default;
    explicit PartitionPlan(std::vector<PartitionSpec> specs) noexcept
      : m_specs(std::move(specs)) { }

    /* clang-format off */
    [[nodiscard]] auto specs() const noexcept -> const std::vector<PartitionSpec>&
    { return m_specs; }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    { return m_specs.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool
    { return m_specs.empty(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator
    { return m_specs.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator
    { return m_specs.cend(); }
    /* clang-format on */

 private:
    std::vector<PartitionSpec> m_specs{};
};

/// @brief Accumulates partition specs in table order.
///
/// Layout is fixed: EFI (1), Swap (2), Root (3), optional Home (4), then
/// custom partitions in the order they were added. At most one spec may use
/// the remaining space and nothing may follow it.
class PlanBuilder final {
 public:
    /// @brief Adds EFI or Swap partition, which always have an explicit size.
    /// @return The assigned partition index.
    auto add_fixed_role(PartitionRole role, FixedSize size, fs::FilesystemType filesystem) noexcept
        -> std::expected<std::uint32_t, PlanError>;

    /// @brief Adds Root, Home or custom partition.
    /// @param name Custom partition name (e.g /var), ignored for Root and Home.
    /// @return The assigned partition index.
    auto add_sized_role(PartitionRole role, PartitionSize size, fs::FilesystemType filesystem, std::string_view name = {}) noexcept
        -> std::expected<std::uint32_t, PlanError>;

    /// @brief Freezes the plan. Any later add or finalize fails with PlanAlreadyFinalized.
    auto finalize() noexcept -> std::expected<PartitionPlan, PlanError>;

    /// Whether a spec already consumes the remaining space.
    [[nodiscard]] auto has_remaining_space() const noexcept -> bool;
    [[nodiscard]] auto is_finalized() const noexcept -> bool {
        return m_finalized;
    }
    [[nodiscard]] auto next_index() const noexcept -> std::uint32_t {
        return static_cast<std::uint32_t>(m_specs.size()) + 1;
    }
    [[nodiscard]] auto specs() const noexcept -> const std::vector<PartitionSpec>& {
        return m_specs;
    }

 private:
    auto check_can_append(PartitionRole role, const PartitionSize& size) const noexcept -> std::expected<void, PlanError>;
    auto append(PartitionRole role, PartitionSize size, fs::FilesystemType filesystem, std::string_view name) noexcept -> std::uint32_t;

    std::vector<PartitionSpec> m_specs{};
    bool m_finalized{false};
};

}  // namespace pforge::plan

#endif  // PARTITION_PLAN_HPP
