#include "pforge/partition_plan.hpp"

#include <algorithm>  // for any_of

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using pforge::fs::FilesystemType;
using pforge::plan::PartitionRole;

// EFI, Swap and Root occupy the first three slots of the table in this order
constexpr auto required_role_for_slot(std::size_t slot) noexcept -> PartitionRole {
    switch (slot) {
    case 0:
        return PartitionRole::Efi;
    case 1:
        return PartitionRole::Swap;
    default:
        return PartitionRole::Root;
    }
}

constexpr auto is_filesystem_valid_for_role(PartitionRole role, FilesystemType filesystem) noexcept -> bool {
    if (filesystem == FilesystemType::Unknown) {
        return false;
    }
    switch (role) {
    case PartitionRole::Efi:
        return filesystem == FilesystemType::Fat32;
    case PartitionRole::Swap:
        return filesystem == FilesystemType::Swap;
    case PartitionRole::Root:
        // fat32 root is tolerated here, formatting skips it with a warning
        return filesystem != FilesystemType::Swap;
    case PartitionRole::Home:
    case PartitionRole::Custom:
        return filesystem != FilesystemType::Swap && filesystem != FilesystemType::Fat32;
    }
    return false;
}

}  // namespace

namespace pforge::plan {

auto plan_error_to_string(PlanError error) noexcept -> std::string_view {
    switch (error) {
    case PlanError::DuplicateRemainingSpace:
        return "Only one partition may use the remaining space"sv;
    case PlanError::RemainingSpaceNotLast:
        return "A partition using the remaining space must be the last one"sv;
    case PlanError::InvalidFilesystemForRole:
        return "Filesystem is not allowed for this partition"sv;
    case PlanError::InvalidRoleForOperation:
        return "Partition role cannot be added this way"sv;
    case PlanError::RoleOutOfOrder:
        return "Partitions must be added in order: EFI, Swap, Root, Home, custom"sv;
    case PlanError::ZeroSize:
        return "Partition size must be greater than zero"sv;
    case PlanError::MissingPartitionName:
        return "Custom partition requires a name"sv;
    case PlanError::IncompletePlan:
        return "Plan requires EFI, Swap and Root partitions"sv;
    case PlanError::PlanAlreadyFinalized:
        return "Plan is already finalized"sv;
    }
    return "unknown plan error"sv;
}

auto PlanBuilder::has_remaining_space() const noexcept -> bool {
    return std::ranges::any_of(m_specs, [](auto&& spec) { return is_remaining_space(spec.size); });
}

auto PlanBuilder::check_can_append(PartitionRole role, const PartitionSize& size) const noexcept -> std::expected<void, PlanError> {
    if (has_remaining_space()) {
        return std::unexpected(is_remaining_space(size) ? PlanError::DuplicateRemainingSpace : PlanError::RemainingSpaceNotLast);
    }

    const auto slot = m_specs.size();
    if (slot < 3) {
        if (role != required_role_for_slot(slot)) {
            return std::unexpected(PlanError::RoleOutOfOrder);
        }
        return {};
    }

    // after root only Home (once, directly after root) or custom partitions
    if (role == PartitionRole::Home && m_specs.back().role == PartitionRole::Root) {
        return {};
    }
    if (role == PartitionRole::Custom) {
        return {};
    }
    return std::unexpected(PlanError::RoleOutOfOrder);
}

auto PlanBuilder::append(PartitionRole role, PartitionSize size, fs::FilesystemType filesystem, std::string_view name) noexcept -> std::uint32_t {
    const auto index = next_index();
    m_specs.emplace_back(PartitionSpec{
        .role       = role,
        .size       = size,
        .filesystem = filesystem,
        .index      = index,
        .name       = (role == PartitionRole::Custom) ? std::string{name} : std::string{},
    });
    spdlog::debug("[plan] added {} partition #{}: size={}, fs={}", partition_role_to_string(role), index,
        size_to_string(size), fs::filesystem_type_to_string(filesystem));
    return index;
}

auto PlanBuilder::add_fixed_role(PartitionRole role, FixedSize size, fs::FilesystemType filesystem) noexcept
    -> std::expected<std::uint32_t, PlanError> {
    if (m_finalized) {
        return std::unexpected(PlanError::PlanAlreadyFinalized);
    }
    if (role != PartitionRole::Efi && role != PartitionRole::Swap) {
        return std::unexpected(PlanError::InvalidRoleForOperation);
    }
    if (!is_filesystem_valid_for_role(role, filesystem)) {
        return std::unexpected(PlanError::InvalidFilesystemForRole);
    }
    if (size.magnitude == 0) {
        return std::unexpected(PlanError::ZeroSize);
    }
    if (auto check = check_can_append(role, size); !check) {
        return std::unexpected(check.error());
    }
    return append(role, size, filesystem, {});
}

auto PlanBuilder::add_sized_role(PartitionRole role, PartitionSize size, fs::FilesystemType filesystem, std::string_view name) noexcept
    -> std::expected<std::uint32_t, PlanError> {
    if (m_finalized) {
        return std::unexpected(PlanError::PlanAlreadyFinalized);
    }
    if (role == PartitionRole::Efi || role == PartitionRole::Swap) {
        return std::unexpected(PlanError::InvalidRoleForOperation);
    }
    if (role == PartitionRole::Custom && name.empty()) {
        return std::unexpected(PlanError::MissingPartitionName);
    }
    if (!is_filesystem_valid_for_role(role, filesystem)) {
        return std::unexpected(PlanError::InvalidFilesystemForRole);
    }
    if (const auto* fixed = std::get_if<FixedSize>(&size); fixed != nullptr && fixed->magnitude == 0) {
        return std::unexpected(PlanError::ZeroSize);
    }
    if (auto check = check_can_append(role, size); !check) {
        return std::unexpected(check.error());
    }
    return append(role, size, filesystem, name);
}

auto PlanBuilder::finalize() noexcept -> std::expected<PartitionPlan, PlanError> {
    if (m_finalized) {
        return std::unexpected(PlanError::PlanAlreadyFinalized);
    }
    if (m_specs.size() < 3) {
        return std::unexpected(PlanError::IncompletePlan);
    }
    m_finalized = true;
    return PartitionPlan{m_specs};
}

}  // namespace pforge::plan
