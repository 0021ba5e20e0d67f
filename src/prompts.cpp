#include "prompts.hpp"
#include "widgets.hpp"

// import pforge
#include "pforge/size_parser.hpp"

#include <array>     // for array
#include <optional>  // for optional
#include <string>    // for string
#include <utility>   // for move
#include <variant>   // for get_if

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using pforge::fs::FilesystemType;
using pforge::plan::PartitionRole;
using pforge::plan::PlanBuilder;
using pforge::plan::SizeContext;

// Offered for root, home and custom partitions.
// FAT32 is reserved for the EFI partition, swap for the swap partition.
constexpr std::array<FilesystemType, 5> DATA_FILESYSTEMS{
    FilesystemType::Ext4, FilesystemType::Xfs, FilesystemType::Btrfs, FilesystemType::Ntfs, FilesystemType::Exfat};

auto require_value(std::string_view value) -> std::optional<std::string> {
    if (value.empty()) {
        return std::string{"Value must not be empty."};
    }
    return std::nullopt;
}

auto check_mountpoint(std::string_view value) -> std::optional<std::string> {
    if (auto res = pforge::mount::validate_custom_mountpoint(value); !res) {
        return std::move(res.error());
    }
    return std::nullopt;
}

void report_plan_error(pforge::plan::PlanError error) noexcept {
    const auto& message = pforge::plan::plan_error_to_string(error);
    spdlog::warn("Partition rejected: {}", message);
    tui::detail::message_widget(message);
}

auto add_fixed_partition(PlanBuilder& builder, PartitionRole role, FilesystemType filesystem, std::string_view question, std::string_view default_size) noexcept -> bool {
    while (true) {
        const auto& size = tui::detail::size_input_widget(question, default_size, SizeContext::FixedOnly);
        if (!size) {
            return false;
        }
        const auto* fixed = std::get_if<pforge::plan::FixedSize>(&*size);
        if (fixed == nullptr) {
            continue;
        }
        auto res = builder.add_fixed_role(role, *fixed, filesystem);
        if (res) {
            return true;
        }
        report_plan_error(res.error());
    }
}

auto add_sized_partition(PlanBuilder& builder, PartitionRole role, std::string_view name, std::string_view question, SizeContext context, std::string_view fs_title) noexcept -> bool {
    while (true) {
        const auto& size = tui::detail::size_input_widget(question, {}, context);
        if (!size) {
            return false;
        }
        const auto& filesystem = tui::detail::filesystem_menu_widget(fs_title, DATA_FILESYSTEMS);
        if (!filesystem) {
            return false;
        }
        auto res = builder.add_sized_role(role, *size, *filesystem, name);
        if (res) {
            return true;
        }
        report_plan_error(res.error());
    }
}

auto add_custom_partitions(PlanBuilder& builder) noexcept -> bool {
    do {
        const auto& name = tui::detail::input_widget(fmt::format(FMT_COMPILE("Enter name for partition {} (e.g., /var, /tmp):"), builder.next_index()), {}, require_value);
        if (!name) {
            return false;
        }
        const auto& size_question = fmt::format(FMT_COMPILE("Enter size for {} (e.g., 10G, 500M, or '0' for remaining space):"), *name);
        const auto& fs_title      = fmt::format(FMT_COMPILE("Select filesystem for {}:"), *name);
        if (!add_sized_partition(builder, PartitionRole::Custom, *name, size_question, SizeContext::AllowRemaining, fs_title)) {
            return false;
        }
    } while (!builder.has_remaining_space() && tui::detail::yesno_widget("Add another custom partition?"));
    return true;
}

}  // namespace

namespace tui {

auto select_disk(const std::vector<pforge::disk::DiskInfo>& disks) noexcept -> std::optional<std::string> {
    return detail::disk_menu_widget("Select a disk (Cancel to quit).\nWARNING: the selected disk will be overwritten!"sv, disks);
}

bool confirm(std::string_view question) noexcept {
    return detail::yesno_widget(question);
}

auto prompt_partition_plan(const partforge::ToolConfig& config) noexcept -> std::optional<pforge::plan::PartitionPlan> {
    PlanBuilder builder{};

    const auto& efi_question = fmt::format(FMT_COMPILE("EFI partition size [default: {}]:"), config.efi_size);
    if (!add_fixed_partition(builder, PartitionRole::Efi, FilesystemType::Fat32, efi_question, config.efi_size)) {
        return std::nullopt;
    }
    const auto& swap_question = fmt::format(FMT_COMPILE("Swap partition size [default: {}]:"), config.swap_size);
    if (!add_fixed_partition(builder, PartitionRole::Swap, FilesystemType::Swap, swap_question, config.swap_size)) {
        return std::nullopt;
    }

    static constexpr auto root_question = "Root partition size (e.g., 50G).\nEnter '0' or leave blank to use all remaining space."sv;
    if (!add_sized_partition(builder, PartitionRole::Root, {}, root_question, SizeContext::AllowRemaining, "Filesystem for root partition:"sv)) {
        return std::nullopt;
    }

    if (!builder.has_remaining_space() && detail::yesno_widget("Do you want to create a separate Home partition?")) {
        if (!add_sized_partition(builder, PartitionRole::Home, {}, "Home partition size (e.g., 50G):"sv, SizeContext::FixedOnly, "Filesystem for home partition:"sv)) {
            return std::nullopt;
        }
    }

    if (!builder.has_remaining_space() && detail::yesno_widget("Do you want to add custom partitions?")) {
        if (!add_custom_partitions(builder)) {
            return std::nullopt;
        }
    }

    auto plan = builder.finalize();
    if (!plan) {
        spdlog::error("Failed to finalize partition plan: {}", pforge::plan::plan_error_to_string(plan.error()));
        return std::nullopt;
    }
    return std::move(*plan);
}

auto prompt_mount_request(const partforge::ToolConfig& config) noexcept -> std::optional<pforge::mount::MountRequest> {
    pforge::mount::MountRequest request{.root_mountpoint = config.mountpoint};

    const auto& swap_device = detail::input_widget("Enter the swap partition (e.g., /dev/sda2):"sv, config.swap_device.value_or(std::string{}), require_value);
    if (!swap_device) {
        return std::nullopt;
    }
    const auto& root_device = detail::input_widget("Enter the root partition (e.g., /dev/sda3):"sv, config.root_device.value_or(std::string{}), require_value);
    if (!root_device) {
        return std::nullopt;
    }
    const auto& efi_device = detail::input_widget("Enter the EFI partition (e.g., /dev/sda1):"sv, config.efi_device.value_or(std::string{}), require_value);
    if (!efi_device) {
        return std::nullopt;
    }
    request.swap_device = *swap_device;
    request.root_device = *root_device;
    request.efi_device  = *efi_device;
    request.custom_mounts = config.custom_mounts;

    if (!detail::yesno_widget("Do you want to mount custom partitions?")) {
        return request;
    }
    do {
        const auto& device = detail::input_widget(fmt::format(FMT_COMPILE("Enter custom partition {} (e.g., /dev/sda4):"), request.custom_mounts.size() + 1), {}, require_value);
        if (!device) {
            return std::nullopt;
        }
        const auto& mountpoint = detail::input_widget(fmt::format(FMT_COMPILE("Enter mount point for {} (e.g., /home, /var):"), *device), {}, check_mountpoint);
        if (!mountpoint) {
            return std::nullopt;
        }
        request.custom_mounts.emplace_back(pforge::mount::CustomMount{.device = *device, .mountpoint = *mountpoint});
    } while (detail::yesno_widget("Add another custom partition?"));

    return request;
}

}  // namespace tui
