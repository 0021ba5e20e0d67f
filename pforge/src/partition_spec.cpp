#include "pforge/partition_spec.hpp"

#include <string>       // for string_literals
#include <string_view>  // for string_view_literals

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace pforge::fs {

auto filesystem_type_to_string(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Fat32:
        return "fat32"sv;
    case FilesystemType::Ext4:
        return "ext4"sv;
    case FilesystemType::Xfs:
        return "xfs"sv;
    case FilesystemType::Btrfs:
        return "btrfs"sv;
    case FilesystemType::Ntfs:
        return "ntfs"sv;
    case FilesystemType::Exfat:
        return "exfat"sv;
    case FilesystemType::Swap:
        return "swap"sv;
    case FilesystemType::Unknown:
    default:
        return "unknown"sv;
    }
}

auto string_to_filesystem_type(std::string_view fs_name) noexcept -> FilesystemType {
    if (fs_name == "fat32"sv || fs_name == "vfat"sv) {
        return FilesystemType::Fat32;
    } else if (fs_name == "ext4"sv) {
        return FilesystemType::Ext4;
    } else if (fs_name == "xfs"sv) {
        return FilesystemType::Xfs;
    } else if (fs_name == "btrfs"sv) {
        return FilesystemType::Btrfs;
    } else if (fs_name == "ntfs"sv) {
        return FilesystemType::Ntfs;
    } else if (fs_name == "exfat"sv) {
        return FilesystemType::Exfat;
    } else if (fs_name == "swap"sv || fs_name == "linuxswap"sv) {
        return FilesystemType::Swap;
    }
    return FilesystemType::Unknown;
}

auto get_mkfs_binary(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Fat32:
        return "mkfs.fat"sv;
    case FilesystemType::Ext4:
        return "mkfs.ext4"sv;
    case FilesystemType::Xfs:
        return "mkfs.xfs"sv;
    case FilesystemType::Btrfs:
        return "mkfs.btrfs"sv;
    case FilesystemType::Ntfs:
        return "mkfs.ntfs"sv;
    case FilesystemType::Exfat:
        return "mkfs.exfat"sv;
    case FilesystemType::Swap:
        return "mkswap"sv;
    case FilesystemType::Unknown:
    default:
        return ""sv;
    }
}

}  // namespace pforge::fs

namespace pforge::plan {

auto partition_role_to_string(PartitionRole role) noexcept -> std::string_view {
    switch (role) {
    case PartitionRole::Efi:
        return "efi"sv;
    case PartitionRole::Swap:
        return "swap"sv;
    case PartitionRole::Root:
        return "root"sv;
    case PartitionRole::Home:
        return "home"sv;
    case PartitionRole::Custom:
        return "custom"sv;
    }
    return "unknown"sv;
}

auto string_to_partition_role(std::string_view role_str) noexcept -> std::optional<PartitionRole> {
    if (role_str == "efi"sv) {
        return PartitionRole::Efi;
    }
    if (role_str == "swap"sv) {
        return PartitionRole::Swap;
    }
    if (role_str == "root"sv) {
        return PartitionRole::Root;
    }
    if (role_str == "home"sv) {
        return PartitionRole::Home;
    }
    if (role_str == "custom"sv) {
        return PartitionRole::Custom;
    }
    return std::nullopt;
}

auto size_to_string(const PartitionSize& size) -> std::string {
    if (const auto* fixed = std::get_if<FixedSize>(&size)) {
        return fmt::format(FMT_COMPILE("{}{}"), fixed->magnitude, (fixed->unit == SizeUnit::Gibibytes) ? 'G' : 'M');
    }
    return "remaining space"s;
}

auto size_to_sgdisk(const PartitionSize& size) -> std::string {
    // sgdisk: "+SIZE" is relative to the start sector, "0" extends to the end of free space
    if (is_remaining_space(size)) {
        return "0"s;
    }
    return fmt::format(FMT_COMPILE("+{}"), size_to_string(size));
}

auto gpt_type_code(PartitionRole role) noexcept -> std::string_view {
    switch (role) {
    case PartitionRole::Efi:
        // EFI System partition, C12A7328-F81F-11D2-BA4B-00A0C93EC93B
        return "ef00"sv;
    case PartitionRole::Swap:
        // Linux swap, 0657FD6D-A4AB-43C4-84E5-0933C84B4F4F
        return "8200"sv;
    case PartitionRole::Root:
    case PartitionRole::Home:
    case PartitionRole::Custom:
    default:
        // Linux filesystem, 0FC63DAF-8483-4772-8E79-3D69D8477DE4
        return "8300"sv;
    }
}

auto gpt_partition_label(const PartitionSpec& spec) -> std::string {
    switch (spec.role) {
    case PartitionRole::Efi:
        return "EFI System"s;
    case PartitionRole::Swap:
        return "Linux Swap"s;
    case PartitionRole::Root:
        return "Linux Root"s;
    case PartitionRole::Home:
        return "Linux Home"s;
    case PartitionRole::Custom:
    default:
        return fmt::format(FMT_COMPILE("Linux {}"), spec.name);
    }
}

auto volume_label(const PartitionSpec& spec) -> std::string {
    switch (spec.role) {
    case PartitionRole::Efi:
        return "EFI"s;
    case PartitionRole::Swap:
        return "swap"s;
    case PartitionRole::Root:
        return "root"s;
    case PartitionRole::Home:
        return "home"s;
    case PartitionRole::Custom:
    default:
        break;
    }

    std::string_view name{spec.name};
    const auto pos = name.find_first_not_of('/');
    if (pos == std::string_view::npos) {
        return {};
    }
    return std::string{name.substr(pos)};
}

auto display_name(const PartitionSpec& spec) -> std::string {
    switch (spec.role) {
    case PartitionRole::Efi:
        return "EFI"s;
    case PartitionRole::Swap:
        return "Swap"s;
    case PartitionRole::Root:
        return "Root"s;
    case PartitionRole::Home:
        return "Home"s;
    case PartitionRole::Custom:
    default:
        return spec.name;
    }
}

}  // namespace pforge::plan
