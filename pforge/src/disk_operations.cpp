#include "pforge/disk_operations.hpp"
#include "pforge/io_utils.hpp"

#include <system_error>  // for error_code

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace {

auto run_checked(const std::vector<std::string>& args) noexcept -> pforge::disk::OperationResult {
    auto result = pforge::utils::exec_capture(args);
    if (!result.success()) {
        spdlog::error("'{}' failed with exit code {}: {}", fmt::join(args, " "), result.exit_code, result.output);
        if (result.output.empty()) {
            result.output = fmt::format(FMT_COMPILE("{} exited with code {}"), args.front(), result.exit_code);
        }
        return std::unexpected(std::move(result.output));
    }
    if (!result.output.empty()) {
        spdlog::debug("{}: {}", args.front(), result.output);
    }
    return {};
}

}  // namespace

namespace pforge::disk {

auto make_partition_request(const plan::PartitionSpec& spec) -> PartitionRequest {
    return PartitionRequest{
        .index     = spec.index,
        .size      = plan::size_to_sgdisk(spec.size),
        .type_code = std::string{plan::gpt_type_code(spec.role)},
        .label     = plan::gpt_partition_label(spec),
    };
}

auto gen_sgdisk_create_args(std::string_view device, const PartitionRequest& request) -> std::vector<std::string> {
    // -n <partnum>:<start>:<end>, start 0 is the next free sector
    return {
        "sgdisk"s,
        "-n"s,
        fmt::format(FMT_COMPILE("{}:0:{}"), request.index, request.size),
        "-t"s,
        fmt::format(FMT_COMPILE("{}:{}"), request.index, request.type_code),
        "-c"s,
        fmt::format(FMT_COMPILE("{}:{}"), request.index, request.label),
        std::string{device},
    };
}

auto gen_mkfs_args(std::string_view partition, fs::FilesystemType fs_type, std::string_view label) -> std::vector<std::string> {
    using fs::FilesystemType;

    const std::string mkfs_bin{fs::get_mkfs_binary(fs_type)};
    const std::string label_str{label};
    const std::string partition_str{partition};

    /* clang-format off */
    switch (fs_type) {
    case FilesystemType::Fat32:
        return {mkfs_bin, "-F"s, "32"s, partition_str};
    case FilesystemType::Swap:
        return {mkfs_bin, partition_str};
    case FilesystemType::Ext4:
        return {mkfs_bin, "-F"s, "-L"s, label_str, partition_str};
    case FilesystemType::Xfs:
    case FilesystemType::Btrfs:
        return {mkfs_bin, "-f"s, "-L"s, label_str, partition_str};
    case FilesystemType::Ntfs:
        // -Q quick format, skips zeroing the whole partition
        return {mkfs_bin, "-Q"s, "-F"s, "-L"s, label_str, partition_str};
    case FilesystemType::Exfat:
        return {mkfs_bin, "-n"s, label_str, partition_str};
    case FilesystemType::Unknown:
    default:
        return {};
    }
    /* clang-format on */
}

auto ProcessDiskOperations::wipe_table(std::string_view device) noexcept -> OperationResult {
    return run_checked({"sgdisk"s, "--zap-all"s, std::string{device}});
}

auto ProcessDiskOperations::create_partition(std::string_view device, const PartitionRequest& request) noexcept -> OperationResult {
    return run_checked(gen_sgdisk_create_args(device, request));
}

auto ProcessDiskOperations::refresh_table(std::string_view device) noexcept -> OperationResult {
    return run_checked({"partprobe"s, std::string{device}});
}

auto ProcessDiskOperations::wipe_signatures(std::string_view partition) noexcept -> OperationResult {
    return run_checked({"wipefs"s, "-a"s, std::string{partition}});
}

auto ProcessDiskOperations::format_filesystem(std::string_view partition, fs::FilesystemType fs_type, std::string_view label) noexcept -> OperationResult {
    auto&& mkfs_args = gen_mkfs_args(partition, fs_type, label);
    if (mkfs_args.empty()) {
        return std::unexpected(fmt::format(FMT_COMPILE("no formatter for filesystem '{}'"), fs::filesystem_type_to_string(fs_type)));
    }
    return run_checked(mkfs_args);
}

auto ProcessDiskOperations::make_swap(std::string_view partition) noexcept -> OperationResult {
    return run_checked(gen_mkfs_args(partition, fs::FilesystemType::Swap, {}));
}

auto ProcessDiskOperations::activate_swap(std::string_view partition) noexcept -> OperationResult {
    return run_checked({"swapon"s, std::string{partition}});
}

auto ProcessDiskOperations::make_directory(std::string_view path) noexcept -> OperationResult {
    if (utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv) {
        return {};
    }

    std::error_code err{};
    std::filesystem::create_directories(path, err);
    if (err) {
        spdlog::error("Failed to create directory '{}': {}", path, err.message());
        return std::unexpected(err.message());
    }
    return {};
}

auto ProcessDiskOperations::mount_device(std::string_view device, std::string_view mountpoint) noexcept -> OperationResult {
    return run_checked({"mount"s, std::string{device}, std::string{mountpoint}});
}

auto ProcessDiskOperations::set_permissions(std::string_view path, std::filesystem::perms perms) noexcept -> OperationResult {
    if (utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv) {
        return {};
    }

    std::error_code err{};
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace, err);
    if (err) {
        spdlog::error("Failed to set permissions on '{}': {}", path, err.message());
        return std::unexpected(err.message());
    }
    return {};
}

}  // namespace pforge::disk
