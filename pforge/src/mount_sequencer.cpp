#include "pforge/mount_sequencer.hpp"

#include <filesystem>  // for path, perms
#include <utility>     // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// rwxrwxrwt
constexpr auto STICKY_TMP_PERMS = std::filesystem::perms::all | std::filesystem::perms::sticky_bit;

}  // namespace

namespace pforge::mount {

auto mount_stage_to_string(MountStage stage) noexcept -> std::string_view {
    switch (stage) {
    case MountStage::SwapActivationFailed:
        return "SwapActivationFailed"sv;
    case MountStage::DirectoryCreationFailed:
        return "DirectoryCreationFailed"sv;
    case MountStage::MountFailed:
        return "MountFailed"sv;
    case MountStage::PermissionsFailed:
        return "PermissionsFailed"sv;
    }
    return "unknown"sv;
}

auto mount_failure_to_string(const MountFailure& failure) -> std::string {
    return fmt::format(FMT_COMPILE("{}({})"), mount_stage_to_string(failure.stage), failure.path);
}

auto target_path(std::string_view root_mountpoint, std::string_view mountpoint) -> std::string {
    while (root_mountpoint.size() > 1 && root_mountpoint.ends_with('/')) {
        root_mountpoint.remove_suffix(1);
    }
    while (mountpoint.starts_with('/')) {
        mountpoint.remove_prefix(1);
    }
    if (root_mountpoint == "/"sv) {
        return fmt::format(FMT_COMPILE("/{}"), mountpoint);
    }
    return fmt::format(FMT_COMPILE("{}/{}"), root_mountpoint, mountpoint);
}

auto validate_custom_mountpoint(std::string_view mountpoint) noexcept -> std::expected<void, std::string> {
    if (!mountpoint.starts_with('/') || mountpoint.find_first_not_of('/') == std::string_view::npos) {
        return std::unexpected(fmt::format(FMT_COMPILE("mountpoint '{}' must be an absolute path below the root"), mountpoint));
    }
    // "." and ".." would resolve to the root itself or escape it
    for (const auto& component : std::filesystem::path{mountpoint}) {
        if (const auto& name = component.native(); name == "."sv || name == ".."sv) {
            return std::unexpected(fmt::format(FMT_COMPILE("mountpoint '{}' must not contain '.' or '..' components"), mountpoint));
        }
    }
    return {};
}

auto validate_mount_request(const MountRequest& request) noexcept -> std::expected<void, std::string> {
    if (request.swap_device.empty()) {
        return std::unexpected("swap device is not set");
    }
    if (request.root_device.empty()) {
        return std::unexpected("root device is not set");
    }
    if (request.efi_device.empty()) {
        return std::unexpected("EFI device is not set");
    }
    if (request.root_mountpoint.empty() || !request.root_mountpoint.starts_with('/')) {
        return std::unexpected(fmt::format(FMT_COMPILE("root mountpoint '{}' is not an absolute path"), request.root_mountpoint));
    }
    for (const auto& custom : request.custom_mounts) {
        if (custom.device.empty()) {
            return std::unexpected(fmt::format(FMT_COMPILE("custom mountpoint '{}' has no device"), custom.mountpoint));
        }
        if (auto res = validate_custom_mountpoint(custom.mountpoint); !res) {
            return std::unexpected(fmt::format(FMT_COMPILE("{} ({})"), res.error(), custom.device));
        }
    }
    return {};
}

MountSequencer::MountSequencer(disk::DiskOperations& disk_ops, ProgressCallback progress) noexcept
  : m_disk_ops(disk_ops), m_progress(std::move(progress)) { }

auto MountSequencer::step(MountStage stage, std::string_view path, std::string_view description, auto&& operation) noexcept -> std::expected<void, MountFailure> {
    if (m_progress) {
        m_progress(ProgressEvent::Started, description);
    }
    if (auto result = operation(); !result) {
        if (m_progress) {
            m_progress(ProgressEvent::Failed, description);
        }
        spdlog::error("[mount] {}({}): {}", mount_stage_to_string(stage), path, result.error());
        return std::unexpected(MountFailure{.stage = stage, .path = std::string{path}, .diagnostic = std::move(result.error())});
    }
    if (m_progress) {
        m_progress(ProgressEvent::Completed, description);
    }
    spdlog::info("[mount] {}: ok", description);
    return {};
}

auto MountSequencer::run(const MountRequest& request) noexcept -> std::expected<void, MountFailure> {
    const auto& root = request.root_mountpoint;

    // swap
    const auto& swap_desc = fmt::format(FMT_COMPILE("Activating swap partition ({})"), request.swap_device);
    if (auto res = step(MountStage::SwapActivationFailed, request.swap_device, swap_desc,
            [&] { return m_disk_ops.activate_swap(request.swap_device); });
        !res) {
        return res;
    }

    // mount points, parents first
    const auto& efi_dir = target_path(root, "/efi"sv);
    std::vector<std::string> directories{root, efi_dir};
    for (const auto& custom : request.custom_mounts) {
        directories.emplace_back(target_path(root, custom.mountpoint));
    }
    for (const auto& dir : directories) {
        const auto& dir_desc = fmt::format(FMT_COMPILE("Creating mount point {}"), dir);
        if (auto res = step(MountStage::DirectoryCreationFailed, dir, dir_desc,
                [&] { return m_disk_ops.make_directory(dir); });
            !res) {
            return res;
        }
    }

    // root before everything nested below it
    const auto& mount_one = [&](std::string_view device, std::string_view dir) {
        const auto& mount_desc = fmt::format(FMT_COMPILE("Mounting {} to {}"), device, dir);
        return step(MountStage::MountFailed, dir, mount_desc,
            [&] { return m_disk_ops.mount_device(device, dir); });
    };
    if (auto res = mount_one(request.root_device, root); !res) {
        return res;
    }
    if (auto res = mount_one(request.efi_device, efi_dir); !res) {
        return res;
    }
    for (const auto& custom : request.custom_mounts) {
        if (auto res = mount_one(custom.device, target_path(root, custom.mountpoint)); !res) {
            return res;
        }
    }

    // temporary directories
    const auto& tmp_dir = target_path(root, "/tmp"sv);
    const auto& tmp_desc = fmt::format(FMT_COMPILE("Setting permissions for {}"), tmp_dir);
    if (auto res = step(MountStage::PermissionsFailed, tmp_dir, tmp_desc,
            [&]() -> disk::OperationResult {
                if (auto created = m_disk_ops.make_directory(tmp_dir); !created) {
                    return created;
                }
                return m_disk_ops.set_permissions(tmp_dir, STICKY_TMP_PERMS);
            });
        !res) {
        return res;
    }

    const auto& var_tmp_dir = target_path(root, "/var/tmp"sv);
    if (auto res = m_disk_ops.set_permissions(var_tmp_dir, STICKY_TMP_PERMS); !res) {
        spdlog::warn("[mount] Could not set permissions for {}: {}", var_tmp_dir, res.error());
    } else {
        spdlog::info("[mount] Setting permissions for {}: ok", var_tmp_dir);
    }
    return {};
}

}  // namespace pforge::mount
