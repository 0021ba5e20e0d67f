#ifndef MOUNT_SEQUENCER_HPP
#define MOUNT_SEQUENCER_HPP

#include "pforge/disk_operations.hpp"
#include "pforge/progress.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::mount {

/// @brief Custom partition mounted below the root.
struct CustomMount final {
    std::string device{};
    /// Absolute mount point relative to the root, e.g /home
    std::string mountpoint{};

    bool operator==(const CustomMount&) const = default;
};

struct MountRequest final {
    std::string swap_device{};
    std::string root_device{};
    std::string efi_device{};
    std::vector<CustomMount> custom_mounts{};
    std::string root_mountpoint{"/mnt/gentoo"};
};

enum class MountStage : std::uint8_t {
    SwapActivationFailed,
    DirectoryCreationFailed,
    MountFailed,
    PermissionsFailed
};

struct MountFailure final {
    MountStage stage{MountStage::MountFailed};
    /// Device or directory the failed step operated on.
    std::string path{};
    std::string diagnostic{};

    bool operator==(const MountFailure&) const = default;
};

auto mount_stage_to_string(MountStage stage) noexcept -> std::string_view;

/// @brief Formats failure, e.g "MountFailed(/mnt/gentoo/efi)"
auto mount_failure_to_string(const MountFailure& failure) -> std::string;

/// @brief Joins root and mountpoint, e.g /mnt/gentoo + /home -> /mnt/gentoo/home
auto target_path(std::string_view root_mountpoint, std::string_view mountpoint) -> std::string;

/// @brief Checks that mountpoint is an absolute path strictly below the root,
/// e.g /home or /var/log. Paths with "." or ".." components are rejected.
auto validate_custom_mountpoint(std::string_view mountpoint) noexcept -> std::expected<void, std::string>;

/// @brief Checks that all devices are set and custom mountpoints are absolute paths below root.
/// @return Description of the first problem found.
auto validate_mount_request(const MountRequest& request) noexcept -> std::expected<void, std::string>;

/// @brief Activates swap and mounts root, EFI and custom partitions.
///
/// Order: swapon, directories (root, root/efi, custom), mount root, mount EFI,
/// mount custom partitions in the given order, sticky permissions on root/tmp
/// and root/var/tmp. Setting root/var/tmp permissions only warns on failure.
class MountSequencer final {
 public:
    explicit MountSequencer(disk::DiskOperations& disk_ops, ProgressCallback progress = {}) noexcept;

    auto run(const MountRequest& request) noexcept -> std::expected<void, MountFailure>;

 private:
    auto step(MountStage stage, std::string_view path, std::string_view description, auto&& operation) noexcept -> std::expected<void, MountFailure>;

    disk::DiskOperations& m_disk_ops;
    ProgressCallback m_progress;
};

}  // namespace pforge::mount

#endif  // MOUNT_SEQUENCER_HPP
