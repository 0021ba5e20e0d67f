#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include <cstdint>      // for uint64_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::disk {

/// @brief Information about a partition on a disk
struct PartitionInfo final {
    /// Partition device path
    std::string device;
    /// Filesystem type
    std::string fstype;
    /// Partition size in bytes
    std::uint64_t size{0};
    /// Mountpoint if mounted
    std::optional<std::string> mountpoint;
};

/// @brief Information about a disk device
struct DiskInfo final {
    /// Disk device path
    std::string device;
    /// Disk model name
    std::optional<std::string> model;
    /// Total disk size in bytes
    std::uint64_t size{0};
    /// Transport (sata, nvme, usb, ...), empty when lsblk does not report one
    std::string transport;
    /// Whether the disk is read-only
    bool is_read_only{false};
    /// List of partitions on this disk
    std::vector<PartitionInfo> partitions;
};

/// @brief Parses JSON output from lsblk command into DiskInfo structures
/// @param json_output The JSON string from lsblk -J command
/// @return vector of DiskInfo (type "disk" only), empty on error
auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo>;

/// @brief Lists all disk devices with their partitions
/// @return Optional vector of DiskInfo, std::nullopt on failure
auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>>;

/// @brief Parses disk path from partition path, keeping /dev/ prefix
/// e.g /dev/sda3 -> /dev/sda, /dev/nvme0n1p2 -> /dev/nvme0n1
auto parent_disk_of(std::string_view partition) noexcept -> std::string_view;

/// @brief Resolves the system disk from findmnt SOURCE of / and its lsblk PKNAME.
/// Falls back to the parent of a /dev/ source when PKNAME is empty.
/// @return disk device path, std::nullopt for sources like overlay or tmpfs
auto system_disk_from(std::string_view root_source, std::string_view pkname) noexcept -> std::optional<std::string>;

/// @brief Finds the disk which hosts the running system (the one mounted at /)
/// @return disk device path, std::nullopt if it cannot be determined
auto get_system_disk() noexcept -> std::optional<std::string>;

/// @brief Disks the operator may select: system disk and read-only disks are excluded.
auto filter_candidate_disks(const std::vector<DiskInfo>& disks, std::string_view system_disk) noexcept -> std::vector<DiskInfo>;

/// @brief Formats a size in bytes to human-readable string
/// @param bytes Size in bytes
/// @return Human-readable size string
auto format_size(std::uint64_t bytes) noexcept -> std::string;

}  // namespace pforge::disk

#endif  // BLOCK_DEVICES_HPP
