#ifndef DISK_OPERATIONS_HPP
#define DISK_OPERATIONS_HPP

#include "pforge/partition_spec.hpp"

#include <cstdint>      // for uint32_t
#include <expected>     // for expected
#include <filesystem>   // for perms
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::disk {

/// @brief Arguments of a single partition creation call.
struct PartitionRequest final {
    std::uint32_t index{};
    /// sgdisk size argument, "+512M" or "0" for the remaining space
    std::string size{};
    /// GPT type code, e.g "ef00"
    std::string type_code{};
    /// GPT partition name, e.g "Linux Root"
    std::string label{};

    bool operator==(const PartitionRequest&) const = default;
};

/// @brief Derives partition creation arguments from planned spec.
auto make_partition_request(const plan::PartitionSpec& spec) -> PartitionRequest;

/// @brief Error value carries the external tool's output.
using OperationResult = std::expected<void, std::string>;

/// @brief Destructive device operations used by the executors.
class DiskOperations {
 public:
    virtual ~DiskOperations() noexcept = default;

    /// Destroys GPT and MBR data structures on the device.
    virtual auto wipe_table(std::string_view device) noexcept -> OperationResult = 0;
    /// Creates partition starting at the next free sector.
    virtual auto create_partition(std::string_view device, const PartitionRequest& request) noexcept -> OperationResult = 0;
    /// Informs the kernel of partition table changes.
    virtual auto refresh_table(std::string_view device) noexcept -> OperationResult = 0;
    /// Erases filesystem signatures, succeeds when there is none.
    virtual auto wipe_signatures(std::string_view partition) noexcept -> OperationResult = 0;
    virtual auto format_filesystem(std::string_view partition, fs::FilesystemType fs_type, std::string_view label) noexcept -> OperationResult = 0;
    virtual auto make_swap(std::string_view partition) noexcept -> OperationResult = 0;
    virtual auto activate_swap(std::string_view partition) noexcept -> OperationResult = 0;
    /// Creates directory with all missing parents.
    virtual auto make_directory(std::string_view path) noexcept -> OperationResult = 0;
    virtual auto mount_device(std::string_view device, std::string_view mountpoint) noexcept -> OperationResult = 0;
    virtual auto set_permissions(std::string_view path, std::filesystem::perms perms) noexcept -> OperationResult = 0;
};

/// @brief Builds the sgdisk arguments creating the partition.
auto gen_sgdisk_create_args(std::string_view device, const PartitionRequest& request) -> std::vector<std::string>;

/// @brief Builds the mkfs arguments for the filesystem.
/// @return Arguments including the target partition, empty for Unknown.
auto gen_mkfs_args(std::string_view partition, fs::FilesystemType fs_type, std::string_view label) -> std::vector<std::string>;

/// @brief Runs the system utilities (sgdisk, partprobe, wipefs, mkfs.*, swapon, mount).
class ProcessDiskOperations final : public DiskOperations {
 public:
    auto wipe_table(std::string_view device) noexcept -> OperationResult override;
    auto create_partition(std::string_view device, const PartitionRequest& request) noexcept -> OperationResult override;
    auto refresh_table(std::string_view device) noexcept -> OperationResult override;
    auto wipe_signatures(std::string_view partition) noexcept -> OperationResult override;
    auto format_filesystem(std::string_view partition, fs::FilesystemType fs_type, std::string_view label) noexcept -> OperationResult override;
    auto make_swap(std::string_view partition) noexcept -> OperationResult override;
    auto activate_swap(std::string_view partition) noexcept -> OperationResult override;
    auto make_directory(std::string_view path) noexcept -> OperationResult override;
    auto mount_device(std::string_view device, std::string_view mountpoint) noexcept -> OperationResult override;
    auto set_permissions(std::string_view path, std::filesystem::perms perms) noexcept -> OperationResult override;
};

}  // namespace pforge::disk

#endif  // DISK_OPERATIONS_HPP
