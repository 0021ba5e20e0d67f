#ifndef MTAB_HPP
#define MTAB_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::mtab {

struct MTabEntry {
    std::string device{};
    std::string mountpoint{};

    bool operator==(const MTabEntry&) const = default;
};

// Parse mtab
auto parse_mtab(std::string_view mtab_path = "/proc/self/mounts") noexcept -> std::optional<std::vector<MTabEntry>>;

// Parse mtab content
auto parse_mtab_content(std::string_view mtab_content) noexcept -> std::vector<MTabEntry>;

/// @brief Whether device is the disk itself or one of its partitions.
/// e.g /dev/sda1 of /dev/sda, /dev/nvme0n1p1 of /dev/nvme0n1, but not /dev/sdab of /dev/sda
auto is_partition_of(std::string_view device, std::string_view disk) noexcept -> bool;

/// @brief Entries whose device lives on the disk.
auto mounted_partitions(const std::vector<MTabEntry>& entries, std::string_view disk) noexcept -> std::vector<MTabEntry>;

}  // namespace pforge::mtab

#endif  // MTAB_HPP
