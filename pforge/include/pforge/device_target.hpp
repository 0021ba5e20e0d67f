#ifndef DEVICE_TARGET_HPP
#define DEVICE_TARGET_HPP

#include <cstdint>      // for uint32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace pforge::disk {

/// @brief Whether partitions of the device are named with a 'p' infix.
/// Devices ending in a digit (e.g /dev/nvme0n1, /dev/mmcblk0) need it.
constexpr auto needs_partition_infix(std::string_view device) noexcept -> bool {
    return !device.empty() && device.back() >= '0' && device.back() <= '9';
}

/// @brief Builds partition device path, e.g /dev/sda + 1 -> /dev/sda1, /dev/nvme0n1 + 1 -> /dev/nvme0n1p1
auto partition_device_path(std::string_view device, std::uint32_t index) -> std::string;

/// @brief Selected block device
struct DeviceTarget final {
    std::string device{};

    [[nodiscard]] auto partition_path(std::uint32_t index) const -> std::string {
        return disk::partition_device_path(device, index);
    }
};

}  // namespace pforge::disk

#endif  // DEVICE_TARGET_HPP
