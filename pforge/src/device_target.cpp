#include "pforge/device_target.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

namespace pforge::disk {

auto partition_device_path(std::string_view device, std::uint32_t index) -> std::string {
    if (needs_partition_infix(device)) {
        return fmt::format(FMT_COMPILE("{}p{}"), device, index);
    }
    return fmt::format(FMT_COMPILE("{}{}"), device, index);
}

}  // namespace pforge::disk
