#include "doctest_compatibility.h"

#include "widgets.hpp"

#include <string>
#include <string_view>

using namespace std::string_view_literals;
using namespace std::string_literals;

using pforge::fs::FilesystemType;

TEST_CASE("menu entries")
{
    using tui::detail::disk_entry;
    using tui::detail::filesystem_entry;

    SECTION("filesystem")
    {
        CHECK_EQ(filesystem_entry(FilesystemType::Xfs), "xfs    (high performance, good for large storage)"s);
        CHECK_EQ(filesystem_entry(FilesystemType::Ext4), "ext4   (common default, stable, widely supported)"s);
        CHECK_EQ(filesystem_entry(FilesystemType::Fat32), "fat32"s);
    }
    SECTION("disk with model")
    {
        const pforge::disk::DiskInfo disk{.device = "/dev/sda"s, .model = "Samsung SSD 860"s, .size = 500107862016ULL};
        CHECK_EQ(disk_entry(disk), "/dev/sda             Size: 465.8GiB   Samsung SSD 860"s);
    }
    SECTION("disk without model")
    {
        const pforge::disk::DiskInfo disk{.device = "/dev/nvme0n1"s, .size = 2ULL * 1024 * 1024 * 1024 * 1024};
        CHECK_EQ(disk_entry(disk), "/dev/nvme0n1         Size: 2.0TiB"s);
    }
}

TEST_CASE("size input hint")
{
    CHECK_EQ(tui::detail::size_error_hint("12T"sv, pforge::plan::SizeError::InvalidSizeFormat),
        "'12T': Invalid size format. Use numbers followed by M or G (e.g., 512M, 8G)."s);
}
