#include "doctest_compatibility.h"

#include "pforge/mtab.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace std::string_view_literals;
using namespace std::string_literals;

static constexpr auto MTAB_RUNNING_SYSTEM_TEST = R"(
proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0

sys /sys sysfs rw,nosuid,nodev,noexec,relatime 0 0
dev /dev devtmpfs rw,nosuid,relatime,size=8104116k,nr_inodes=2026029,mode=755,inode64 0 0
# test string
/dev/nvme0n1p3 / btrfs rw,relatime,compress=zstd:3,ssd,discard=async,space_cache,subvolid=5,subvol=/ 0 0
tmpfs /dev/shm tmpfs rw,nosuid,nodev,inode64 0 0
 # test something
/dev/nvme0n1p1 /boot vfat rw,relatime,fmask=0022,dmask=0022,codepage=437,iocharset=ascii,shortname=mixed,utf8,errors=remount-ro 0 0
/dev/sdb1 /run/media/user/usb exfat rw,nosuid,nodev,relatime 0 0
/dev/sdab2 /run/media/user/other ext4 rw,relatime 0 0
/dev/nvme0n10p1 /mnt/other ext4 rw,relatime 0 0
tmpfs /tmp tmpfs rw,nosuid,nodev,nr_inodes=1048576,inode64 0 0
)"sv;

TEST_CASE("mtab test")
{
    using pforge::mtab::MTabEntry;

    SECTION("running system")
    {
        const auto& entries = pforge::mtab::parse_mtab_content(MTAB_RUNNING_SYSTEM_TEST);
        REQUIRE_EQ(entries.size(), 10);
        CHECK_EQ(entries[0], MTabEntry{.device = "proc"s, .mountpoint = "/proc"s});
        CHECK_EQ(entries[3], MTabEntry{.device = "/dev/nvme0n1p3"s, .mountpoint = "/"s});
        CHECK_EQ(entries[9], MTabEntry{.device = "tmpfs"s, .mountpoint = "/tmp"s});
    }
    SECTION("mounted partitions of disk")
    {
        const auto& entries = pforge::mtab::parse_mtab_content(MTAB_RUNNING_SYSTEM_TEST);

        const auto& nvme_mounts = pforge::mtab::mounted_partitions(entries, "/dev/nvme0n1"sv);
        const std::vector<MTabEntry> expected_nvme{
            MTabEntry{.device = "/dev/nvme0n1p3"s, .mountpoint = "/"s},
            MTabEntry{.device = "/dev/nvme0n1p1"s, .mountpoint = "/boot"s},
        };
        REQUIRE_EQ(nvme_mounts, expected_nvme);

        const auto& sdb_mounts = pforge::mtab::mounted_partitions(entries, "/dev/sdb"sv);
        REQUIRE_EQ(sdb_mounts.size(), 1);
        CHECK_EQ(sdb_mounts[0].mountpoint, "/run/media/user/usb"s);

        CHECK(pforge::mtab::mounted_partitions(entries, "/dev/sda"sv).empty());
    }
    SECTION("partition of disk")
    {
        using pforge::mtab::is_partition_of;
        CHECK(is_partition_of("/dev/sda1"sv, "/dev/sda"sv));
        CHECK(is_partition_of("/dev/sda"sv, "/dev/sda"sv));
        CHECK(is_partition_of("/dev/nvme0n1p2"sv, "/dev/nvme0n1"sv));
        CHECK_FALSE(is_partition_of("/dev/sdab1"sv, "/dev/sda"sv));
        CHECK_FALSE(is_partition_of("/dev/nvme0n10p1"sv, "/dev/nvme0n1"sv));
        CHECK_FALSE(is_partition_of("/dev/sda1"sv, ""sv));
    }
    SECTION("file")
    {
        const auto& mtab_path = fs::temp_directory_path() / "pforge-unit-mtab.txt";
        {
            std::ofstream mtab_file{mtab_path};
            mtab_file << MTAB_RUNNING_SYSTEM_TEST;
        }
        const auto& entries = pforge::mtab::parse_mtab(mtab_path.native());
        fs::remove(mtab_path);
        REQUIRE(entries.has_value());
        CHECK_EQ(entries->size(), 10);
    }
    SECTION("empty file")
    {
        CHECK_FALSE(pforge::mtab::parse_mtab("/this/path/does/not/exist"sv).has_value());
        CHECK(pforge::mtab::parse_mtab_content(""sv).empty());
    }
}
