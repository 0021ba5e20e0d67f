#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "tool_config.hpp"

#include <cstdlib>  // for setenv, unsetenv
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

using pforge::fs::FilesystemType;
using pforge::plan::FixedSize;
using pforge::plan::PartitionRole;
using pforge::plan::RemainingSpace;
using pforge::plan::SizeUnit;

TEST_CASE("tool config parsing")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);

    SECTION("empty config returns defaults")
    {
        auto result = partforge::parse_tool_config(""sv);
        REQUIRE(result.has_value());

        auto& config = *result;
        REQUIRE(!config.headless_mode);
        REQUIRE_EQ(config.log_dir, "."sv);
        REQUIRE_EQ(config.mountpoint, "/mnt/gentoo"sv);
        REQUIRE_EQ(config.efi_size, "512M"sv);
        REQUIRE_EQ(config.swap_size, "8G"sv);
        REQUIRE(!config.device.has_value());
        REQUIRE(config.partitions.empty());
        REQUIRE(config.custom_mounts.empty());
    }
    SECTION("empty object returns defaults")
    {
        auto result = partforge::parse_tool_config("{}"sv);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->mountpoint, "/mnt/gentoo"sv);
        REQUIRE(!result->swap_device.has_value());
    }
    SECTION("valid complete config")
    {
        constexpr auto json = R"({
            "headless_mode": true,
            "log_dir": "/var/log/partforge",
            "mountpoint": "/mnt/target",
            "efi_size": "1G",
            "swap_size": "4G",
            "device": "/dev/nvme0n1",
            "partitions": [
                {"role": "root", "size": "100G", "fs_name": "btrfs"},
                {"role": "home", "size": "200G", "fs_name": "xfs"},
                {"role": "custom", "size": "0", "fs_name": "ext4", "name": "/var"}
            ],
            "swap_device": "/dev/nvme0n1p2",
            "root_device": "/dev/nvme0n1p3",
            "efi_device": "/dev/nvme0n1p1",
            "custom_mounts": [
                {"device": "/dev/nvme0n1p4", "mountpoint": "/home"}
            ]
        })"sv;

        auto result = partforge::parse_tool_config(json);
        REQUIRE(result.has_value());

        auto& config = *result;
        REQUIRE(config.headless_mode);
        REQUIRE_EQ(config.log_dir, "/var/log/partforge"sv);
        REQUIRE_EQ(config.mountpoint, "/mnt/target"sv);
        REQUIRE_EQ(config.efi_size, "1G"sv);
        REQUIRE_EQ(config.swap_size, "4G"sv);
        REQUIRE_EQ(config.device, "/dev/nvme0n1"sv);

        REQUIRE_EQ(config.partitions.size(), 3);
        REQUIRE_EQ(config.partitions[0].role, PartitionRole::Root);
        REQUIRE_EQ(config.partitions[0].size, "100G"sv);
        REQUIRE_EQ(config.partitions[0].filesystem, FilesystemType::Btrfs);
        REQUIRE_EQ(config.partitions[1].role, PartitionRole::Home);
        REQUIRE_EQ(config.partitions[1].filesystem, FilesystemType::Xfs);
        REQUIRE_EQ(config.partitions[2].role, PartitionRole::Custom);
        REQUIRE_EQ(config.partitions[2].name, "/var"sv);

        REQUIRE_EQ(config.swap_device, "/dev/nvme0n1p2"sv);
        REQUIRE_EQ(config.root_device, "/dev/nvme0n1p3"sv);
        REQUIRE_EQ(config.efi_device, "/dev/nvme0n1p1"sv);
        REQUIRE_EQ(config.custom_mounts.size(), 1);
        REQUIRE_EQ(config.custom_mounts[0].device, "/dev/nvme0n1p4"sv);
        REQUIRE_EQ(config.custom_mounts[0].mountpoint, "/home"sv);
    }
    SECTION("invalid JSON returns error")
    {
        auto result = partforge::parse_tool_config("{ not json"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("parse error"sv));
    }
    SECTION("non-object root returns error")
    {
        auto result = partforge::parse_tool_config("[1, 2]"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("object"sv));
    }
    SECTION("wrong type for headless_mode returns error")
    {
        auto result = partforge::parse_tool_config(R"({"headless_mode": "yes"})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("headless_mode"sv));
        REQUIRE(result.error().contains("boolean"sv));
    }
    SECTION("wrong type for string field returns error")
    {
        auto result = partforge::parse_tool_config(R"({"swap_device": 2})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("swap_device"sv));
    }
    SECTION("relative mountpoint returns error")
    {
        auto result = partforge::parse_tool_config(R"({"mountpoint": "mnt/gentoo"})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("mountpoint"sv));
    }
    SECTION("partitions not array returns error")
    {
        auto result = partforge::parse_tool_config(R"({"partitions": "root"})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("partitions"sv));
        REQUIRE(result.error().contains("array"sv));
    }
    SECTION("efi role in partitions returns error")
    {
        auto result = partforge::parse_tool_config(R"({"partitions": [{"role": "efi", "size": "512M", "fs_name": "fat32"}]})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("Invalid partition role"sv));
    }
    SECTION("unknown filesystem returns error")
    {
        auto result = partforge::parse_tool_config(R"({"partitions": [{"role": "root", "size": "0", "fs_name": "zfs"}]})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("zfs"sv));
    }
    SECTION("custom partition without name returns error")
    {
        auto result = partforge::parse_tool_config(R"({"partitions": [{"role": "custom", "size": "10G", "fs_name": "ext4"}]})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("name"sv));
    }
    SECTION("custom mount without mountpoint returns error")
    {
        auto result = partforge::parse_tool_config(R"({"custom_mounts": [{"device": "/dev/sda4"}]})"sv);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("mountpoint"sv));
    }
}

TEST_CASE("headless validation")
{
    SECTION("non-headless mode always validates")
    {
        partforge::ToolConfig config{};
        REQUIRE(partforge::validate_partition_headless(config).has_value());
        REQUIRE(partforge::validate_mount_headless(config).has_value());
    }
    SECTION("partition tool reports every missing field")
    {
        partforge::ToolConfig config{.headless_mode = true};
        auto result = partforge::validate_partition_headless(config);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error(), "HEADLESS mode requires: 'device', 'partitions'"sv);
    }
    SECTION("partition tool accepts device and partitions")
    {
        partforge::ToolConfig config{.headless_mode = true};
        config.device = "/dev/sdb";
        config.partitions.push_back({.role = PartitionRole::Root, .size = "0", .filesystem = FilesystemType::Ext4, .name = {}});
        REQUIRE(partforge::validate_partition_headless(config).has_value());
    }
    SECTION("mount tool reports every missing field")
    {
        partforge::ToolConfig config{.headless_mode = true};
        config.root_device = "/dev/sda3";
        auto result        = partforge::validate_mount_headless(config);
        REQUIRE(!result.has_value());
        REQUIRE_EQ(result.error(), "HEADLESS mode requires: 'swap_device', 'efi_device'"sv);
    }
}

TEST_CASE("build plan from config")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);

    partforge::ToolConfig config{};

    SECTION("default sizes with root taking remaining space")
    {
        config.partitions.push_back({.role = PartitionRole::Root, .size = "", .filesystem = FilesystemType::Ext4, .name = {}});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(plan.has_value());
        REQUIRE_EQ(plan->size(), 3);

        const auto& specs = plan->specs();
        REQUIRE_EQ(specs[0].role, PartitionRole::Efi);
        REQUIRE_EQ(specs[0].filesystem, FilesystemType::Fat32);
        REQUIRE(specs[0].size == pforge::plan::PartitionSize{FixedSize{.magnitude = 512, .unit = SizeUnit::Mebibytes}});
        REQUIRE_EQ(specs[1].role, PartitionRole::Swap);
        REQUIRE_EQ(specs[1].filesystem, FilesystemType::Swap);
        REQUIRE(specs[1].size == pforge::plan::PartitionSize{FixedSize{.magnitude = 8, .unit = SizeUnit::Gibibytes}});
        REQUIRE_EQ(specs[2].role, PartitionRole::Root);
        REQUIRE(pforge::plan::is_remaining_space(specs[2].size));
        REQUIRE_EQ(specs[2].index, 3);
    }
    SECTION("home and custom partitions keep their order")
    {
        config.efi_size = "1G";
        config.partitions.push_back({.role = PartitionRole::Root, .size = "50G", .filesystem = FilesystemType::Btrfs, .name = {}});
        config.partitions.push_back({.role = PartitionRole::Home, .size = "100G", .filesystem = FilesystemType::Xfs, .name = {}});
        config.partitions.push_back({.role = PartitionRole::Custom, .size = "0", .filesystem = FilesystemType::Ext4, .name = "/var"});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(plan.has_value());
        REQUIRE_EQ(plan->size(), 5);

        const auto& specs = plan->specs();
        REQUIRE(specs[0].size == pforge::plan::PartitionSize{FixedSize{.magnitude = 1, .unit = SizeUnit::Gibibytes}});
        REQUIRE_EQ(specs[3].role, PartitionRole::Home);
        REQUIRE_EQ(specs[3].index, 4);
        REQUIRE_EQ(specs[4].name, "/var"sv);
        REQUIRE_EQ(specs[4].index, 5);
        REQUIRE(pforge::plan::is_remaining_space(specs[4].size));
    }
    SECTION("invalid efi size is rejected")
    {
        config.efi_size = "512K";
        config.partitions.push_back({.role = PartitionRole::Root, .size = "0", .filesystem = FilesystemType::Ext4, .name = {}});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("efi_size"sv));
    }
    SECTION("remaining space on swap is rejected")
    {
        config.swap_size = "0";
        config.partitions.push_back({.role = PartitionRole::Root, .size = "0", .filesystem = FilesystemType::Ext4, .name = {}});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("swap_size"sv));
    }
    SECTION("home without explicit size is rejected")
    {
        config.partitions.push_back({.role = PartitionRole::Root, .size = "20G", .filesystem = FilesystemType::Ext4, .name = {}});
        config.partitions.push_back({.role = PartitionRole::Home, .size = "0", .filesystem = FilesystemType::Ext4, .name = {}});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(!plan.has_value());
        REQUIRE(plan.error().contains("home"sv));
    }
    SECTION("partition after remaining space is rejected")
    {
        config.partitions.push_back({.role = PartitionRole::Root, .size = "0", .filesystem = FilesystemType::Ext4, .name = {}});
        config.partitions.push_back({.role = PartitionRole::Custom, .size = "10G", .filesystem = FilesystemType::Ext4, .name = "/srv"});

        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(!plan.has_value());
        REQUIRE_EQ(plan.error(), "custom partition: "s + std::string{pforge::plan::plan_error_to_string(pforge::plan::PlanError::RemainingSpaceNotLast)});
    }
    SECTION("missing root is incomplete")
    {
        auto plan = partforge::build_plan_from_config(config);
        REQUIRE(!plan.has_value());
        REQUIRE_EQ(plan.error(), pforge::plan::plan_error_to_string(pforge::plan::PlanError::IncompletePlan));
    }
}

TEST_CASE("mount request from config")
{
    partforge::ToolConfig config{};
    config.mountpoint   = "/mnt/target";
    config.swap_device  = "/dev/sda2";
    config.root_device  = "/dev/sda3";
    config.efi_device   = "/dev/sda1";
    config.custom_mounts = {{.device = "/dev/sda4", .mountpoint = "/home"}};

    const auto& request = partforge::mount_request_from_config(config);
    REQUIRE_EQ(request.swap_device, "/dev/sda2"sv);
    REQUIRE_EQ(request.root_device, "/dev/sda3"sv);
    REQUIRE_EQ(request.efi_device, "/dev/sda1"sv);
    REQUIRE_EQ(request.root_mountpoint, "/mnt/target"sv);
    REQUIRE_EQ(request.custom_mounts.size(), 1);
    REQUIRE(pforge::mount::validate_mount_request(request).has_value());
}

TEST_CASE("load tool config")
{
    namespace fs = std::filesystem;

    const auto& config_path = fs::temp_directory_path() / "partforge-unit-settings.json";
    fs::remove(config_path);

    SECTION("missing file yields defaults")
    {
        ::setenv("PARTFORGE_CONFIG", config_path.c_str(), 1);
        auto result = partforge::load_tool_config();
        REQUIRE(result.has_value());
        REQUIRE(!result->headless_mode);
        REQUIRE_EQ(result->mountpoint, "/mnt/gentoo"sv);
    }
    SECTION("file from PARTFORGE_CONFIG is parsed")
    {
        {
            std::ofstream config_file{config_path};
            config_file << R"({"headless_mode": true, "mountpoint": "/mnt/other"})";
        }
        ::setenv("PARTFORGE_CONFIG", config_path.c_str(), 1);
        auto result = partforge::load_tool_config();
        REQUIRE(result.has_value());
        REQUIRE(result->headless_mode);
        REQUIRE_EQ(result->mountpoint, "/mnt/other"sv);
    }
    SECTION("parse error names the file")
    {
        {
            std::ofstream config_file{config_path};
            config_file << "{";
        }
        ::setenv("PARTFORGE_CONFIG", config_path.c_str(), 1);
        auto result = partforge::load_tool_config();
        REQUIRE(!result.has_value());
        REQUIRE(result.error().contains("partforge-unit-settings.json"sv));
    }

    ::unsetenv("PARTFORGE_CONFIG");
    fs::remove(config_path);
}
