#include "pforge/block_devices.hpp"
#include "pforge/device_target.hpp"
#include "pforge/io_utils.hpp"
#include "pforge/string_utils.hpp"

#include <algorithm>  // for copy_if
#include <charconv>   // for from_chars
#include <iterator>   // for back_inserter

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

static constexpr auto DEV_PATH_PREFIX  = "/dev/"sv;
static constexpr auto TRAILING_NUMBERS = "0123456789"sv;
static constexpr auto LSBLK_DISKS_CMD  = "lsblk -J -b -p -o NAME,TYPE,SIZE,MODEL,FSTYPE,MOUNTPOINT,RO,TRAN"sv;

namespace {

auto get_size_from_json(const rapidjson::Value& doc) noexcept -> std::uint64_t {
    if (!doc.HasMember("size")) {
        return 0;
    }
    const auto& size = doc["size"];
    if (size.IsUint64()) {
        return size.GetUint64();
    }
    // older lsblk report sizes as strings even with -b
    if (size.IsString()) {
        std::string_view size_str{size.GetString(), size.GetStringLength()};
        std::uint64_t result{0};
        std::from_chars(size_str.data(), size_str.data() + size_str.size(), result);
        return result;
    }
    return 0;
}

auto get_partition_from_json(const rapidjson::Value& doc) -> pforge::disk::PartitionInfo {
    pforge::disk::PartitionInfo part{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        part.device = doc["name"].GetString();
    }
    if (doc.HasMember("fstype") && doc["fstype"].IsString()) {
        part.fstype = doc["fstype"].GetString();
    }
    if (doc.HasMember("mountpoint") && doc["mountpoint"].IsString()) {
        part.mountpoint = doc["mountpoint"].GetString();
    }
    part.size = get_size_from_json(doc);

    return part;
}

auto get_disk_from_json(const rapidjson::Value& doc) -> pforge::disk::DiskInfo {
    pforge::disk::DiskInfo disk{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        disk.device = doc["name"].GetString();
    }
    if (doc.HasMember("model") && doc["model"].IsString()) {
        disk.model = std::string{pforge::utils::trim(doc["model"].GetString())};
    }
    if (doc.HasMember("tran") && doc["tran"].IsString()) {
        disk.transport = doc["tran"].GetString();
    }
    if (doc.HasMember("ro") && doc["ro"].IsBool()) {
        disk.is_read_only = doc["ro"].GetBool();
    }
    disk.size = get_size_from_json(doc);

    // Parse children (partitions)
    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child : doc["children"].GetArray()) {
            if (child.HasMember("type") && child["type"].IsString()) {
                std::string_view child_type = child["type"].GetString();
                if (child_type == "part"sv) {
                    disk.partitions.emplace_back(get_partition_from_json(child));
                }
            }
        }
    }

    return disk;
}

}  // namespace

namespace pforge::disk {

auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo> {
    if (json_output.empty()) {
        return {};
    }

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());

    // Check for parse errors and ensure document is a valid object
    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return {};
    }
    if (document.IsNull() || !document.IsObject()) {
        spdlog::error("lsblk output is not a valid JSON object");
        return {};
    }

    std::vector<DiskInfo> disks{};
    if (document.HasMember("blockdevices") && document["blockdevices"].IsArray()) {
        for (const auto& device_json : document["blockdevices"].GetArray()) {
            if (device_json.HasMember("type") && device_json["type"].IsString()) {
                std::string_view dev_type = device_json["type"].GetString();
                if (dev_type == "disk"sv) {
                    disks.emplace_back(get_disk_from_json(device_json));
                }
            }
        }
    }
    return disks;
}

auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>> {
    const auto& lsblk_output = utils::exec(LSBLK_DISKS_CMD);
    if (lsblk_output.empty()) {
        spdlog::error("Failed to get lsblk output");
        return std::nullopt;
    }

    auto disks = parse_lsblk_disks_json(lsblk_output);
    if (disks.empty()) {
        spdlog::warn("No disks found from lsblk");
    }
    return std::make_optional<std::vector<DiskInfo>>(std::move(disks));
}

auto parent_disk_of(std::string_view partition) noexcept -> std::string_view {
    const auto pos = partition.find_last_not_of(TRAILING_NUMBERS);
    if (pos == std::string_view::npos || pos == partition.size() - 1) {
        return partition;
    }

    // nvme0n1p2, mmcblk0p1, loop0p1
    if (partition[pos] == 'p' && needs_partition_infix(partition.substr(0, pos))) {
        return partition.substr(0, pos);
    }

    auto base = partition;
    if (base.starts_with(DEV_PATH_PREFIX)) {
        base.remove_prefix(DEV_PATH_PREFIX.size());
    }
    // whole devices of these families end in a digit, e.g nvme0n1
    if (base.starts_with("nvme"sv) || base.starts_with("mmcblk"sv) || base.starts_with("loop"sv)) {
        return partition;
    }
    return partition.substr(0, pos + 1);
}

auto system_disk_from(std::string_view root_source, std::string_view pkname) noexcept -> std::optional<std::string> {
    // PKNAME of a dm-crypt mapping is the partition below it
    if (const auto& parent = utils::trim(pkname); !parent.empty()) {
        return std::string{parent_disk_of(parent)};
    }
    // btrfs subvolumes are reported as /dev/sda2[/@]
    const auto& source_device = root_source.substr(0, root_source.find('['));
    if (!source_device.starts_with(DEV_PATH_PREFIX)) {
        return std::nullopt;
    }
    return std::string{parent_disk_of(source_device)};
}

auto get_system_disk() noexcept -> std::optional<std::string> {
    const auto& findmnt = utils::exec_capture({"findmnt", "-n", "-o", "SOURCE", "/"});
    const auto& root_source = utils::trim(findmnt.output);
    if (!findmnt.success() || root_source.empty()) {
        spdlog::warn("Failed to determine the source of /: {}", findmnt.output);
        return std::nullopt;
    }

    // PKNAME resolves the parent through device-mapper and btrfs subvolume suffixes.
    // Sources which are no block device (overlay, airootfs) make lsblk fail.
    const std::string source_device{root_source.substr(0, root_source.find('['))};
    const auto& lsblk = utils::exec_capture({"lsblk", "-n", "-d", "-p", "-o", "PKNAME", source_device});
    if (!lsblk.success()) {
        spdlog::debug("lsblk could not resolve the parent of '{}': {}", source_device, lsblk.output);
        return system_disk_from(root_source, {});
    }
    return system_disk_from(root_source, lsblk.output);
}

auto filter_candidate_disks(const std::vector<DiskInfo>& disks, std::string_view system_disk) noexcept -> std::vector<DiskInfo> {
    std::vector<DiskInfo> candidates{};
    std::ranges::copy_if(disks, std::back_inserter(candidates), [system_disk](auto&& disk) {
        return disk.device != system_disk && !disk.is_read_only;
    });
    return candidates;
}

auto format_size(std::uint64_t bytes) noexcept -> std::string {
    constexpr std::uint64_t KiB = 1024ULL;
    constexpr std::uint64_t MiB = KiB * 1024;
    constexpr std::uint64_t GiB = MiB * 1024;
    constexpr std::uint64_t TiB = GiB * 1024;

    if (bytes >= TiB) {
        return fmt::format(FMT_COMPILE("{:.1f}TiB"), static_cast<double>(bytes) / TiB);
    } else if (bytes >= GiB) {
        return fmt::format(FMT_COMPILE("{:.1f}GiB"), static_cast<double>(bytes) / GiB);
    } else if (bytes >= MiB) {
        return fmt::format(FMT_COMPILE("{:.0f}MiB"), static_cast<double>(bytes) / MiB);
    } else if (bytes >= KiB) {
        return fmt::format(FMT_COMPILE("{:.0f}KiB"), static_cast<double>(bytes) / KiB);
    }
    return fmt::format(FMT_COMPILE("{}B"), bytes);
}

}  // namespace pforge::disk
