#include "pforge/mtab.hpp"
#include "pforge/device_target.hpp"
#include "pforge/string_utils.hpp"

#include <algorithm>  // for all_of, copy_if
#include <filesystem>
#include <fstream>
#include <iterator>  // for back_inserter
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace {

auto read_mtab(std::string_view mtab_path) noexcept -> std::optional<std::string> {
    // mtab file size is reported as zero bytes
    // so just read line by line until EOF
    std::ifstream file(fs::path{mtab_path}, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::vector<std::string> lines{};
    while (file) {
        std::string line{};
        std::getline(file, line);
        lines.push_back(std::move(line));
    }

    auto&& mtab_content = pforge::utils::join(lines);
    return std::make_optional<std::string>(std::move(mtab_content));
}

constexpr auto is_all_digits(std::string_view str) noexcept -> bool {
    return !str.empty() && std::ranges::all_of(str, [](char ch) { return ch >= '0' && ch <= '9'; });
}

}  // namespace

namespace pforge::mtab {

auto parse_mtab_content(std::string_view mtab_content) noexcept -> std::vector<MTabEntry> {
    std::vector<MTabEntry> entries{};

    auto&& file_content_lines = utils::make_split_view(mtab_content);
    for (auto&& line : file_content_lines) {
        line = utils::trim(line);
        if (line.empty() || line.starts_with('#')) {
            continue;
        }

        auto&& line_split = utils::make_split_view(line, ' ');
        if (utils::size_viewable_range(line_split) >= 3) {
            // e.g format: <device> <mountpoint> <fstype> <options>
            auto&& device     = *utils::index_viewable_range(line_split, 0);
            auto&& mountpoint = *utils::index_viewable_range(line_split, 1);
            entries.emplace_back(MTabEntry{.device = std::string{device}, .mountpoint = std::string{mountpoint}});
        }
    }
    return entries;
}

auto parse_mtab(std::string_view mtab_path) noexcept -> std::optional<std::vector<MTabEntry>> {
    if (mtab_path.empty()) {
        return std::nullopt;
    }

    // use "non-standard" read due to reported zero size
    auto&& file_content = read_mtab(mtab_path);
    if (!file_content || file_content->empty()) {
        return std::nullopt;
    }
    return mtab::parse_mtab_content(*file_content);
}

auto is_partition_of(std::string_view device, std::string_view disk) noexcept -> bool {
    if (disk.empty() || !device.starts_with(disk)) {
        return false;
    }
    auto suffix = device.substr(disk.size());
    if (suffix.empty()) {
        return true;
    }
    if (disk::needs_partition_infix(disk)) {
        if (!suffix.starts_with('p')) {
            return false;
        }
        suffix.remove_prefix(1);
    }
    return is_all_digits(suffix);
}

auto mounted_partitions(const std::vector<MTabEntry>& entries, std::string_view disk) noexcept -> std::vector<MTabEntry> {
    std::vector<MTabEntry> result{};
    std::ranges::copy_if(entries, std::back_inserter(result), [disk](auto&& entry) { return is_partition_of(entry.device, disk); });
    return result;
}

}  // namespace pforge::mtab
