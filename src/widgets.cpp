#include "widgets.hpp"

// import pforge
#include "pforge/string_utils.hpp"

#include <algorithm>  // for transform
#include <cstddef>    // for size_t
#include <cstdint>    // for int32_t
#include <iterator>   // for back_inserter
#include <utility>    // for move

#include <ftxui/component/component.hpp>           // for Button, Input, Menu, Renderer
#include <ftxui/component/component_base.hpp>      // for ComponentBase
#include <ftxui/component/component_options.hpp>   // for ButtonOption, InputOption, MenuOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for text, vbox, border

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace ftxui;
using namespace std::string_view_literals;

namespace {

using pforge::fs::FilesystemType;

constexpr auto filesystem_description(FilesystemType fs_type) noexcept -> std::string_view {
    switch (fs_type) {
    case FilesystemType::Ext4:
        return "common default, stable, widely supported"sv;
    case FilesystemType::Xfs:
        return "high performance, good for large storage"sv;
    case FilesystemType::Btrfs:
        return "advanced features, snapshots"sv;
    case FilesystemType::Ntfs:
        return "Windows compatibility"sv;
    case FilesystemType::Exfat:
        return "cross-platform compatibility"sv;
    default:
        return {};
    }
}

auto paragraph(std::string_view content) -> Element {
    Elements lines{};
    for (auto&& line : pforge::utils::make_multiline(content)) {
        lines.emplace_back(text(std::move(line)));
    }
    return vbox(std::move(lines));
}

// Title on top, body boxed in the middle of the screen
auto framed(Element body) -> Element {
    return vbox({
        text(std::string{tui::detail::SCREEN_TITLE}) | bold,
        filler(),
        hbox({filler(), std::move(body) | border, filler()}) | center,
        filler(),
    });
}

auto button_row(std::string_view accept_label, std::function<void()> on_accept, std::string_view reject_label, std::function<void()> on_reject) -> Component {
    return Container::Horizontal({
        Button(std::string{accept_label}, std::move(on_accept), ButtonOption::Ascii()),
        Renderer([] { return filler() | size(WIDTH, GREATER_THAN, 3); }),
        Button(std::string{reject_label}, std::move(on_reject), ButtonOption::Ascii()),
    });
}

auto select_entry(std::string_view title, const std::vector<std::string>& entries) -> std::optional<std::size_t> {
    if (entries.empty()) {
        return std::nullopt;
    }
    auto screen = ScreenInteractive::Fullscreen();

    std::int32_t selected{};
    bool chosen{};
    auto choose = [&] {
        chosen = true;
        screen.ExitLoopClosure()();
    };
    auto menu    = Menu(&entries, &selected, MenuOption{.on_enter = choose});
    auto buttons = button_row("OK"sv, choose, "Cancel"sv, screen.ExitLoopClosure());
    auto body    = Container::Vertical({menu, buttons});

    auto renderer = Renderer(body, [&] {
        return framed(vbox({
                          paragraph(title),
                          separator(),
                          menu->Render() | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 15),
                          separator(),
                          buttons->Render() | hcenter,
                      })
            | size(WIDTH, GREATER_THAN, 40));
    });
    screen.Loop(renderer);

    if (!chosen) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(selected);
}

}  // namespace

namespace tui::detail {

auto filesystem_entry(FilesystemType fs_type) noexcept -> std::string {
    const auto& name        = pforge::fs::filesystem_type_to_string(fs_type);
    const auto& description = filesystem_description(fs_type);
    if (description.empty()) {
        return std::string{name};
    }
    return fmt::format(FMT_COMPILE("{:<6} ({})"), name, description);
}

auto disk_entry(const pforge::disk::DiskInfo& disk) noexcept -> std::string {
    const auto& disk_size = pforge::disk::format_size(disk.size);
    if (!disk.model || disk.model->empty()) {
        return fmt::format(FMT_COMPILE("{:<20} Size: {}"), disk.device, disk_size);
    }
    return fmt::format(FMT_COMPILE("{:<20} Size: {:<10} {}"), disk.device, disk_size, *disk.model);
}

auto size_error_hint(std::string_view token, pforge::plan::SizeError error) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("'{}': {}"), token, pforge::plan::size_error_to_string(error));
}

void message_widget(std::string_view content) noexcept {
    auto screen    = ScreenInteractive::Fullscreen();
    auto ok_button = Button("OK", screen.ExitLoopClosure(), ButtonOption::Ascii());

    auto renderer = Renderer(ok_button, [&] {
        return framed(vbox({
            paragraph(content) | size(HEIGHT, GREATER_THAN, 5),
            separator(),
            ok_button->Render() | hcenter,
        }));
    });
    screen.Loop(renderer);
}

bool yesno_widget(std::string_view question) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    bool accepted{};
    auto buttons = button_row(
        "Yes"sv, [&] {
            accepted = true;
            screen.ExitLoopClosure()();
        },
        "No"sv, screen.ExitLoopClosure());

    auto renderer = Renderer(buttons, [&] {
        return framed(vbox({
            paragraph(question) | size(HEIGHT, GREATER_THAN, 5),
            separator(),
            buttons->Render() | hcenter,
        }));
    });
    screen.Loop(renderer);
    return accepted;
}

auto input_widget(std::string_view question, std::string_view initial, const InputCheck& check) noexcept -> std::optional<std::string> {
    auto screen = ScreenInteractive::Fullscreen();

    std::string value{initial};
    std::string hint{};
    std::optional<std::string> accepted{};
    auto submit = [&] {
        const auto& trimmed = pforge::utils::trim(value);
        if (auto rejection = check(trimmed); rejection) {
            spdlog::warn("Rejected input '{}': {}", trimmed, *rejection);
            hint = std::move(*rejection);
            return;
        }
        accepted = std::string{trimmed};
        screen.ExitLoopClosure()();
    };
    auto input   = Input(&value, "", InputOption{.on_enter = submit});
    auto buttons = button_row("OK"sv, submit, "Cancel"sv, screen.ExitLoopClosure());
    auto body    = Container::Vertical({input, buttons});

    auto renderer = Renderer(body, [&] {
        Elements rows{paragraph(question), separator(), input->Render()};
        if (!hint.empty()) {
            rows.emplace_back(paragraph(hint) | color(Color::Red));
        }
        rows.emplace_back(separator());
        rows.emplace_back(buttons->Render() | hcenter);
        return framed(vbox(std::move(rows)) | size(WIDTH, GREATER_THAN, 40));
    });
    screen.Loop(renderer);
    return accepted;
}

auto size_input_widget(std::string_view question, std::string_view default_token, pforge::plan::SizeContext context) noexcept
    -> std::optional<pforge::plan::PartitionSize> {
    std::optional<pforge::plan::PartitionSize> parsed{};
    const auto& token = input_widget(question, default_token, [&](std::string_view value) -> std::optional<std::string> {
        auto parsed_size = pforge::plan::parse_size(value, context);
        if (!parsed_size) {
            return size_error_hint(value, parsed_size.error());
        }
        parsed = *parsed_size;
        return std::nullopt;
    });
    if (!token) {
        return std::nullopt;
    }
    return parsed;
}

auto filesystem_menu_widget(std::string_view title, std::span<const FilesystemType> filesystems) noexcept -> std::optional<FilesystemType> {
    std::vector<std::string> entries{};
    std::ranges::transform(filesystems, std::back_inserter(entries), filesystem_entry);

    const auto& index = select_entry(title, entries);
    if (!index) {
        return std::nullopt;
    }
    return filesystems[*index];
}

auto disk_menu_widget(std::string_view title, const std::vector<pforge::disk::DiskInfo>& disks) noexcept -> std::optional<std::string> {
    std::vector<std::string> entries{};
    std::ranges::transform(disks, std::back_inserter(entries), disk_entry);

    const auto& index = select_entry(title, entries);
    if (!index) {
        return std::nullopt;
    }
    const auto& device = disks[*index].device;
    spdlog::info("Selected disk: {}", device);
    return device;
}

}  // namespace tui::detail
