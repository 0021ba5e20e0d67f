#include "spinner.hpp"
#include "definitions.hpp"

#include <array>    // for array
#include <chrono>   // for chrono_literals
#include <cstddef>  // for size_t
#include <cstdio>   // for fflush, stdout

#include <fmt/compile.h>

namespace tui {

Spinner::~Spinner() noexcept {
    join();
}

void Spinner::start(std::string_view description) noexcept {
    using namespace std::chrono_literals;

    // previous step was not finished
    join();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_description = std::string{description};
    }
    warning_inter("{}...\n", description);

    m_running = true;
    m_thread  = std::thread([this] {
        static constexpr std::array<char, 4> frames{'|', '/', '-', '\\'};
        std::size_t frame{};
        while (m_running) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                output_inter(FMT_COMPILE("\r{} {}"), frames[frame], m_description);
            }
            std::fflush(stdout);
            frame = (frame + 1) % frames.size();
            std::this_thread::sleep_for(0.1s);
        }
    });
}

void Spinner::stop(bool success) noexcept {
    join();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (success) {
        success_inter("\r{} completed.\n", m_description);
    } else {
        error_inter("\r{} failed.\n", m_description);
    }
}

auto Spinner::progress_callback() noexcept -> pforge::ProgressCallback {
    return [this](pforge::ProgressEvent event, std::string_view description) {
        switch (event) {
        case pforge::ProgressEvent::Started:
            start(description);
            break;
        case pforge::ProgressEvent::Completed:
            stop(true);
            break;
        case pforge::ProgressEvent::Failed:
            stop(false);
            break;
        }
    };
}

void Spinner::join() noexcept {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

}  // namespace tui
