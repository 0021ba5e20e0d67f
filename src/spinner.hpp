#ifndef SPINNER_HPP
#define SPINNER_HPP

// import pforge
#include "pforge/progress.hpp"

#include <atomic>       // for atomic_bool
#include <mutex>        // for mutex
#include <string>       // for string
#include <string_view>  // for string_view
#include <thread>       // for thread

namespace tui {

/// @brief Console spinner shown while a long running step is executed.
class Spinner final {
 public:
    Spinner() = default;
    ~Spinner() noexcept;

    Spinner(const Spinner&)            = delete;
    Spinner& operator=(const Spinner&) = delete;

    void start(std::string_view description) noexcept;
    void stop(bool success) noexcept;

    /// @brief Progress callback which drives this spinner.
    [[nodiscard]] auto progress_callback() noexcept -> pforge::ProgressCallback;

 private:
    void join() noexcept;

    std::atomic_bool m_running{false};
    std::mutex m_mutex{};
    std::string m_description{};
    std::thread m_thread{};
};

}  // namespace tui

#endif  // SPINNER_HPP
