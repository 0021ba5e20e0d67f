#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace pforge::utils {

/// @brief Outcome of an external command.
struct ExecResult final {
    /// Exit status of the process, -1 if it could not be spawned or was killed by a signal.
    std::int32_t exit_code{-1};
    /// Combined stdout and stderr of the process.
    std::string output{};

    [[nodiscard]] constexpr auto success() const noexcept -> bool {
        return exit_code == 0;
    }
};

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// Runs shell command and returns its stdout with the trailing newline removed
auto exec(std::string_view command) noexcept -> std::string;

/// @brief Execute command args without shell, capturing combined stdout+stderr.
/// @param vec The arguments to launch, vec[0] is looked up in PATH.
/// @return The exit code and captured output.
auto exec_capture(const std::vector<std::string>& vec) noexcept -> ExecResult;

}  // namespace pforge::utils

#endif  // IO_UTILS_HPP
