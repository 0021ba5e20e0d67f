#include "pforge/io_utils.hpp"

#include <sys/wait.h>  // for waitpid
#include <unistd.h>    // for execvp, fork, pipe, dup2

#include <cerrno>   // for errno, EINTR, ENOENT
#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv, WIFEXITED, WIFSIGNALED
#include <cstring>  // for strerror, strlen

#include <algorithm>  // for transform
#include <array>      // for array
#include <memory>     // for unique_ptr

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace pforge::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto exec(std::string_view command) noexcept -> std::string {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }

    const std::string command_str{command};
    const std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_str.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return {};
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    return result;
}

auto exec_capture(const std::vector<std::string>& vec) noexcept -> ExecResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec_capture] cmd := {}", vec);
    }
    if (dirty_cmd_run) {
        return ExecResult{.exit_code = 0, .output = {}};
    }
    if (vec.empty()) {
        return ExecResult{.exit_code = -1, .output = "empty command"};
    }

    std::array<int, 2> pipe_fds{};
    if (pipe(pipe_fds.data()) != 0) {
        return ExecResult{.exit_code = -1, .output = fmt::format("pipe failed: {}", std::strerror(errno))};
    }

    std::vector<char*> args;
    std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
        [=](const std::string& arg) -> char* { return const_cast<char*>(arg.data()); });
    args.push_back(nullptr);

    // the child must not allocate after fork, the message is built upfront
    const auto& exec_failed_msg = fmt::format("failed to execute '{}': ", vec[0]);

    const auto pid = fork();
    if (pid < 0) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        return ExecResult{.exit_code = -1, .output = fmt::format("fork failed: {}", std::strerror(errno))};
    }
    if (pid == 0) {
        close(pipe_fds[0]);
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[1]);

        char** command = args.data();
        execvp(command[0], command);

        // only reached when exec failed
        const char* const reason = (errno == ENOENT) ? "command not found\n" : "exec error\n";
        [[maybe_unused]] auto written = write(STDERR_FILENO, exec_failed_msg.data(), exec_failed_msg.size());
        written = write(STDERR_FILENO, reason, std::strlen(reason));
        _exit(127);
    }

    close(pipe_fds[1]);

    ExecResult result{};
    std::array<char, 4096> buf{};
    while (true) {
        const auto bytes_read = read(pipe_fds[0], buf.data(), buf.size());
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            break;
        }
        result.output.append(buf.data(), static_cast<std::size_t>(bytes_read));
    }
    close(pipe_fds[0]);

    int status{};
    while (true) {
        if (waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[exec_capture] waitpid failed for '{}': {}", vec[0], std::strerror(errno));
            return result;
        }
        if (WIFEXITED(status) || WIFSIGNALED(status)) {
            break;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    if (result.output.ends_with('\n')) {
        result.output.pop_back();
    }
    return result;
}

}  // namespace pforge::utils
