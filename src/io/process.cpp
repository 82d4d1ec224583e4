#include "textnorm/io/process.hpp"
#include <array>
#include <cerrno>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace textnorm {

namespace {

// Owns both ends of a pipe
class Pipe {
public:
    Pipe() {
        if (::pipe(fds_.data()) != 0) {
            fds_ = {-1, -1};
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    auto operator=(const Pipe&) -> Pipe& = delete;

    auto ok() const -> bool { return fds_[0] >= 0; }
    auto read_end() const -> int { return fds_[0]; }
    auto write_end() const -> int { return fds_[1]; }

    auto close_read() -> void {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }
    auto close_write() -> void {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    std::array<int, 2> fds_{-1, -1};
};

auto wait_for(pid_t pid) -> std::optional<int> {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::nullopt;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

} // namespace

auto run_process(const std::vector<std::string>& argv) -> std::optional<ProcessResult> {
    if (argv.empty()) {
        return std::nullopt;
    }

    Pipe output;
    if (!output.ok()) {
        return std::nullopt;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, output.write_end(), STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, output.read_end());
    posix_spawn_file_actions_addclose(&actions, output.write_end());

    pid_t pid = 0;
    int spawn_error = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (spawn_error != 0) {
        return std::nullopt;
    }

    output.close_write();

    ProcessResult result;
    std::array<char, 4096> buffer{};
    while (true) {
        auto got = ::read(output.read_end(), buffer.data(), buffer.size());
        if (got > 0) {
            result.standard_output.append(buffer.data(), static_cast<size_t>(got));
        } else if (got == 0 || errno != EINTR) {
            break;
        }
    }
    output.close_read();

    auto exit_code = wait_for(pid);
    if (!exit_code) {
        return std::nullopt;
    }
    result.exit_code = *exit_code;
    return result;
}

} // namespace textnorm
