#include <kiln/process.hpp>
#include <kiln/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kiln {

// Exit status the child uses when chdir or exec fails
static constexpr int EXEC_FAILED = 127;

std::string CommandResult::combined_output() const {
    std::string out = stderr_str;
    if (!out.empty() && !stdout_str.empty() && out.back() != '\n') out += '\n';
    out += stdout_str;
    return out;
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

// Read whatever is available; returns false once the pipe hit EOF.
static bool drain(int fd, std::string& out) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return KilnError{KilnError::InvalidArg, "run_command: empty command line"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return KilnError{KilnError::Process,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    log::debug("exec: %s%s%s", args[0].c_str(),
               options.working_dir.empty() ? "" : " in ",
               options.working_dir.c_str());

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return KilnError{KilnError::Process,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pair(out_pipe);
        close_pair(err_pipe);

        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            _exit(EXEC_FAILED);
        }
        for (const auto& kv : options.env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    CommandResult result;
    bool out_open = true;
    bool err_open = true;
    auto start = std::chrono::steady_clock::now();

    while (out_open || err_open) {
        if (options.timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (elapsed >= std::chrono::seconds(options.timeout_seconds)) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(out_pipe[0]);
                close(err_pipe[0]);
                return KilnError{KilnError::Process,
                    "command '" + args[0] + "' timed out after " +
                    std::to_string(options.timeout_seconds) + "s"};
            }
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        int rc = poll(fds, nfds, 100);
        if (rc < 0 && errno != EINTR) {
            break;
        }

        if (out_open) out_open = drain(out_pipe[0], result.stdout_str);
        if (err_open) err_open = drain(err_pipe[0], result.stderr_str);
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        return KilnError{KilnError::Process,
            std::string("waitpid failed: ") + strerror(errno)};
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code == EXEC_FAILED && result.stdout_str.empty() &&
        result.stderr_str.empty()) {
        return KilnError{KilnError::Process,
            "cannot execute '" + args[0] + "'",
            "check that the toolchain command exists and is on PATH"};
    }

    return Result<CommandResult>::ok(std::move(result));
}

} // namespace kiln
