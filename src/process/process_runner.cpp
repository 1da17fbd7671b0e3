#include "process/process_runner.hpp"

#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace web::compile {

ProcessRunner::ProcessRunner(std::string program)
    : program_(std::move(program))
{
}

bool ProcessRunner::is_executable_file(const std::filesystem::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> ProcessRunner::find_program(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }

    // Paths are taken literally, like execvp
    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(search);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool ProcessRunner::is_available() const {
    return find_program(program_).has_value();
}

namespace {

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Drain what is available; returns false at EOF or on a hard error
bool read_available(int fd, std::string& out, bool& truncated, const char* stream) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            // Past the cap the pipe is still drained so the child never blocks
            if (out.size() < ProcessRunner::OUTPUT_LIMIT) {
                out.append(buffer, static_cast<size_t>(n));
            } else if (!truncated) {
                truncated = true;
                out += "\n[... ";
                out += stream;
                out += " truncated at 10MB ...]";
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

ProcessRunner::Result ProcessRunner::run(const std::vector<std::string>& args,
                                         const std::filesystem::path& working_dir) const {
    if (program_.empty()) {
        throw std::runtime_error("Cannot execute empty command");
    }

    auto start_time = std::chrono::steady_clock::now();

    // Build argv before forking; the child only calls async-signal-safe code
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(program_);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const std::string cwd = working_dir.string();

    int stdout_pipe[2];
    int stderr_pipe[2];

    // Close-on-exec so children spawned by other workers never hold our ends
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(
            std::string("Failed to create stdout pipe: ") + strerror(errno)
        );
    }

    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to create stderr pipe: ") + strerror(errno)
        );
    }

    pid_t pid = fork();

    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(errno)
        );
    }

    if (pid == 0) {
        // Child process
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);

        // No stdin for compilers
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char* msg = "Failed to enter working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
            (void)ignored;
            _exit(EXEC_FAILED);
        }

        execvp(argv[0], argv.data());

        // If we get here, execvp failed
        const char* prefix = "Failed to execute ";
        const char* reason = strerror(errno);
        ssize_t ignored = write(STDERR_FILENO, prefix, strlen(prefix));
        ignored = write(STDERR_FILENO, argv[0], strlen(argv[0]));
        ignored = write(STDERR_FILENO, ": ", 2);
        ignored = write(STDERR_FILENO, reason, strlen(reason));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(EXEC_FAILED);  // Use _exit to avoid flushing parent's buffers
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool stdout_open = true;
    bool stderr_open = true;

    // Read until both pipes hit EOF; the child may exit before we drain them
    while (stdout_open || stderr_open) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        int max_fd = -1;

        if (stdout_open) {
            FD_SET(stdout_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stdout_pipe[0]);
        }
        if (stderr_open) {
            FD_SET(stderr_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stderr_pipe[0]);
        }

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 10000; // 10ms

        int ready = select(max_fd + 1, &read_fds, nullptr, nullptr, &timeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        if (stdout_open && FD_ISSET(stdout_pipe[0], &read_fds)) {
            stdout_open = read_available(stdout_pipe[0], stdout_output,
                                         stdout_truncated, "stdout");
        }
        if (stderr_open && FD_ISSET(stderr_pipe[0], &read_fds)) {
            stderr_open = read_available(stderr_pipe[0], stderr_output,
                                         stderr_truncated, "stderr");
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(
                std::string("Failed to wait for ") + program_ + ": " + strerror(errno)
            );
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time
    );

    int exit_code;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    } else {
        exit_code = -1;
    }

    return Result{
        exit_code,
        std::move(stdout_output),
        std::move(stderr_output),
        duration,
        stdout_truncated,
        stderr_truncated
    };
}

} // namespace web::compile
