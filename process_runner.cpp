#include "process_runner.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ExecResult exec_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("exec_command called with an empty argument vector");
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: both streams into the pipe, stdin from /dev/null so tools never block on a prompt
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        const char* msg = "exec failed: ";
        (void)!write(STDERR_FILENO, msg, std::strlen(msg));
        (void)!write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
        (void)!write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    close(fds[1]);

    ExecResult result{0, ""};
    char buffer[4096];
    for (;;) {
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

static bool is_executable_file(const std::string& path) {
    std::error_code ec;
    return access(path.c_str(), X_OK) == 0 && std::filesystem::is_regular_file(path, ec);
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) return std::nullopt;

    for (const auto& dir : split_string(path_env, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string format_command(const std::vector<std::string>& args) {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) line += ' ';
        line += arg;
    }
    return line;
}
