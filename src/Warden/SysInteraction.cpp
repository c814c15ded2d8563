// =================================================================
// src/Warden/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "Warden/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Warden {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::writeFileAtomic(const std::string& file_path, const std::string& content) {
    std::string temp_path = file_path + ".tmp." + std::to_string(getpid());
    if (!writeFile(temp_path, content)) {
        std::remove(temp_path.c_str());
        return false;
    }
    if (std::rename(temp_path.c_str(), file_path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

bool SysInteraction::fileExists(const std::string& file_path) {
    struct stat buffer;
    return (stat(file_path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    struct stat buffer;
    return (stat(dir_path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool SysInteraction::createDirectory(const std::string& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

bool SysInteraction::removeFile(const std::string& file_path) {
    return std::remove(file_path.c_str()) == 0;
}

CommandResult SysInteraction::runCommand(const std::string& command, const std::vector<std::string>& args,
                                         const std::string& working_dir, std::chrono::seconds timeout) {
    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        throw std::runtime_error("Failed to create pipe for: " + command + ": " + std::strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        throw std::runtime_error("Failed to start: " + command + ": " + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdin from /dev/null, stdout and stderr into the pipe
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(command.c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(command.c_str(), argv.data());
        _exit(127);
    }

    close(pipe_fds[1]);

    CommandResult result;
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (true) {
        int wait_ms = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfd;
        pfd.fd = pipe_fds[0];
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill(pid, SIGKILL);
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (count == 0) {
            break; // EOF
        }
        result.output.append(buffer, static_cast<size_t>(count));
    }

    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = -1;
            break;
        }
    }

    if (!result.timed_out && status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        // Process terminated abnormally
        result.exit_code = -1;
    }

    return result;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    CommandResult result = runCommand(command, args);
    return {result.output, result.exit_code};
}

} // namespace Warden
