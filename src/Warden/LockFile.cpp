// =================================================================
// src/Warden/LockFile.cpp
// =================================================================
// Implementation for the lock-file protocol.

#include "Warden/LockFile.hpp"
#include "Warden/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Warden {

LockFile::LockFile(const std::string& path, std::chrono::milliseconds timeout)
: m_path(path), m_timeout(timeout) {
}

LockFile::~LockFile() {
    release();
}

bool LockFile::tryAcquire() {
    if (m_held) {
        return true;
    }

    while (true) {
        int fd = open(m_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw std::runtime_error("Cannot open lock file " + m_path + ": " + std::strerror(errno));
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int error = errno;
            close(fd);
            if (error == EWOULDBLOCK || error == EINTR) {
                return false;
            }
            throw std::runtime_error("Cannot lock " + m_path + ": " + std::strerror(error));
        }

        // The previous holder unlinks the file on release; a lock taken on
        // the unlinked inode guards nothing, so retry on the current file
        struct stat locked;
        struct stat current;
        if (fstat(fd, &locked) == 0 && stat(m_path.c_str(), &current) == 0 &&
            locked.st_dev == current.st_dev && locked.st_ino == current.st_ino) {
            m_fd = fd;
            break;
        }
        close(fd);
    }

    std::string owner = std::to_string(getpid()) + "\n";
    if (ftruncate(m_fd, 0) != 0 || write(m_fd, owner.data(), owner.size()) < 0) {
        LOG_WARNING("LockFile", "Could not record owner in " + m_path);
    }

    m_held = true;
    return true;
}

bool LockFile::acquire() {
    const auto deadline = std::chrono::steady_clock::now() + m_timeout;

    while (true) {
        if (tryAcquire()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARNING("LockFile", "Timed out waiting for " + m_path);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void LockFile::release() {
    if (!m_held) {
        return;
    }

    // Unlink while still holding, so only a holder ever removes the file
    if (unlink(m_path.c_str()) != 0 && errno != ENOENT) {
        LOG_ERROR("LockFile", "Failed to remove lock file " + m_path + ": " + std::strerror(errno));
    }
    close(m_fd);
    m_fd = -1;
    m_held = false;
}

} // namespace Warden
