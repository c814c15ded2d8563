// =================================================================
// include/Warden/LockFile.hpp
// =================================================================
// Cross-process exclusive lock based on flock(2) on a lock file.

#pragma once

#include <chrono>
#include <string>

namespace Warden {

/**
 * @brief Exclusive lock held as an flock(2) on a lock file
 *
 * The kernel drops the lock when its holder exits, so a crashed holder never
 * blocks later callers and a live holder is never broken, however long it
 * holds. The holder removes the file on release; a file left behind by a
 * crash is simply locked again. The descriptor is close-on-exec so child
 * processes (git) do not inherit the lock. The file contains the holder's pid
 * for diagnostics only. The lock is released on destruction.
 */
class LockFile {
public:
    /**
     * @brief Construct an unacquired lock
     * @param path Lock file path
     * @param timeout How long acquire() waits for a competing holder
     */
    explicit LockFile(const std::string& path,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    /**
     * @brief Acquire the lock, waiting up to the timeout
     * @return True when held, false on timeout. Throws std::runtime_error
     *         when the lock file cannot be opened or locked for another reason.
     */
    bool acquire();

    /**
     * @brief Single non-blocking attempt
     */
    bool tryAcquire();

    void release();

    bool isHeld() const { return m_held; }

    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
    std::chrono::milliseconds m_timeout;
    int m_fd = -1;
    bool m_held = false;
};

} // namespace Warden
