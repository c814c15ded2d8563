// =================================================================
// include/Warden/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes with a bounded timeout.

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <utility> // For std::pair

namespace Warden {

/**
 * @brief Outcome of running an external process
 */
struct CommandResult {
    std::string output;       ///< Combined stdout and stderr
    int exit_code = -1;       ///< Process exit code, -1 if killed or not run
    bool timed_out = false;   ///< True when the process was killed at the deadline
};

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file, byte for byte. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Writes content to a temporary sibling and renames it over the target.
     *
     * Readers see either the old or the new content, never a partial file.
     */
    bool writeFileAtomic(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a file exists.
     */
    bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory and any missing parents.
     */
    bool createDirectory(const std::string& dir_path);

    bool removeFile(const std::string& file_path);

    /**
     * @brief Runs an external command without a shell.
     * @param command Program name, looked up on PATH.
     * @param args Arguments passed verbatim.
     * @param working_dir Directory to run in, empty for the current one.
     * @param timeout Deadline for the whole run, zero for none.
     * @return Captured output, exit code and timeout flag. Throws std::runtime_error
     *         if the process cannot be started.
     */
    CommandResult runCommand(const std::string& command, const std::vector<std::string>& args,
                             const std::string& working_dir = "",
                             std::chrono::seconds timeout = std::chrono::seconds(0));

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @return A pair containing the output and the exit code.
     */
    std::pair<std::string, int> executeCommand(const std::string& command, const std::vector<std::string>& args);
};

} // namespace Warden
