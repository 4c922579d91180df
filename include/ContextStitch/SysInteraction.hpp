// =================================================================
// include/ContextStitch/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level file operations.

#pragma once

#include <string>

namespace ContextStitch {

class SysInteraction {
public:
    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, overwriting it.
     * Missing parent directories are created.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a regular file exists.
     */
    bool fileExists(const std::string& file_path);
};

} // namespace ContextStitch
