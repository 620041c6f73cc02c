// File: common/utilities/file_utils.hpp

#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <filesystem>
#include <string>

namespace common::utilities {

    class FileUtils {
    public:
        // Creates the directory and its parents when missing
        static void ensureDirectoryExists(const std::filesystem::path &path);

        // Whole file as a string; throws std::runtime_error when it cannot be opened
        static std::string readFile(const std::filesystem::path &file_path);

        // Replaces the file content, creating the parent directory first
        static void writeStringToFile(const std::filesystem::path &file_path, const std::string &content);
    };

} // namespace common::utilities

#endif // FILE_UTILS_HPP
