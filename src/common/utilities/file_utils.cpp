// File: common/utilities/file_utils.cpp

#include "common/utilities/file_utils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace common::utilities {

    void FileUtils::ensureDirectoryExists(const std::filesystem::path &path) {
        if (path.empty() || std::filesystem::exists(path)) {
            return;
        }
        std::filesystem::create_directories(path);
        LOG_INFO("Created directory: {}", path.string());
    }

    std::string FileUtils::readFile(const std::filesystem::path &file_path) {
        std::ifstream file(file_path);
        if (!file) {
            LOG_ERROR("Failed to open file for reading: {}", file_path.string());
            throw std::runtime_error("Failed to open file: " + file_path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    void FileUtils::writeStringToFile(const std::filesystem::path &file_path, const std::string &content) {
        ensureDirectoryExists(file_path.parent_path());

        std::ofstream file(file_path);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open file for writing: {}", file_path.string());
            throw std::runtime_error("Failed to create file for writing: " + file_path.string());
        }
        file << content;
        if (!file) {
            throw std::runtime_error("Failed to write file: " + file_path.string());
        }
        LOG_DEBUG("Wrote {} bytes to {}", content.size(), file_path.string());
    }

} // namespace common::utilities
