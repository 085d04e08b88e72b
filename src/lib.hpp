#pragma once

#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <string>

namespace fs = std::filesystem;

namespace lib {
class FileError final : public std::exception {
public:
    FileError(const fs::path &path, const std::string &message) : m_path(path) {
        m_msg = fmt::format("{} (file: {})", message, path.string());
    }

    [[nodiscard]] const char *what() const noexcept override {
        return m_msg.c_str();
    }

    [[nodiscard]] const fs::path &path() const noexcept {
        return m_path;
    }

private:
    fs::path m_path;
    std::string m_msg;
};

} // namespace lib
