/**
 * @file io.cpp
 * @brief Whole-file read/write helpers
 */

#include "rfuri/common.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace rfuri::common {

rfuri::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path.string()));
    }
    return content;
}

rfuri::VoidResult write_text_file(const std::filesystem::path& path, std::string_view content)
{
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error::make("IOError",
                                               "Failed to create directory: " + parent.string()
                                                   + ": " + ec.message()));
        }
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << content;
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace rfuri::common
