#pragma once

/**
 * @file common.hpp
 * @brief Common types: error reporting and Result aliases
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace rfuri {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace rfuri

namespace rfuri::common {

/**
 * Read a whole file into a string
 * @param path File to read
 * @return File contents or IOError
 */
[[nodiscard]] rfuri::Result<std::string> read_text_file(const std::filesystem::path& path);

/**
 * Write a string to a file, creating parent directories as needed
 * @param path Destination file
 * @param content Bytes to write
 * @return Empty on success, IOError on failure
 */
[[nodiscard]] rfuri::VoidResult write_text_file(const std::filesystem::path& path,
                                                std::string_view content);

}  // namespace rfuri::common
