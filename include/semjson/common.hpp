#pragma once

/**
 * @file common.hpp
 * @brief Common types: error information and Result aliases
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace semjson {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;                   ///< Machine-readable error code
    std::string message;                ///< Human-readable error message
    std::optional<std::size_t> offset;  ///< Byte offset into the input, when known

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message), .offset = std::nullopt};
    }

    [[nodiscard]] static Error make_at(std::string code, std::string message, std::size_t offset)
    {
        return Error{.code = std::move(code), .message = std::move(message), .offset = offset};
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

}  // namespace semjson
