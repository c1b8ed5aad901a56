#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace kninja {

enum class ErrorKind : uint8_t {
    configuration,
    duplicate_rule_conflict,
    unknown_definition,
    usage,
    io,
    process,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::configuration:
        return "configuration error";
    case ErrorKind::duplicate_rule_conflict:
        return "duplicate rule conflict";
    case ErrorKind::unknown_definition:
        return "unknown definition";
    case ErrorKind::usage:
        return "usage error";
    case ErrorKind::io:
        return "i/o error";
    case ErrorKind::process:
        return "process error";
    }
    return "error";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T> using Result = std::expected<T, Error>;

/**
 * @brief Builds an unexpected `Error` with a formatted message.
 *
 * Usage: `return fail(ErrorKind::configuration, "rule '{}' ...", name);`
 */
template <typename... Args>
std::unexpected<Error> fail(ErrorKind kind, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...)});
}

} // namespace kninja

template <> struct std::formatter<kninja::Error> : std::formatter<std::string_view> {
    auto format(const kninja::Error &err, std::format_context &ctx) const {
        std::string text = std::format("{}: {}", kninja::to_string(err.kind), err.message);
        return std::formatter<std::string_view>::format(text, ctx);
    }
};
