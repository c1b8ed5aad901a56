#pragma once

#include "kninja/utility.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

/**
 * @brief Joins path components the way a shell user expects.
 *
 * An absolute component discards everything before it, and an empty last
 * component leaves a trailing separator (`join({".build", ""}) == ".build/"`).
 */
std::string join(std::initializer_list<std::string_view> parts);

/** @brief `dir/file.ext` -> `file` */
std::string basename_no_ext(std::string_view path);

/** @brief `dir/file.ext` -> `ext`, or empty when there is no extension. */
std::string get_extension(std::string_view path);

std::string replace_extension(std::string_view path, std::string_view extension);
std::string append_extension(std::string_view path, std::string_view extension);

/**
 * @brief True if `path` lies strictly inside `parent`.
 *
 * Both paths are made absolute against the working directory and
 * normalized lexically. Nothing is read from disk.
 */
bool is_subpath(std::string_view path, std::string_view parent);

/**
 * @brief Nests a relative path under `dir` unless it is already there.
 *
 * The path is normalized lexically and leading `..` components are dropped,
 * so `../tests/a.imp` lands in `dir/tests/a.imp`.
 * Idempotent: `place_in_dir(place_in_dir(p, d), d) == place_in_dir(p, d)`.
 * @return The placed path, or a configuration error for absolute paths and
 *         paths that normalize to nothing (`""`, `.`, `a/..`).
 */
Result<std::string> place_in_dir(std::string_view path, std::string_view dir);

/**
 * @brief Reads a list file: one entry per line, `#` starts a comment,
 *        trailing whitespace and blank lines are dropped.
 */
Result<std::vector<std::string>> readlines(const std::filesystem::path &file);

/** @brief Elements of `items` not present in `removed`, in their original order. */
std::vector<std::string> filter_out(const std::vector<std::string> &items, const std::vector<std::string> &removed);

/** @brief Expands a shell wildcard pattern. Results are sorted; no match is an empty list. */
Result<std::vector<std::string>> glob(const std::string &pattern);

} // namespace kninja
