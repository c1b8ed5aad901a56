#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kninja {

/**
 * @brief Escapes a path for use in a `build` or `default` line.
 *
 * Spaces and colons are significant in those positions, so they get a `$`
 * prefix. Variable references (`$out`, `$builddir/...`) are left alone.
 */
std::string escape_path(std::string_view word);

/** @brief Escapes a literal value so that ninja does not expand `$` in it. */
std::string escape(std::string_view value);

/**
 * @brief Low level writer for the ninja manifest syntax.
 *
 * Writes one declaration at a time to the wrapped stream, wrapping long lines
 * at `width` columns with `$` continuations.
 */
class NinjaWriter {
public:
    explicit NinjaWriter(std::ostream &out, size_t width = 78) : out_(out), width_(width) {
    }

    void newline();
    void comment(std::string_view text);
    void variable(std::string_view key, std::string_view value, size_t indent = 0);
    void variable(std::string_view key, const std::vector<std::string> &values, size_t indent = 0);
    void pool(std::string_view name, unsigned depth);
    void rule(std::string_view name, std::string_view command, const std::optional<std::string> &description);

    /**
     * @brief Writes one `build` statement.
     *
     * Empty input paths are skipped: they stand for "no real input".
     */
    void build(const std::vector<std::string> &outputs, std::string_view rule, const std::vector<std::string> &inputs,
               const std::vector<std::string> &implicit = {}, const std::vector<std::string> &order_only = {},
               const std::map<std::string, std::string> &variables = {},
               const std::vector<std::string> &implicit_outputs = {},
               const std::optional<std::string> &pool = std::nullopt);

    void default_targets(const std::vector<std::string> &paths);

private:
    void line(std::string text, size_t indent = 0);

    std::ostream &out_;
    size_t width_;
};

} // namespace kninja
