#include "kninja/paths.hpp"

#include "kninja/mmap.hpp"
#include "kninja/utility.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <glob.h>

namespace fs = std::filesystem;

namespace kninja {

namespace {

std::string normalized_absolute(std::string_view path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) {
        abs = fs::path(path);
    }
    std::string s = abs.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

std::string_view rstrip(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\v' ||
                          s.back() == '\f')) {
        s.remove_suffix(1);
    }
    return s;
}

class GlobBuffer {
public:
    GlobBuffer() = default;
    ~GlobBuffer() {
        globfree(&buf);
    }
    GlobBuffer(const GlobBuffer &) = delete;
    GlobBuffer &operator=(const GlobBuffer &) = delete;

    glob_t buf{};
};

} // namespace

std::string join(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (std::string_view part : parts) {
        if (!part.empty() && part.front() == '/') {
            out = part;
        } else if (out.empty() || out.back() == '/') {
            out += part;
        } else {
            out += '/';
            out += part;
        }
    }
    return out;
}

std::string basename_no_ext(std::string_view path) {
    return fs::path(path).stem().string();
}

std::string get_extension(std::string_view path) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty()) {
        ext.erase(0, 1);
    }
    return ext;
}

std::string replace_extension(std::string_view path, std::string_view extension) {
    return fs::path(path).replace_extension(extension).string();
}

std::string append_extension(std::string_view path, std::string_view extension) {
    return std::format("{}.{}", path, extension);
}

bool is_subpath(std::string_view path, std::string_view parent) {
    std::string p = normalized_absolute(path);
    std::string base = normalized_absolute(parent);
    if (base == "/") {
        return p.size() > 1;
    }
    return p.starts_with(base + '/');
}

Result<std::string> place_in_dir(std::string_view path, std::string_view dir) {
    if (path.empty()) {
        return fail(ErrorKind::configuration, "cannot place an empty path in '{}'", dir);
    }
    if (path.front() == '/') {
        return fail(ErrorKind::configuration, "cannot place absolute path '{}' in '{}': only relative paths are supported",
                    path, dir);
    }

    // Leading ".." would climb out of `dir`; drop them so the result stays inside.
    const fs::path normal = fs::path(path).lexically_normal();
    fs::path inside;
    auto it = normal.begin();
    while (it != normal.end() && *it == "..") {
        ++it;
    }
    for (; it != normal.end(); ++it) {
        inside /= *it;
    }

    const std::string rel = inside.string();
    if (rel.empty() || rel == ".") {
        return fail(ErrorKind::configuration, "cannot place '{}' in '{}': it does not name a file", path, dir);
    }
    if (is_subpath(rel, dir)) {
        return rel;
    }
    return join({dir, rel});
}

Result<std::vector<std::string>> readlines(const fs::path &file) {
    std::string_view content;
    std::unique_ptr<MappedFile> mapped;
    try {
        mapped = std::make_unique<MappedFile>(file);
        content = mapped->content();
    } catch (const std::exception &err) {
        return fail(ErrorKind::io, "{}", err.what());
    }

    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }

        std::string_view line = content.substr(start, end - start);
        if (size_t hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = rstrip(line);
        if (!line.empty()) {
            lines.emplace_back(line);
        }

        start = end + 1;
    }
    return lines;
}

std::vector<std::string> filter_out(const std::vector<std::string> &items, const std::vector<std::string> &removed) {
    std::unordered_set<std::string_view> drop(removed.begin(), removed.end());
    std::vector<std::string> kept;
    kept.reserve(items.size());
    std::ranges::copy_if(items, std::back_inserter(kept), [&](const std::string &item) {
        return !drop.contains(item);
    });
    return kept;
}

Result<std::vector<std::string>> glob(const std::string &pattern) {
    GlobBuffer g;
    int rc = ::glob(pattern.c_str(), 0, nullptr, &g.buf);
    if (rc == GLOB_NOMATCH) {
        return std::vector<std::string>{};
    }
    if (rc != 0) {
        return fail(ErrorKind::io, "glob '{}' failed ({})", pattern, rc == GLOB_NOSPACE ? "out of memory" : "read error");
    }

    std::vector<std::string> paths;
    paths.reserve(g.buf.gl_pathc);
    for (size_t i = 0; i < g.buf.gl_pathc; ++i) {
        paths.emplace_back(g.buf.gl_pathv[i]);
    }
    std::ranges::sort(paths);
    return paths;
}

} // namespace kninja
