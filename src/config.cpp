#include "kninja/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <unistd.h>

namespace fs = std::filesystem;

namespace kninja {

std::optional<std::string> find_program(std::string_view name) {
    if (name.find('/') != std::string_view::npos) {
        if (access(std::string(name).c_str(), X_OK) == 0) {
            return std::string(name);
        }
        return std::nullopt;
    }

    const char *path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view remaining = path_env;
    while (true) {
        size_t colon = remaining.find(':');
        std::string_view dir = remaining.substr(0, colon);
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;

        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }

        if (colon == std::string_view::npos)
            break;
        remaining = remaining.substr(colon + 1);
    }
    return std::nullopt;
}

Result<ProjectConfig> ProjectConfig::from_environment() {
    ProjectConfig config;

    if (const char *dir = std::getenv(std::string(KNINJA_DIR_ENV).c_str()); dir && *dir) {
        config.kninja_dir = dir;
    }

    if (std::getenv(std::string(USE_SYSTEM_K_ENV).c_str())) {
        config.use_system_k = true;
        auto kompile = find_program("kompile");
        if (!kompile) {
            return fail(ErrorKind::configuration, "\"kompile\" not found in PATH ({} is set)", USE_SYSTEM_K_ENV);
        }
        // <release>/bin/kompile
        config.k_release_dir = fs::path(*kompile).parent_path().parent_path().string();
    }

    return config;
}

} // namespace kninja
