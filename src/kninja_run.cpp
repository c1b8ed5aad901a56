#include "kninja/registry.hpp"
#include "kninja/runner.hpp"

#include <filesystem>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

void print_help() {
    std::println("Usage: kninja-run [options] {{kast,run,prove}} [--definition NAME] <path> [args...]");
    std::println("Options:");
    std::println("  -h, --help       Show this help message");
    std::println("  -v, --version    Show version");
    std::println("  -C <dir>         Change working directory before doing anything");
    std::println("  -f <file>        Read definitions from <file> (default: .build/definitions.json)");
    std::println("  -d <alias>       Definition used when --definition is not given");
}

void print_version() {
    std::println("kninja-run {}", KNINJA_PROJ_VER);
}

int main(const int argc, const char *const *argv) {
    std::string registry_path = ".build/definitions.json";
    std::filesystem::path work_dir = ".";
    std::optional<std::string> default_definition;

    // Options before the mode belong to kninja-run; the rest to the runner.
    int i = 1;
    for (; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-C" || arg == "-f" || arg == "-d") {
            if (i + 1 >= argc) {
                std::println(stderr, "Missing argument for {}", arg);
                return 2;
            }
            if (arg == "-C") {
                work_dir = argv[i + 1];
            } else if (arg == "-f") {
                registry_path = argv[i + 1];
            } else {
                default_definition = argv[i + 1];
            }
            i++;
        } else {
            break;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(stderr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    auto registry = kninja::DefinitionRegistry::load(registry_path);
    if (!registry) {
        std::println(stderr, "{}", registry.error());
        std::println(stderr, "Run the build description first to generate {}.", registry_path);
        return 1;
    }

    kninja::Runner runner{std::move(*registry), std::move(default_definition)};
    return runner.main(std::span<const char *const>(argv + i, static_cast<size_t>(argc - i)));
}
