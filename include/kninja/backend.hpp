#pragma once

#include "kninja/utility.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace kninja {

/** @brief The K compilation backends a definition can be kompiled for. */
enum class Backend : uint8_t {
    llvm,
    java,
    haskell,
};

inline constexpr std::array<Backend, 3> all_backends = {Backend::llvm, Backend::java, Backend::haskell};

constexpr std::string_view to_string(Backend backend) {
    switch (backend) {
    case Backend::llvm:
        return "llvm";
    case Backend::java:
        return "java";
    case Backend::haskell:
        return "haskell";
    }
    return "unknown";
}

Result<Backend> parse_backend(std::string_view name);

/**
 * @brief The file `kompile` writes last for `backend`, used as the
 *        artifact's output path.
 *
 * llvm: `<kompiled_dir>/interpreter`, java: `<kompiled_dir>/timestamp`,
 * haskell: `<kompiled_dir>/definition.kore`.
 */
std::string kompiled_output(Backend backend, std::string_view kompiled_dir);

/** @brief Maven flags that build K with only the backends `backend` needs. */
std::string_view build_k_flags(Backend backend);

} // namespace kninja
