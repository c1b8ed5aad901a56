#include "kninja/backend.hpp"

#include "kninja/paths.hpp"

#include <string>
#include <string_view>

namespace kninja {

Result<Backend> parse_backend(std::string_view name) {
    for (Backend b : all_backends) {
        if (to_string(b) == name) {
            return b;
        }
    }
    return fail(ErrorKind::configuration, "Unknown backend \"{}\" (expected llvm, java or haskell)", name);
}

std::string kompiled_output(Backend backend, std::string_view kompiled_dir) {
    switch (backend) {
    case Backend::llvm:
        return join({kompiled_dir, "interpreter"});
    case Backend::java:
        return join({kompiled_dir, "timestamp"});
    case Backend::haskell:
        return join({kompiled_dir, "definition.kore"});
    }
    return join({kompiled_dir, "timestamp"});
}

std::string_view build_k_flags(Backend backend) {
    switch (backend) {
    case Backend::java:
        return "-Dllvm.backend.skip -Dhaskell.backend.skip";
    case Backend::haskell:
        return "-Dllvm.backend.skip";
    case Backend::llvm:
        return "-Dhaskell.backend.skip -Dproject.build.type=RelWithDebInfo";
    }
    return "";
}

} // namespace kninja
