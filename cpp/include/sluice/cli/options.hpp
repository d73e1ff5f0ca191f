#pragma once

#include <string>
#include <type_traits>

#include "sluice/core/errors.hpp"
#include "sluice/core/types.hpp"

namespace sluice::cli {
    using u32 = sluice::core::u32;
    using i64 = sluice::core::i64;

    constexpr int kExitOk = 0;
    constexpr int kExitFailed = 1;
    constexpr int kExitUsage = 2;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    struct PutOptions {
        std::string root;
        std::string bucket;
        std::string object;
        std::string input{"-"};     // Path, or "-" for stdin
        std::string digest_hex;
        i64 size_bytes{0};
        bool size_given{false};
        bool quiet{false};
        bool help{false};
    };

    // Parse sluice-put arguments, argv[0] excluded.
    // - Options: --root, --digest, --size (as "--name value" or "--name=value"),
    //   -q/--quiet, -h/--help; "--" ends options
    // - Positionals: <bucket> <object> [FILE|-]
    // - --size must be a non-negative integer
    // Usage errors return Cli/Invalid with *bad_token (when given) set to
    // the offending argument, or nullptr for a wrong positional count.
    [[nodiscard]] sluice::core::Status parse_put_options(const CliArgs& args,
                                                         PutOptions* out,
                                                         const char** bad_token) noexcept;

    // --root, else $SLUICE_ROOT, else $HOME/sluice/buckets, else /tmp/sluice/buckets.
    [[nodiscard]] sluice::core::Status resolve_put_root(PutOptions* opts) noexcept;

    // An explicit --size always wins. Otherwise a file input takes
    // *input_size and stdin is a usage error.
    [[nodiscard]] sluice::core::Status resolve_put_size(PutOptions* opts, const i64* input_size) noexcept;

    [[nodiscard]] int exit_code_for(sluice::core::Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_standard_layout_v<CliArgs>);

} // namespace sluice::cli
