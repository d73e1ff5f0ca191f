#include "sluice/cli/options.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <new>

namespace sluice::cli {
    namespace {
        [[nodiscard]] sluice::core::Status usage_error() noexcept {
            return sluice::core::make_status(sluice::core::StatusDomain::Cli, sluice::core::StatusCode::Invalid);
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        enum class Match : u32 {
            No = 0,
            Yes = 1,
            MissingValue = 2,
        };

        // Accepts "--name value" and "--name=value".
        [[nodiscard]] Match take_value(const CliArgs& args, u32* i, const char* name, const char** value) noexcept {
            const char* tok = args.argv[*i];
            const size_t name_len = std::strlen(name);
            if (std::strncmp(tok, name, name_len) != 0) {
                return Match::No;
            }
            if (tok[name_len] == '=') {
                *value = tok + name_len + 1;
                return Match::Yes;
            }
            if (tok[name_len] != '\0') {
                return Match::No;
            }
            if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                return Match::MissingValue;
            }
            *value = args.argv[++*i];
            return Match::Yes;
        }

        [[nodiscard]] sluice::core::Status parse_into(const CliArgs& args,
                                                      PutOptions* out,
                                                      const char** bad_token) {
            const char* positional[3]{};
            u32 positional_count = 0;
            bool options_done = false;

            for (u32 i = 0; i < args.argc; ++i) {
                const char* tok = args.argv[i];
                if (tok == nullptr) {
                    break;
                }

                if (!options_done && tok[0] == '-' && tok[1] != '\0') {
                    const char* value = nullptr;
                    Match m = Match::No;
                    if (std::strcmp(tok, "--") == 0) {
                        options_done = true;
                    } else if (std::strcmp(tok, "-h") == 0 || std::strcmp(tok, "--help") == 0) {
                        out->help = true;
                    } else if (std::strcmp(tok, "-q") == 0 || std::strcmp(tok, "--quiet") == 0) {
                        out->quiet = true;
                    } else if ((m = take_value(args, &i, "--root", &value)) == Match::Yes) {
                        out->root = value;
                    } else if (m == Match::No && (m = take_value(args, &i, "--digest", &value)) == Match::Yes) {
                        out->digest_hex = value;
                    } else if (m == Match::No && (m = take_value(args, &i, "--size", &value)) == Match::Yes) {
                        i64 v{};
                        if (!parse_i64(value, &v) || v < 0) {
                            *bad_token = tok;
                            return usage_error();
                        }
                        out->size_bytes = v;
                        out->size_given = true;
                    } else {
                        *bad_token = tok;
                        return usage_error();
                    }
                    continue;
                }

                if (positional_count == 3) {
                    *bad_token = tok;
                    return usage_error();
                }
                positional[positional_count++] = tok;
            }

            if (out->help) {
                return sluice::core::ok_status();
            }
            if (positional_count < 2) {
                return usage_error();
            }

            out->bucket = positional[0];
            out->object = positional[1];
            out->input = positional_count == 3 ? positional[2] : "-";
            return sluice::core::ok_status();
        }
    } // namespace

    sluice::core::Status parse_put_options(const CliArgs& args,
                                           PutOptions* out,
                                           const char** bad_token) noexcept {
        const char* ignored = nullptr;
        if (bad_token == nullptr) {
            bad_token = &ignored;
        }
        *bad_token = nullptr;

        if (out == nullptr || (args.argc > 0 && args.argv == nullptr)) {
            return usage_error();
        }
        *out = PutOptions{};

        try {
            return parse_into(args, out, bad_token);
        } catch (const std::bad_alloc&) {
            return sluice::core::make_status(sluice::core::StatusDomain::Cli, sluice::core::StatusCode::Unavailable);
        }
    }

    sluice::core::Status resolve_put_root(PutOptions* opts) noexcept {
        if (opts == nullptr) {
            return usage_error();
        }
        if (!opts->root.empty()) {
            return sluice::core::ok_status();
        }

        try {
            const char* env = std::getenv("SLUICE_ROOT");
            if (env && *env) {
                opts->root = env;
                return sluice::core::ok_status();
            }

            const char* home = std::getenv("HOME");
            if (home && *home) {
                opts->root = std::string(home) + "/sluice/buckets";
            } else {
                opts->root = "/tmp/sluice/buckets";
            }
        } catch (const std::bad_alloc&) {
            return sluice::core::make_status(sluice::core::StatusDomain::Cli, sluice::core::StatusCode::Unavailable);
        }
        return sluice::core::ok_status();
    }

    sluice::core::Status resolve_put_size(PutOptions* opts, const i64* input_size) noexcept {
        if (opts == nullptr) {
            return usage_error();
        }
        if (opts->size_given) {
            return sluice::core::ok_status();
        }
        if (opts->input == "-" || input_size == nullptr || *input_size < 0) {
            return usage_error();
        }
        opts->size_bytes = *input_size;
        return sluice::core::ok_status();
    }

    int exit_code_for(sluice::core::Status s) noexcept {
        if (sluice::core::is_ok(s)) {
            return kExitOk;
        }
        if (s.domain == sluice::core::StatusDomain::Cli && s.code == sluice::core::StatusCode::Invalid) {
            return kExitUsage;
        }
        return kExitFailed;
    }

} // namespace sluice::cli
