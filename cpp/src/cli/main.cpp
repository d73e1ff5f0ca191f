#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

#include "sluice/cli/options.hpp"
#include "sluice/cli/put.hpp"
#include "sluice/core/errors.hpp"

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error_detailed(const char* context, sluice::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            sluice::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            sluice::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == sluice::core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

void print_usage() {
    fprintf(stderr,
            "usage: sluice-put [--root DIR] [--digest HEX] [--size N] [--quiet] <bucket> <object> [FILE|-]\n");
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    sluice::cli::PutOptions opts;
    const char* bad_token = nullptr;
    const sluice::cli::CliArgs args{argv + 1, static_cast<sluice::cli::u32>(argc > 0 ? argc - 1 : 0)};

    sluice::core::Status s = sluice::cli::parse_put_options(args, &opts, &bad_token);
    if (!sluice::core::is_ok(s)) {
        if (bad_token) {
            fprintf(stderr, "error: bad argument: %s\n", bad_token);
        }
        print_usage();
        return sluice::cli::exit_code_for(s);
    }
    if (opts.help) {
        print_usage();
        return sluice::cli::kExitOk;
    }

    s = sluice::cli::resolve_put_root(&opts);
    if (!sluice::core::is_ok(s)) {
        print_status_error_detailed("resolve root", s);
        return sluice::cli::exit_code_for(s);
    }

    std::error_code ec;
    std::filesystem::create_directories(opts.root, ec);
    if (ec) {
        fprintf(stderr, "error: cannot create root %s: %s\n", opts.root.c_str(), ec.message().c_str());
        return sluice::cli::kExitFailed;
    }

    FILE* in = stdin;
    const bool from_stdin = opts.input == "-";
    sluice::cli::i64 input_size = -1;
    if (!from_stdin) {
        in = fopen(opts.input.c_str(), "rb");
        if (!in) {
            fprintf(stderr, "error: cannot open %s: %s\n", opts.input.c_str(), std::strerror(errno));
            return sluice::cli::kExitFailed;
        }
        struct stat st{};
        if (fstat(fileno(in), &st) != 0) {
            fprintf(stderr, "error: cannot stat %s: %s\n", opts.input.c_str(), std::strerror(errno));
            fclose(in);
            return sluice::cli::kExitFailed;
        }
        input_size = static_cast<sluice::cli::i64>(st.st_size);
    }

    s = sluice::cli::resolve_put_size(&opts, from_stdin ? nullptr : &input_size);
    if (!sluice::core::is_ok(s)) {
        print_error("--size is required when reading stdin");
        if (!from_stdin) {
            fclose(in);
        }
        return sluice::cli::exit_code_for(s);
    }

    if (!opts.quiet) {
        fprintf(stderr, "info: root=%s\n", opts.root.c_str());
        fprintf(stderr, "info: uploading %lld bytes to %s/%s\n",
                static_cast<long long>(opts.size_bytes), opts.bucket.c_str(), opts.object.c_str());
    }

    sluice::cli::u64 written = 0;
    s = sluice::cli::put_stream(opts, in, &written);

    if (!from_stdin) {
        fclose(in);
    }

    if (!sluice::core::is_ok(s)) {
        print_status_error_detailed("upload", s);
        return sluice::cli::exit_code_for(s);
    }

    printf("%s/%s  %llu\n", opts.bucket.c_str(), opts.object.c_str(),
           static_cast<unsigned long long>(written));
    return sluice::cli::kExitOk;
}
