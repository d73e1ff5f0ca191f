#include "sluice/cli/put.hpp"

#include <cerrno>
#include <memory>
#include <new>
#include <vector>

#include "sluice/storage/fs_destination.hpp"
#include "sluice/upload/upload.hpp"

namespace sluice::cli {

using namespace sluice::core;

Status put_stream(const PutOptions& opts, std::FILE* in, u64* bytes_written) noexcept {
    if (in == nullptr || bytes_written == nullptr) {
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
    *bytes_written = 0;

    sluice::storage::FsDestinationConfig dest_cfg{
        .root = opts.root.c_str(),
        .dir_mode = 0755,
        .file_mode = 0644,
        .max_object_bytes = 0,
        .sync_on_commit = true
    };

    try {
        sluice::storage::FsDestination dest(dest_cfg);

        sluice::upload::UploadRequest request;
        request.bucket = opts.bucket;
        request.object = opts.object;
        request.size_bytes = opts.size_bytes;
        request.digest_hex = opts.digest_hex;

        std::vector<u8> buf(kPutWriteBytes);

        std::unique_ptr<sluice::upload::BlockingWriter> writer;
        Status s = sluice::upload::begin_upload(&dest, std::move(request), &writer);
        if (!is_ok(s)) {
            return s;
        }

        while (true) {
            const size_t n = std::fread(buf.data(), 1, buf.size(), in);
            if (n > 0) {
                u64 written = 0;
                s = writer->write({buf.data(), static_cast<u64>(n)}, &written);
                if (!is_ok(s)) {
                    // The worker has already failed; close() reports why.
                    break;
                }
            }
            if (n < buf.size()) {
                if (std::ferror(in)) {
                    *bytes_written = writer->bytes_written();
                    writer.reset();
                    return make_status(StatusDomain::Cli, StatusCode::Io, EIO);
                }
                break;
            }
        }

        s = writer->close();
        *bytes_written = writer->bytes_written();
        return s;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Cli, StatusCode::Unavailable);
    }
}

} // namespace sluice::cli
