#include "sluice/upload/copy.hpp"

#include <algorithm>
#include <array>

namespace sluice::upload {

using namespace sluice::core;

Status copy_exactly(sluice::storage::Sink& dst,
                    sluice::io::PipeReader& src,
                    u64 n,
                    u64* copied,
                    sluice::storage::Hasher* hasher) noexcept {
    if (!copied) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }
    *copied = 0;

    std::array<u8, kCopyChunkBytes> buf;
    while (*copied < n) {
        const u64 want = std::min<u64>(n - *copied, buf.size());
        u64 got = 0;
        Status s = src.read(BufferMut{buf.data(), want}, &got);
        if (!is_ok(s)) {
            if (s.code == StatusCode::EndOfStream) {
                return make_status(StatusDomain::Upload, StatusCode::ShortTransfer);
            }
            return s;
        }

        const BufferView chunk{buf.data(), got};
        s = dst.write(chunk);
        if (!is_ok(s)) {
            return s;
        }
        if (hasher) {
            hasher->update(chunk);
        }
        *copied += got;
    }

    return ok_status();
}

} // namespace sluice::upload
