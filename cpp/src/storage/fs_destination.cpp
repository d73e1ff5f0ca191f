#include "sluice/storage/fs_destination.hpp"

#include <cerrno>
#include <new>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace sluice::storage {

using namespace sluice::core;

// ========================================================================
// Internal Helpers
// ========================================================================

namespace {

[[nodiscard]] bool is_dot_name(const std::string& s, size_t pos, size_t len) {
    if (len == 1 && s[pos] == '.') return true;
    if (len == 2 && s[pos] == '.' && s[pos + 1] == '.') return true;
    return false;
}

[[nodiscard]] bool bucket_name_ok(const std::string& bucket) {
    if (bucket.empty()) return false;
    if (bucket.find('/') != std::string::npos) return false;
    if (bucket.find('\0') != std::string::npos) return false;
    return !is_dot_name(bucket, 0, bucket.size());
}

[[nodiscard]] bool object_name_ok(const std::string& object) {
    if (object.empty() || object[0] == '/') return false;
    if (object.find('\0') != std::string::npos) return false;

    size_t start = 0;
    while (start <= object.size()) {
        size_t end = object.find('/', start);
        if (end == std::string::npos) end = object.size();
        const size_t len = end - start;
        if (len == 0) return false;  // "a//b" or trailing '/'
        if (is_dot_name(object, start, len)) return false;
        start = end + 1;
    }
    return true;
}

// Create every missing directory above the file at path.
// Throws std::bad_alloc only.
Status create_parent_directories(const std::string& path, u32 mode) {
    const size_t last_slash = path.rfind('/');
    if (last_slash == std::string::npos || last_slash == 0) {
        return ok_status();
    }

    const std::string dir = path.substr(0, last_slash);
    if (mkdir(dir.c_str(), static_cast<mode_t>(mode)) == 0) {
        return ok_status();
    }

    if (errno == EEXIST) {
        return ok_status();
    }

    if (errno == ENOENT) {
        // Parent doesn't exist, recurse
        Status s = create_parent_directories(dir, mode);
        if (!is_ok(s)) return s;

        if (mkdir(dir.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }
        return ok_status();
    }

    return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
}

class FsSink final : public Sink {
public:
    FsSink(int fd, std::string path, bool sync_on_commit)
        : fd_(fd), path_(std::move(path)), sync_on_commit_(sync_on_commit) {}

    ~FsSink() override {
        discard();
    }

    FsSink(const FsSink&) = delete;
    FsSink& operator=(const FsSink&) = delete;

    Status write(BufferView data) noexcept override {
        if (fd_ < 0 || committed_) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (!data.data && data.len > 0) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        u64 written = 0;
        while (written < data.len) {
            ssize_t n = ::write(fd_, data.data + written, static_cast<size_t>(data.len - written));
            if (n < 0) {
                if (errno == EINTR) continue;
                return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
            }
            written += static_cast<u64>(n);
        }
        return ok_status();
    }

    Status commit() noexcept override {
        if (fd_ < 0 || committed_) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        if (sync_on_commit_ && fsync(fd_) != 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }

        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
        }

        committed_ = true;
        return ok_status();
    }

    void discard() noexcept override {
        if (committed_ || removed_) {
            return;
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        ::unlink(path_.c_str());
        removed_ = true;
    }

private:
    int fd_{-1};
    std::string path_;
    bool sync_on_commit_{true};
    bool committed_{false};
    bool removed_{false};
};

} // namespace

// ========================================================================
// Public API Implementation
// ========================================================================

Status join_object_path(const char* root,
                        const std::string& bucket,
                        const std::string& object,
                        std::string* out) noexcept {
    if (!out || !root || root[0] == '\0') {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (!bucket_name_ok(bucket) || !object_name_ok(object)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    try {
        std::string path(root);
        if (path.back() != '/') {
            path.push_back('/');
        }
        path += bucket;
        path.push_back('/');
        path += object;
        *out = std::move(path);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }
    return ok_status();
}

FsDestination::FsDestination(const FsDestinationConfig& cfg)
    : root_(cfg.root ? cfg.root : ""), config_(cfg) {
    config_.root = nullptr;
}

Status FsDestination::create_exclusive(const std::string& bucket,
                                       const std::string& object,
                                       u64 size_bytes,
                                       std::unique_ptr<Sink>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    if (config_.max_object_bytes > 0 && size_bytes > config_.max_object_bytes) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    std::string path;
    Status s = join_object_path(root_.c_str(), bucket, object, &path);
    if (!is_ok(s)) {
        return s;
    }

    try {
        s = create_parent_directories(path, config_.dir_mode);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }
    if (!is_ok(s)) {
        return s;
    }

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, static_cast<mode_t>(config_.file_mode));
    if (fd < 0) {
        if (errno == EEXIST) {
            return make_status(StatusDomain::Storage, StatusCode::Exists);
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
    }

    try {
        *out = std::make_unique<FsSink>(fd, std::move(path), config_.sync_on_commit);
    } catch (const std::bad_alloc&) {
        ::close(fd);
        ::unlink(path.c_str());
        return make_status(StatusDomain::Storage, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace sluice::storage
