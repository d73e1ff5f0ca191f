#pragma once

#include <memory>
#include <string>

#include "sluice/storage/destination.hpp"

namespace sluice::storage {

// Filesystem destination configuration
struct FsDestinationConfig {
    const char* root{nullptr};      // Directory holding one subdirectory per bucket
    u32 dir_mode{0755};             // Mode for bucket and intermediate directories
    u32 file_mode{0644};            // Mode for object files
    u64 max_object_bytes{0};        // Maximum declared size (0 = unlimited)
    bool sync_on_commit{true};      // fsync object before commit reports success
};

// Resolve (bucket, object) to {root}/{bucket}/{object}
// - bucket must be a single path component other than "." and ".."
// - object must be relative, with no empty, "." or ".." components
[[nodiscard]] sluice::core::Status join_object_path(const char* root,
                                                    const std::string& bucket,
                                                    const std::string& object,
                                                    std::string* out) noexcept;

// Objects are plain files created with O_EXCL, so the existence check and
// the creation are one step. Missing directories are created on demand.
class FsDestination final : public Destination {
public:
    explicit FsDestination(const FsDestinationConfig& cfg);

    [[nodiscard]] sluice::core::Status create_exclusive(const std::string& bucket,
                                                        const std::string& object,
                                                        u64 size_bytes,
                                                        std::unique_ptr<Sink>* out) noexcept override;

private:
    std::string root_;
    FsDestinationConfig config_;
};

} // namespace sluice::storage
