#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "sluice/storage/destination.hpp"

// In-memory destination with failure injection, for driving the worker
// through paths a real filesystem rarely takes.
class MemoryDestination final : public sluice::storage::Destination {
public:
    struct Faults {
        sluice::core::Status create{};             // returned by create_exclusive
        sluice::core::u64 fail_write_after{~0ull}; // bytes accepted before write fails
        sluice::core::Status commit{};             // returned by commit
    };

    Faults faults;

    sluice::core::Status create_exclusive(const std::string& bucket,
                                          const std::string& object,
                                          sluice::core::u64 size_bytes,
                                          std::unique_ptr<sluice::storage::Sink>* out) noexcept override {
        (void)size_bytes;
        if (!sluice::core::is_ok(faults.create)) {
            return faults.create;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const std::string key = bucket + "/" + object;
        if (objects_.count(key) != 0 || open_.count(key) != 0) {
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Exists);
        }
        open_[key] = std::string();
        ++created_;
        *out = std::make_unique<MemorySink>(this, key);
        return sluice::core::ok_status();
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(key) != 0;
    }

    bool has_partial(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_.count(key) != 0;
    }

    std::string get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(key);
        return it == objects_.end() ? std::string() : it->second;
    }

    void put(const std::string& key, const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[key] = data;
    }

    int created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }

private:
    class MemorySink final : public sluice::storage::Sink {
    public:
        MemorySink(MemoryDestination* owner, std::string key) : owner_(owner), key_(std::move(key)) {}
        ~MemorySink() override { discard(); }

        sluice::core::Status write(sluice::core::BufferView data) noexcept override {
            std::lock_guard<std::mutex> lock(owner_->mutex_);
            std::string& buf = owner_->open_[key_];
            if (buf.size() + data.len > owner_->faults.fail_write_after) {
                return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Io, 28);
            }
            buf.append(reinterpret_cast<const char*>(data.data), static_cast<size_t>(data.len));
            return sluice::core::ok_status();
        }

        sluice::core::Status commit() noexcept override {
            if (!sluice::core::is_ok(owner_->faults.commit)) {
                return owner_->faults.commit;
            }
            std::lock_guard<std::mutex> lock(owner_->mutex_);
            owner_->objects_[key_] = owner_->open_[key_];
            owner_->open_.erase(key_);
            done_ = true;
            return sluice::core::ok_status();
        }

        void discard() noexcept override {
            if (done_) return;
            std::lock_guard<std::mutex> lock(owner_->mutex_);
            owner_->open_.erase(key_);
            done_ = true;
        }

    private:
        MemoryDestination* owner_;
        std::string key_;
        bool done_{false};
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::map<std::string, std::string> open_;
    int created_{0};
};
