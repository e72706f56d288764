#pragma once

#include <jv/payload.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace jv {

constexpr size_t kDefaultPoolCapacity = 64;

// Thread-safe pool of reusable Payload instances.
//
// release() resets the instance before storing it, so every acquire()
// returns a Payload indistinguishable from a freshly constructed one.
class PayloadPool {
  public:
    explicit PayloadPool(size_t capacity = kDefaultPoolCapacity) : capacity_(capacity) {}

    PayloadPool(const PayloadPool&) = delete;
    PayloadPool& operator=(const PayloadPool&) = delete;

    std::unique_ptr<Payload> acquire();

    // Instances beyond the capacity are destroyed.
    void release(std::unique_ptr<Payload> payload);

    // Number of idle instances.
    size_t size() const;
    size_t capacity() const noexcept { return capacity_; }

  private:
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Payload>> idle_;
    size_t capacity_;
};

// Process-wide pool.
PayloadPool& global_pool();

inline std::unique_ptr<Payload> acquire_payload() { return global_pool().acquire(); }
inline void release_payload(std::unique_ptr<Payload> payload) { global_pool().release(std::move(payload)); }

}  // namespace jv
