#include <jv/pool.h>

namespace jv {

std::unique_ptr<Payload> PayloadPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            auto payload = std::move(idle_.back());
            idle_.pop_back();
            return payload;
        }
    }
    return std::make_unique<Payload>();
}

void PayloadPool::release(std::unique_ptr<Payload> payload) {
    if (!payload) return;
    payload->reset();
    std::lock_guard<std::mutex> lock(mutex_);
    if (idle_.size() < capacity_) idle_.push_back(std::move(payload));
}

size_t PayloadPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

PayloadPool& global_pool() {
    static PayloadPool pool;
    return pool;
}

}  // namespace jv
