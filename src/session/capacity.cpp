#include "voice_bridge/session/capacity.hpp"

#include <stdexcept>

namespace voice_bridge::session {

CapacityTicket::CapacityTicket(std::shared_ptr<CapacityPool> pool) : pool_(std::move(pool)) {}

CapacityTicket::~CapacityTicket() {
    release();
}

bool CapacityTicket::release() {
    if (released_.exchange(true)) {
        return false;
    }
    pool_->release_slot();
    return true;
}

CapacityPool::CapacityPool(int capacity) : capacity_(capacity) {
    if (capacity <= 0) {
        throw std::invalid_argument("capacity must be positive");
    }
}

std::shared_ptr<CapacityPool> CapacityPool::create(int capacity) {
    return std::shared_ptr<CapacityPool>(new CapacityPool(capacity));
}

std::unique_ptr<CapacityTicket> CapacityPool::try_acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ >= capacity_) {
            return nullptr;
        }
        ++active_;
    }
    return std::unique_ptr<CapacityTicket>(new CapacityTicket(shared_from_this()));
}

int CapacityPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void CapacityPool::release_slot() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ > 0) {
        --active_;
    }
}

}
