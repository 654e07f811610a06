#pragma once

#include <atomic>
#include <memory>
#include <mutex>

namespace voice_bridge {
namespace session {

class CapacityPool;

// One held slot. Released exactly once, by release() or on destruction.
class CapacityTicket {
public:
    ~CapacityTicket();

    CapacityTicket(const CapacityTicket&) = delete;
    CapacityTicket& operator=(const CapacityTicket&) = delete;

    // Returns true only for the call that actually freed the slot.
    bool release();
    bool released() const { return released_; }

private:
    friend class CapacityPool;
    explicit CapacityTicket(std::shared_ptr<CapacityPool> pool);

    std::shared_ptr<CapacityPool> pool_;
    std::atomic<bool> released_{false};
};

class CapacityPool : public std::enable_shared_from_this<CapacityPool> {
public:
    static std::shared_ptr<CapacityPool> create(int capacity);

    // Empty when every slot is taken. Never blocks.
    std::unique_ptr<CapacityTicket> try_acquire();

    int active() const;
    int capacity() const { return capacity_; }

private:
    friend class CapacityTicket;
    explicit CapacityPool(int capacity);
    void release_slot();

    const int capacity_;
    mutable std::mutex mutex_;
    int active_ = 0;
};

}
}
