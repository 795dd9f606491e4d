/**
 * Hydrolink - Observer Registry
 * Handle-based subscribe/unsubscribe with lock-free delivery
 *
 * notify() snapshots the registry under the lock and invokes callbacks with
 * the lock released, so a callback may unsubscribe itself (or anyone else)
 * without deadlocking. A slot removed while a snapshot is being delivered is
 * skipped if it has not been reached yet.
 */

#ifndef OBSERVERS_H
#define OBSERVERS_H

#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

typedef uint32_t SubscriptionHandle;

#define INVALID_SUBSCRIPTION 0

// Handles are unique across every registry in the process, so a single
// unsubscribe() can route a handle without knowing its registry
inline SubscriptionHandle observerNextHandle() {
    static std::atomic<SubscriptionHandle> next(1);
    SubscriptionHandle handle = next.fetch_add(1);
    if (handle == INVALID_SUBSCRIPTION) {
        handle = next.fetch_add(1);
    }
    return handle;
}

template <typename... Args>
class ObserverRegistry {
public:
    typedef std::function<void(Args...)> Callback;

    ObserverRegistry() {}

    SubscriptionHandle add(const Callback& callback) {
        if (!callback) {
            return INVALID_SUBSCRIPTION;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        Slot slot;
        slot.handle = observerNextHandle();
        slot.callback = std::make_shared<Callback>(callback);
        slot.alive = std::make_shared<std::atomic<bool>>(true);
        m_slots.push_back(slot);
        return slot.handle;
    }

    // Returns false if the handle is unknown (already removed)
    bool remove(SubscriptionHandle handle) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (typename std::vector<Slot>::iterator it = m_slots.begin(); it != m_slots.end(); ++it) {
            if (it->handle == handle) {
                it->alive->store(false);
                m_slots.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_slots.size(); i++) {
            m_slots[i].alive->store(false);
        }
        m_slots.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slots.size();
    }

    void notify(Args... args) {
        std::vector<Slot> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_slots;
        }
        for (size_t i = 0; i < snapshot.size(); i++) {
            if (snapshot[i].alive->load()) {
                (*snapshot[i].callback)(args...);
            }
        }
    }

private:
    struct Slot {
        SubscriptionHandle handle;
        std::shared_ptr<Callback> callback;
        std::shared_ptr<std::atomic<bool>> alive;
    };

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
};

#endif // OBSERVERS_H
