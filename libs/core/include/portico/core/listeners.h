#pragma once

#include <cstdint>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/refcount.h>
#include <kj/mutex.h>
#include <kj/vector.h>

namespace portico::core {

using ListenerId = uint64_t;

/**
 * @brief Explicit subscription list for state-change notifications
 *
 * Components mutate their own state first, release their locks, then call notify().
 * Callbacks run on the notifying thread. A callback may unsubscribe itself or others;
 * removals take effect for the next notify().
 */
template <typename Event> class ListenerSet {
public:
  using Callback = kj::Function<void(const Event&)>;

  ListenerId subscribe(Callback callback) {
    auto lock = guarded_.lockExclusive();
    ListenerId id = ++lock->next_id;
    lock->listeners.insert(id, kj::atomicRefcounted<Entry>(kj::mv(callback)));
    return id;
  }

  bool unsubscribe(ListenerId id) {
    return guarded_.lockExclusive()->listeners.erase(id);
  }

  void notify(const Event& event) {
    kj::Vector<kj::Own<const Entry>> snapshot;
    {
      auto lock = guarded_.lockExclusive();
      snapshot.reserve(lock->listeners.size());
      for (auto& entry : lock->listeners) {
        snapshot.add(kj::atomicAddRef(*entry.value));
      }
    }
    for (auto& entry : snapshot) {
      entry->callback(event);
    }
  }

  [[nodiscard]] size_t size() const {
    return guarded_.lockShared()->listeners.size();
  }

private:
  struct Entry : public kj::AtomicRefcounted {
    explicit Entry(Callback cb) : callback(kj::mv(cb)) {}
    mutable Callback callback;
  };

  struct State {
    ListenerId next_id = 0;
    kj::TreeMap<ListenerId, kj::Own<const Entry>> listeners;
  };

  kj::MutexGuarded<State> guarded_;
};

} // namespace portico::core
