#include "squink/event_hub.h"

#include <algorithm>
#include <span>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/synchronization/mutex.h"

namespace squink {

void EventHub::Subscribe(GameListener* listener) {
  CHECK(listener != nullptr);
  absl::MutexLock lock(&mu_);
  listeners_.push_back(listener);
}

void EventHub::Unsubscribe(GameListener* listener) {
  absl::MutexLock lock(&mu_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                   listeners_.end());
}

void EventHub::Enqueue(std::span<const GameEvent> events) {
  absl::MutexLock lock(&mu_);
  pending_.insert(pending_.end(), events.begin(), events.end());
}

void EventHub::Drain() {
  {
    absl::MutexLock lock(&mu_);
    if (draining_) {
      return;
    }
    draining_ = true;
  }
  while (true) {
    GameEvent event;
    std::vector<GameListener*> listeners;
    {
      absl::MutexLock lock(&mu_);
      if (pending_.empty()) {
        draining_ = false;
        return;
      }
      event = std::move(pending_.front());
      pending_.pop_front();
      listeners = listeners_;
    }
    for (GameListener* listener : listeners) {
      listener->OnGameEvent(event);
    }
  }
}

}  // namespace squink
