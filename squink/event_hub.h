#ifndef SQUINK_EVENT_HUB_H
#define SQUINK_EVENT_HUB_H

#include <deque>
#include <span>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "squink/game_event.h"

namespace squink {

// Fans game events out to subscribed listeners.
//
// The engine enqueues the events of a call while it still holds its own lock,
// so the queue is in mutation order. Drain() then delivers them with no lock
// held: one thread delivers at a time and the others leave their events to
// it. A listener may therefore run on another caller's thread, and may call
// back into the engine or unsubscribe itself. A listener removed from another
// thread can still see the event that was in flight.
class EventHub {
 public:
  void Subscribe(GameListener* listener);
  void Unsubscribe(GameListener* listener);

  void Enqueue(std::span<const GameEvent> events);
  void Drain();

 private:
  absl::Mutex mu_;
  std::vector<GameListener*> listeners_ ABSL_GUARDED_BY(mu_);
  std::deque<GameEvent> pending_ ABSL_GUARDED_BY(mu_);
  bool draining_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace squink

#endif  // SQUINK_EVENT_HUB_H
