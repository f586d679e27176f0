#ifndef __PD_BROADCAST_HUB__
#define __PD_BROADCAST_HUB__

#include "Headers.hpp"

namespace pd {
/**
 * @brief One downstream consumer of a session's event stream (for example a
 * server-sent-events connection or a local console).
 */
class SessionViewer {
 public:
  virtual ~SessionViewer() {}
  /**
   * @brief Delivers one event.
   * @return false if the viewer can no longer accept events, which removes
   * it from the hub.
   */
  virtual bool onEvent(const StreamEvent& event) = 0;
};

/**
 * @brief A viewer's membership in a hub. Owned by the viewer connection.
 */
class Subscription {
 public:
  Subscription(int64_t _id, shared_ptr<SessionViewer> _viewer)
      : id(_id), viewer(_viewer), closed(false) {}

  inline int64_t getId() const { return id; }
  inline bool isClosed() const { return closed; }
  inline shared_ptr<SessionViewer> getViewer() const { return viewer; }

 protected:
  friend class BroadcastHub;
  int64_t id;
  shared_ptr<SessionViewer> viewer;
  std::atomic<bool> closed;
};

/**
 * @brief Fans one session's events out to every subscribed viewer.
 *
 * `publish` snapshots the subscriber list before dispatching, so viewers may
 * unsubscribe (themselves or others) from inside `onEvent`. A viewer that
 * fails or throws is dropped without affecting the rest.
 */
class BroadcastHub {
 public:
  BroadcastHub();

  shared_ptr<Subscription> subscribe(shared_ptr<SessionViewer> viewer);
  /** @brief Idempotent. Returns true only for the call that removed it. */
  bool unsubscribe(const shared_ptr<Subscription>& subscription);
  /** @brief Sends one event to every open subscription, in order. */
  void publish(const StreamEvent& event);
  /**
   * @brief Sends `finalEvent` to everyone, then removes every subscriber.
   * Later subscribes are refused.
   */
  void closeAll(const StreamEvent& finalEvent);
  int subscriberCount();
  inline bool isClosed() {
    lock_guard<recursive_mutex> guard(hubMutex);
    return hubClosed;
  }

  /**
   * @brief Delivers one event to one subscription, dropping it on failure.
   * @return false if the subscription was (or became) closed.
   */
  bool deliver(const shared_ptr<Subscription>& subscription,
               const StreamEvent& event);

 protected:
  vector<shared_ptr<Subscription>> snapshot();

  recursive_mutex hubMutex;
  map<int64_t, shared_ptr<Subscription>> subscribers;
  int64_t nextSubscriptionId;
  bool hubClosed;
};
}  // namespace pd

#endif  // __PD_BROADCAST_HUB__
