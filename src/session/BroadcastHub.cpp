#include "BroadcastHub.hpp"

namespace pd {
BroadcastHub::BroadcastHub() : nextSubscriptionId(1), hubClosed(false) {}

shared_ptr<Subscription> BroadcastHub::subscribe(
    shared_ptr<SessionViewer> viewer) {
  lock_guard<recursive_mutex> guard(hubMutex);
  auto subscription = make_shared<Subscription>(nextSubscriptionId++, viewer);
  if (hubClosed) {
    subscription->closed = true;
    return subscription;
  }
  subscribers[subscription->id] = subscription;
  VLOG(1) << "Viewer " << subscription->id << " subscribed ("
          << subscribers.size() << " total)";
  return subscription;
}

bool BroadcastHub::unsubscribe(const shared_ptr<Subscription>& subscription) {
  if (!subscription) {
    return false;
  }
  lock_guard<recursive_mutex> guard(hubMutex);
  auto it = subscribers.find(subscription->id);
  if (it == subscribers.end() || it->second != subscription) {
    // Not ours, or already gone
    return false;
  }
  subscribers.erase(it);
  if (subscription->closed.exchange(true)) {
    return false;
  }
  VLOG(1) << "Viewer " << subscription->id << " unsubscribed ("
          << subscribers.size() << " left)";
  return true;
}

vector<shared_ptr<Subscription>> BroadcastHub::snapshot() {
  lock_guard<recursive_mutex> guard(hubMutex);
  vector<shared_ptr<Subscription>> s;
  s.reserve(subscribers.size());
  for (const auto& it : subscribers) {
    s.push_back(it.second);
  }
  return s;
}

bool BroadcastHub::deliver(const shared_ptr<Subscription>& subscription,
                           const StreamEvent& event) {
  if (subscription->closed) {
    return false;
  }
  bool ok = false;
  try {
    ok = subscription->viewer->onEvent(event);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Viewer " << subscription->id
                 << " failed while receiving an event: " << ex.what();
    ok = false;
  }
  if (!ok) {
    unsubscribe(subscription);
  }
  return ok;
}

void BroadcastHub::publish(const StreamEvent& event) {
  for (const auto& subscription : snapshot()) {
    deliver(subscription, event);
  }
}

void BroadcastHub::closeAll(const StreamEvent& finalEvent) {
  {
    lock_guard<recursive_mutex> guard(hubMutex);
    if (hubClosed) {
      return;
    }
    hubClosed = true;
  }
  auto remaining = snapshot();
  for (const auto& subscription : remaining) {
    deliver(subscription, finalEvent);
  }
  for (const auto& subscription : remaining) {
    unsubscribe(subscription);
  }
}

int BroadcastHub::subscriberCount() {
  lock_guard<recursive_mutex> guard(hubMutex);
  return int(subscribers.size());
}
}  // namespace pd
