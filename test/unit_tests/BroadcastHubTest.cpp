#include "BroadcastHub.hpp"

#include "FakeCollaborators.hpp"
#include "TestHeaders.hpp"

using namespace pd;

namespace {
StreamEvent outputEvent(const string& content) {
  StreamEvent event;
  event.set_type(EVENT_OUTPUT);
  event.set_session_id("s1");
  event.set_content(content);
  return event;
}

/** Unsubscribes itself (or another subscription) from inside onEvent. */
class UnsubscribingViewer : public RecordingViewer {
 public:
  explicit UnsubscribingViewer(BroadcastHub* _hub) : hub(_hub) {}

  virtual bool onEvent(const StreamEvent& event) {
    RecordingViewer::onEvent(event);
    if (target) {
      hub->unsubscribe(target);
    }
    return true;
  }

  BroadcastHub* hub;
  shared_ptr<Subscription> target;
};

class ThrowingViewer : public SessionViewer {
 public:
  virtual bool onEvent(const StreamEvent& event) {
    throw std::runtime_error("connection reset");
  }
};
}  // namespace

TEST_CASE("BroadcastHub fans events out in order", "[BroadcastHub]") {
  BroadcastHub hub;
  auto a = make_shared<RecordingViewer>();
  auto b = make_shared<RecordingViewer>();
  hub.subscribe(a);
  hub.subscribe(b);
  REQUIRE(hub.subscriberCount() == 2);

  hub.publish(outputEvent("one"));
  hub.publish(outputEvent("two"));

  REQUIRE(a->output() == "onetwo");
  REQUIRE(b->output() == "onetwo");
}

TEST_CASE("BroadcastHub unsubscribe is idempotent", "[BroadcastHub]") {
  BroadcastHub hub;
  auto viewer = make_shared<RecordingViewer>();
  auto subscription = hub.subscribe(viewer);

  REQUIRE(hub.unsubscribe(subscription));
  REQUIRE(subscription->isClosed());
  REQUIRE_FALSE(hub.unsubscribe(subscription));
  REQUIRE(hub.subscriberCount() == 0);

  hub.publish(outputEvent("ignored"));
  REQUIRE(viewer->getEvents().empty());
}

TEST_CASE("BroadcastHub ignores subscriptions from another hub",
          "[BroadcastHub]") {
  BroadcastHub first;
  BroadcastHub second;
  auto mine = first.subscribe(make_shared<RecordingViewer>());
  auto other = second.subscribe(make_shared<RecordingViewer>());
  // Both hubs hand out id 1
  REQUIRE(mine->getId() == other->getId());

  REQUIRE_FALSE(first.unsubscribe(other));
  REQUIRE(first.subscriberCount() == 1);
  REQUIRE_FALSE(other->isClosed());
}

TEST_CASE("BroadcastHub tolerates unsubscribing during publish",
          "[BroadcastHub]") {
  BroadcastHub hub;
  auto first = make_shared<UnsubscribingViewer>(&hub);
  auto second = make_shared<RecordingViewer>();
  auto firstSubscription = hub.subscribe(first);
  hub.subscribe(second);

  SECTION("Self removal") {
    first->target = firstSubscription;
    hub.publish(outputEvent("a"));
    hub.publish(outputEvent("b"));
    REQUIRE(first->output() == "a");
    REQUIRE(second->output() == "ab");
    REQUIRE(hub.subscriberCount() == 1);
  }
}

TEST_CASE("BroadcastHub drops failing viewers", "[BroadcastHub]") {
  BroadcastHub hub;
  auto failing = make_shared<RecordingViewer>();
  failing->failing = true;
  auto healthy = make_shared<RecordingViewer>();
  auto failingSubscription = hub.subscribe(failing);
  hub.subscribe(make_shared<ThrowingViewer>());
  hub.subscribe(healthy);

  hub.publish(outputEvent("x"));

  REQUIRE(failingSubscription->isClosed());
  REQUIRE(hub.subscriberCount() == 1);
  REQUIRE(healthy->output() == "x");

  hub.publish(outputEvent("y"));
  REQUIRE(healthy->output() == "xy");
}

TEST_CASE("BroadcastHub closeAll sends a final event and refuses newcomers",
          "[BroadcastHub]") {
  BroadcastHub hub;
  auto viewer = make_shared<RecordingViewer>();
  auto subscription = hub.subscribe(viewer);

  StreamEvent complete;
  complete.set_type(EVENT_COMPLETE);
  complete.set_message("removed");
  hub.closeAll(complete);

  REQUIRE(hub.isClosed());
  REQUIRE(subscription->isClosed());
  REQUIRE(hub.subscriberCount() == 0);
  REQUIRE(viewer->types() == vector<StreamEventType>{EVENT_COMPLETE});

  auto late = hub.subscribe(make_shared<RecordingViewer>());
  REQUIRE(late->isClosed());
  REQUIRE(hub.subscriberCount() == 0);

  // A second close is a no-op
  hub.closeAll(complete);
  REQUIRE(viewer->count(EVENT_COMPLETE) == 1);
}

TEST_CASE("BroadcastHub deliver targets one subscription", "[BroadcastHub]") {
  BroadcastHub hub;
  auto a = make_shared<RecordingViewer>();
  auto b = make_shared<RecordingViewer>();
  auto subscriptionA = hub.subscribe(a);
  hub.subscribe(b);

  REQUIRE(hub.deliver(subscriptionA, outputEvent("only a")));
  REQUIRE(a->output() == "only a");
  REQUIRE(b->getEvents().empty());

  hub.unsubscribe(subscriptionA);
  REQUIRE_FALSE(hub.deliver(subscriptionA, outputEvent("late")));
  REQUIRE(a->output() == "only a");
}
