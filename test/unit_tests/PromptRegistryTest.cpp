#include "PromptRegistry.hpp"

#include "TestHeaders.hpp"

using namespace lt;

TEST_CASE("PromptRegistrySettlesById", "[PromptRegistry]") {
  PromptRegistry registry;
  auto first = registry.waitFor("first");
  auto second = registry.waitFor("second");
  REQUIRE(registry.size() == 2);

  REQUIRE(registry.resolve("second", json("answer")));
  REQUIRE(second.get() == json("answer"));
  REQUIRE(!first.isSettled());
  REQUIRE(!registry.has("second"));

  // Late or unknown responses are ignored
  REQUIRE(!registry.resolve("second", json("again")));
  REQUIRE(!registry.resolve("unknown", json(1)));

  REQUIRE(registry.reject(
      "first", std::make_exception_ptr(PromptTimeoutError("too slow"))));
  REQUIRE_THROWS_AS(first.get(), PromptTimeoutError);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("PromptRegistryRejectsDuplicates", "[PromptRegistry]") {
  PromptRegistry registry;
  auto pending = registry.waitFor("req");
  REQUIRE_THROWS_AS(registry.waitFor("req"), std::runtime_error);

  // Once settled, the id can be reused
  registry.resolve("req", json(nullptr));
  auto reused = registry.waitFor("req");
  REQUIRE(registry.has("req"));
  // Cancelling the old handle leaves the new waiter alone
  pending.cancel();
  REQUIRE(registry.has("req"));
  REQUIRE(!reused.isSettled());
}

TEST_CASE("PromptRegistryRemoveLeavesWaiterPending", "[PromptRegistry]") {
  PromptRegistry registry;
  auto pending = registry.waitFor("req");
  REQUIRE(registry.remove("req"));
  REQUIRE(!registry.remove("req"));
  REQUIRE(!registry.resolve("req", json(true)));
  REQUIRE(!pending.waitFor(std::chrono::milliseconds(20)));
}

TEST_CASE("PromptRegistryCancel", "[PromptRegistry]") {
  PromptRegistry registry;
  auto pending = registry.waitFor("req");
  pending.cancel();
  REQUIRE_THROWS_AS(pending.get(), PromptCancelledError);
  REQUIRE(!registry.has("req"));
  REQUIRE(!registry.resolve("req", json(true)));

  SECTION("Cancelling twice is harmless") {
    pending.cancel();
    REQUIRE_THROWS_AS(pending.get(), PromptCancelledError);
  }

  SECTION("Cancelling after the registry is gone is harmless") {
    PromptRegistry::PendingPrompt* orphan = nullptr;
    {
      PromptRegistry shortLived;
      orphan = new PromptRegistry::PendingPrompt(shortLived.waitFor("x"));
    }
    orphan->cancel();
    REQUIRE(!orphan->isSettled());
    delete orphan;
  }
}

TEST_CASE("PromptRegistryRejectAll", "[PromptRegistry]") {
  PromptRegistry registry;
  vector<PromptRegistry::PendingPrompt> waiters;
  for (int a = 0; a < 3; a++) {
    waiters.push_back(registry.waitFor("req" + to_string(a)));
  }
  REQUIRE(registry.rejectAll(std::make_exception_ptr(
              TunnelDestroyedError("TunnelClient destroyed"))) == 3);
  for (auto& waiter : waiters) {
    REQUIRE_THROWS_AS(waiter.get(), TunnelDestroyedError);
  }
  REQUIRE(registry.size() == 0);
  REQUIRE(registry.rejectAll(std::make_exception_ptr(
              TunnelDestroyedError("TunnelClient destroyed"))) == 0);
}

TEST_CASE("PromptRegistryWaiterAcrossThreads", "[PromptRegistry]") {
  PromptRegistry registry;
  auto pending = registry.waitFor("req");
  thread responder([&registry]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    registry.resolve("req", json{{"picked", 2}});
  });
  REQUIRE(pending.waitFor(std::chrono::milliseconds(5000)));
  REQUIRE(pending.get()["picked"] == 2);
  responder.join();
}
