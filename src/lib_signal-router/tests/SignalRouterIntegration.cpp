#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

#include "ifx/SignalRouter.hpp"

namespace {

struct Latch {
  std::mutex mutex;
  std::condition_variable cv;
  int hits = 0;

  void hit() {
    std::lock_guard<std::mutex> lock(mutex);
    ++hits;
    cv.notify_all();
  }

  bool waitFor(int expected, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return hits >= expected; });
  }
};

}  // namespace

TEST(SignalRouterTest, RejectsInvalidSignals) {
  auto& router = ifx::SignalRouter::instance();
  EXPECT_THROW(router.registerHandler(0, [](int) {}), std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGKILL, [](int) {}),
               std::invalid_argument);
  EXPECT_THROW(router.registerHandler(SIGUSR2, nullptr), std::invalid_argument);
}

TEST(SignalRouterTest, DeliversRealSignalToEveryHandler) {
  auto& router = ifx::SignalRouter::instance();
  Latch latch;

  router.registerHandler(SIGUSR1, [&](int sig) {
    if (sig == SIGUSR1) latch.hit();
  });
  router.registerHandler(SIGUSR1, [&](int) { latch.hit(); });
  router.start();
  EXPECT_TRUE(router.isRunning());

  ASSERT_EQ(kill(getpid(), SIGUSR1), 0);
  EXPECT_TRUE(latch.waitFor(2, std::chrono::seconds(2)));

  router.stop();
  router.unregisterHandler(SIGUSR1);
  EXPECT_FALSE(router.isRunning());
}

TEST(SignalRouterTest, ThrowingHandlerDoesNotStopRouter) {
  auto& router = ifx::SignalRouter::instance();
  Latch latch;

  router.registerHandler(SIGUSR2, [](int) {
    throw std::runtime_error("reload failed");
  });
  router.registerHandler(SIGUSR2, [&](int) { latch.hit(); });
  router.start();

  ASSERT_EQ(kill(getpid(), SIGUSR2), 0);
  EXPECT_TRUE(latch.waitFor(1, std::chrono::seconds(2)));
  EXPECT_TRUE(router.isRunning());

  router.stop();
  router.unregisterHandler(SIGUSR2);
}
