#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "keyout/admission_gate.hpp"
#include "test_support.hpp"

using namespace keyout;
using keyout::test::eventually;

TEST(AdmissionGate, ZeroLimitNeverBlocks) {
  AdmissionGate gate(0);
  std::atomic<bool> abandon{false};
  for (int i = 0; i < 16; ++i)
    EXPECT_TRUE(gate.acquire(abandon));
  EXPECT_EQ(gate.in_use(), 16);
}

TEST(AdmissionGate, BlocksAtLimitUntilRelease) {
  AdmissionGate gate(1);
  std::atomic<bool> abandon{false};
  ASSERT_TRUE(gate.acquire(abandon));

  std::atomic<bool> admitted{false};
  std::thread waiter([&] {
    std::atomic<bool> never{false};
    admitted = gate.acquire(never);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(admitted.load());

  gate.release();
  EXPECT_TRUE(eventually([&] { return admitted.load(); }));
  waiter.join();
  EXPECT_EQ(gate.in_use(), 1);
}

TEST(AdmissionGate, AbandonedWaiterLeaves) {
  AdmissionGate gate(1);
  std::atomic<bool> held{false};
  ASSERT_TRUE(gate.acquire(held));

  std::atomic<bool> abandon{false};
  std::atomic<bool> finished{false};
  bool result = true;
  std::thread waiter([&] {
    result = gate.acquire(abandon);
    finished = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  abandon = true;
  gate.wake_all();
  EXPECT_TRUE(eventually([&] { return finished.load(); }));
  waiter.join();

  EXPECT_FALSE(result);
  EXPECT_EQ(gate.in_use(), 1);
}
