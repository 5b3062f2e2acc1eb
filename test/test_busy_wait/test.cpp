#include <unity.h>

#include "blinky/busy_wait.h"
#include "blinky/calibration.h"
#include "simulated_loop.h"

using blinky::BusyWaitTimer;
using blinky::CalibrationStatus;
using blinky::LoopCalibration;
using blinky::test::CountingGuard;
using blinky::test::SimulatedClock;
using blinky::test::SimulatedLoop;

uint32_t CountingGuard::entered = 0;
int32_t CountingGuard::open = 0;

namespace
{
  constexpr uint32_t cpuHz{16000000};

  using ThreeCycleLoop = SimulatedLoop<3>;
  using FourCycleLoop = SimulatedLoop<4>;

  SimulatedClock simClock;
}

void setUp()
{
  simClock = SimulatedClock();
  CountingGuard::entered = 0;
  CountingGuard::open = 0;
}

void tearDown() {}

void test_wait_runs_every_calibrated_iteration()
{
  const BusyWaitTimer<ThreeCycleLoop> timer(cpuHz, ThreeCycleLoop(simClock));

  timer.wait(timer.calibrate(525));

  TEST_ASSERT_EQUAL_UINT32(100, simClock.spins());
  TEST_ASSERT_EQUAL_UINT16(28000, simClock.lastSpin());
  TEST_ASSERT_EQUAL_UINT32(8400000, static_cast<uint32_t>(simClock.cycles()));
  TEST_ASSERT_EQUAL_UINT32(525000, static_cast<uint32_t>(simClock.microseconds(cpuHz)));
}

void test_wait_milliseconds_is_within_one_percent()
{
  const BusyWaitTimer<FourCycleLoop> timer(cpuHz, FourCycleLoop(simClock));
  const uint32_t durations[] = {1, 10, 100, 525, 1000, 1700};

  for (uint32_t ms : durations)
  {
    const uint64_t before = simClock.cycles();
    TEST_ASSERT_TRUE(timer.waitMilliseconds(ms));

    const uint64_t elapsed = simClock.cycles() - before;
    const uint64_t requested = blinky::cyclesForMilliseconds(ms, cpuHz);
    TEST_ASSERT_TRUE(elapsed <= requested);
    TEST_ASSERT_TRUE(elapsed * 100 >= requested * 99);
  }
}

void test_zero_wait_does_not_spin()
{
  const BusyWaitTimer<ThreeCycleLoop> timer(cpuHz, ThreeCycleLoop(simClock));

  TEST_ASSERT_TRUE(timer.waitMilliseconds(0));
  TEST_ASSERT_EQUAL_UINT32(0, simClock.spins());
  TEST_ASSERT_EQUAL_UINT32(0, static_cast<uint32_t>(simClock.cycles()));
}

void test_out_of_range_wait_is_refused()
{
  const BusyWaitTimer<ThreeCycleLoop> timer(cpuHz, ThreeCycleLoop(simClock));

  TEST_ASSERT_FALSE(timer.waitMilliseconds(5000));
  TEST_ASSERT_EQUAL_UINT32(0, simClock.spins());

  const LoopCalibration tooLong = timer.calibrate(5000);
  TEST_ASSERT_EQUAL(CalibrationStatus::outerOverflow, tooLong.status);
  TEST_ASSERT_FALSE(timer.accepts(tooLong));
  timer.wait(tooLong);
  TEST_ASSERT_EQUAL_UINT32(0, static_cast<uint32_t>(simClock.cycles()));
}

void test_calibration_for_another_loop_is_refused()
{
  const BusyWaitTimer<FourCycleLoop> timer(cpuHz, FourCycleLoop(simClock));
  const LoopCalibration threeCycle = blinky::calibrate(525, cpuHz, ThreeCycleLoop::geometry());

  TEST_ASSERT_FALSE(timer.accepts(threeCycle));
  timer.wait(threeCycle);
  TEST_ASSERT_EQUAL_UINT32(0, simClock.spins());
}

void test_guard_wraps_each_outer_pass()
{
  const BusyWaitTimer<ThreeCycleLoop, CountingGuard> timer(cpuHz, ThreeCycleLoop(simClock));

  timer.wait(timer.calibrate(525));

  TEST_ASSERT_EQUAL_UINT32(100, CountingGuard::entered);
  TEST_ASSERT_EQUAL_INT32(0, CountingGuard::open);
}

void test_slower_clock_takes_the_same_time()
{
  const BusyWaitTimer<ThreeCycleLoop> timer(1000000, ThreeCycleLoop(simClock));

  TEST_ASSERT_TRUE(timer.waitMilliseconds(525));
  TEST_ASSERT_EQUAL_UINT32(525000, static_cast<uint32_t>(simClock.microseconds(1000000)));
}

int main()
{
  UNITY_BEGIN();
  RUN_TEST(test_wait_runs_every_calibrated_iteration);
  RUN_TEST(test_wait_milliseconds_is_within_one_percent);
  RUN_TEST(test_zero_wait_does_not_spin);
  RUN_TEST(test_out_of_range_wait_is_refused);
  RUN_TEST(test_calibration_for_another_loop_is_refused);
  RUN_TEST(test_guard_wraps_each_outer_pass);
  RUN_TEST(test_slower_clock_takes_the_same_time);
  return UNITY_END();
}
