#ifndef BLINKY_CALIBRATION_H
#define BLINKY_CALIBRATION_H

#include <stdint.h>

namespace blinky
{
  // Shape of the counted loop a backend runs. The inner counter is the
  // native 16 bit register pair, the outer one a single 8 bit register.
  struct LoopGeometry
  {
    uint8_t cyclesPerIteration;
    uint16_t innerMax;
    uint8_t outerMax;
    uint16_t innerTarget; // preferred inner count, kept well below innerMax
  };

  enum class CalibrationStatus : uint8_t
  {
    ok,
    innerOverflow,
    outerOverflow
  };

  struct LoopCalibration
  {
    uint32_t outer;
    uint32_t inner;
    uint8_t cyclesPerIteration;
    CalibrationStatus status;
  };

  // Cycles spent around the counted iterations: once per outer pass (reload
  // of the inner counter, decrement and branch of the outer one) and once per
  // call (call, return).
  struct CycleOverhead
  {
    uint8_t perOuterPass;
    uint8_t perCall;
  };

  namespace detail
  {
    constexpr uint32_t saturate(uint64_t value)
    {
      return value > 0xFFFFFFFFu ? 0xFFFFFFFFu : static_cast<uint32_t>(value);
    }

    constexpr LoopCalibration checked(uint64_t outer, uint64_t inner, const LoopGeometry& geometry)
    {
      return LoopCalibration{saturate(outer),
                             saturate(inner),
                             geometry.cyclesPerIteration,
                             inner > geometry.innerMax   ? CalibrationStatus::innerOverflow
                             : outer > geometry.outerMax ? CalibrationStatus::outerOverflow
                                                         : CalibrationStatus::ok};
    }

    constexpr uint64_t passesFor(uint64_t iterations, uint16_t innerTarget)
    {
      return (iterations + innerTarget - 1) / innerTarget;
    }

    constexpr LoopCalibration split(uint64_t iterations, uint64_t outer, const LoopGeometry& geometry)
    {
      return checked(outer, iterations / outer, geometry);
    }

    constexpr LoopCalibration split(uint64_t iterations, const LoopGeometry& geometry)
    {
      return iterations == 0 ? checked(0, 0, geometry)
                             : split(iterations, passesFor(iterations, geometry.innerTarget), geometry);
    }
  }

  constexpr uint64_t cyclesForMilliseconds(uint32_t milliseconds, uint32_t cpuHz)
  {
    return static_cast<uint64_t>(milliseconds) * cpuHz / 1000u;
  }

  constexpr uint64_t cyclesToMicroseconds(uint64_t cycles, uint32_t cpuHz)
  {
    return cycles * 1000000u / cpuHz;
  }

  /**
   * Derive the loop counts for a delay of `milliseconds` at `cpuHz`.
   *
   * The outer count is the smallest number of passes that keeps the inner
   * count at or below geometry.innerTarget; the inner count is then the total
   * iteration count spread over those passes. Both round down, so the
   * achieved delay never exceeds the request and falls short by less than
   * one inner iteration per pass.
   *
   * Counts that don't fit the loop registers are reported through status and
   * must not be run.
   */
  constexpr LoopCalibration calibrate(uint32_t milliseconds, uint32_t cpuHz, const LoopGeometry& geometry)
  {
    return detail::split(cyclesForMilliseconds(milliseconds, cpuHz) / geometry.cyclesPerIteration, geometry);
  }

  constexpr uint64_t totalIterations(const LoopCalibration& calibration)
  {
    return static_cast<uint64_t>(calibration.outer) * calibration.inner;
  }

  // Cycles spent in the counted iterations alone.
  constexpr uint64_t loopCycles(const LoopCalibration& calibration)
  {
    return totalIterations(calibration) * calibration.cyclesPerIteration;
  }

  // Cycles including loop overhead. The last inner iteration of each pass
  // falls through its branch and is one cycle shorter.
  constexpr uint64_t exactCycles(const LoopCalibration& calibration, const CycleOverhead& overhead)
  {
    return calibration.outer == 0
             ? overhead.perCall
             : calibration.outer * (static_cast<uint64_t>(calibration.inner) * calibration.cyclesPerIteration - 1 +
                                    overhead.perOuterPass) +
                 overhead.perCall;
  }

  // Signed deviation of the counted iterations from the requested delay, in
  // parts per million.
  constexpr int32_t errorPpm(const LoopCalibration& calibration, uint32_t milliseconds, uint32_t cpuHz)
  {
    return cyclesForMilliseconds(milliseconds, cpuHz) == 0
             ? 0
             : static_cast<int32_t>(
                 (static_cast<int64_t>(loopCycles(calibration)) -
                  static_cast<int64_t>(cyclesForMilliseconds(milliseconds, cpuHz))) *
                 1000000 / static_cast<int64_t>(cyclesForMilliseconds(milliseconds, cpuHz)));
  }

  // Compile-time calibration for a loop backend. Refuses to build when the
  // counts don't fit the backend's registers.
  template <uint32_t Milliseconds, uint32_t CpuHz, typename Loop>
  struct CalibratedDelay
  {
    static_assert(Loop::geometry().cyclesPerIteration > 0, "loop iteration must cost at least one cycle");
    static_assert(Loop::geometry().innerTarget > 0, "inner loop target must be positive");

    static constexpr LoopCalibration value = calibrate(Milliseconds, CpuHz, Loop::geometry());

    static_assert(calibrate(Milliseconds, CpuHz, Loop::geometry()).status != CalibrationStatus::innerOverflow,
                  "inner loop count exceeds the counter width");
    static_assert(calibrate(Milliseconds, CpuHz, Loop::geometry()).status != CalibrationStatus::outerOverflow,
                  "delay too long for the outer loop counter");
  };

  template <uint32_t Milliseconds, uint32_t CpuHz, typename Loop>
  constexpr LoopCalibration CalibratedDelay<Milliseconds, CpuHz, Loop>::value;
}

#endif
