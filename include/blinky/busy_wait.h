#ifndef BLINKY_BUSY_WAIT_H
#define BLINKY_BUSY_WAIT_H

#include <stdint.h>

#include "blinky/calibration.h"

namespace blinky
{
  // Guard for an interruptible wait.
  struct NoGuard
  {
  };

  /**
   * Spins the CPU for a calibrated number of loop iterations.
   *
   * `Loop` supplies the elementary counted loop:
   *   static constexpr LoopGeometry geometry();
   *   void spin(uint16_t count) const;  // count iterations, count > 0
   *
   * `Guard` is constructed around every outer pass and decides whether the
   * wait can be interrupted. Nothing but time is consumed; all counters live
   * in this call.
   */
  template <typename Loop, typename Guard = NoGuard>
  class BusyWaitTimer
  {
  public:
    explicit BusyWaitTimer(uint32_t cpuHz, const Loop& loop = Loop()) : cpuHz_(cpuHz), loop_(loop)
    {
    }

    static constexpr LoopGeometry geometry()
    {
      return Loop::geometry();
    }

    uint32_t cpuHz() const
    {
      return cpuHz_;
    }

    LoopCalibration calibrate(uint32_t milliseconds) const
    {
      return blinky::calibrate(milliseconds, cpuHz_, geometry());
    }

    // Calibrations that failed their range check, or that were made for a
    // loop of a different cost, are not run.
    void wait(const LoopCalibration& calibration) const
    {
      if (!accepts(calibration))
      {
        return;
      }

      for (uint32_t pass = 0; pass < calibration.outer; ++pass)
      {
        Guard guard;
        (void)guard;
        loop_.spin(static_cast<uint16_t>(calibration.inner));
      }
    }

    // Returns false, without waiting, when the delay doesn't fit the loop.
    bool waitMilliseconds(uint32_t milliseconds) const
    {
      const LoopCalibration calibration = calibrate(milliseconds);
      if (!accepts(calibration))
      {
        return false;
      }

      wait(calibration);
      return true;
    }

    static bool accepts(const LoopCalibration& calibration)
    {
      return calibration.status == CalibrationStatus::ok &&
             calibration.cyclesPerIteration == geometry().cyclesPerIteration;
    }

  private:
    uint32_t cpuHz_;
    Loop loop_;
  };
}

#endif
