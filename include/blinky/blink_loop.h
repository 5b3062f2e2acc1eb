#ifndef BLINKY_BLINK_LOOP_H
#define BLINKY_BLINK_LOOP_H

#include <stdint.h>

#include "blinky/calibration.h"

namespace blinky
{
  // High for one half period, low for the next, forever.
  template <typename Pin, typename Timer>
  class BlinkLoop
  {
  public:
    BlinkLoop(Pin& pin, const Timer& timer, const LoopCalibration& halfPeriod)
      : pin_(pin), timer_(timer), halfPeriod_(halfPeriod)
    {
    }

    // Configures the line. Fails when the half period can't be run by the
    // timer, in which case the line is left untouched.
    bool begin()
    {
      if (!Timer::accepts(halfPeriod_))
      {
        return false;
      }

      pin_.configureAsOutput();
      return true;
    }

    void cycle()
    {
      pin_.setHigh();
      timer_.wait(halfPeriod_);
      pin_.setLow();
      timer_.wait(halfPeriod_);
    }

    void runCycles(uint32_t count)
    {
      for (uint32_t i = 0; i < count; ++i)
      {
        cycle();
      }
    }

    void run()
    {
      for (;;)
      {
        cycle();
      }
    }

    const LoopCalibration& halfPeriod() const
    {
      return halfPeriod_;
    }

  private:
    Pin& pin_;
    const Timer& timer_;
    LoopCalibration halfPeriod_;
  };
}

#endif
