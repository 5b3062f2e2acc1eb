#include <avr/io.h>

#include "blinky/avr/delay_loop.h"
#include "blinky/blink_loop.h"
#include "blinky/busy_wait.h"
#include "blinky/calibration.h"
#include "blinky/config.h"
#include "blinky/log.h"
#include "blinky/pin.h"

namespace
{
  using Timer = blinky::BusyWaitTimer<blinky::avr::DelayLoop2, blinky::avr::InterruptLock>;
  using HalfPeriod =
    blinky::CalibratedDelay<blinky::blink::halfPeriodMs, blinky::board::cpu::hz, blinky::avr::DelayLoop2>;

  void reportCalibration(const blinky::LoopCalibration& calibration)
  {
    BLINKY_LOG("half period %lu ms = %lu x %lu iterations of %u cycles",
               static_cast<unsigned long>(blinky::blink::halfPeriodMs),
               static_cast<unsigned long>(calibration.outer),
               static_cast<unsigned long>(calibration.inner),
               static_cast<unsigned>(calibration.cyclesPerIteration));
    BLINKY_LOG("predicted %lu us, error %ld ppm",
               static_cast<unsigned long>(
                 blinky::cyclesToMicroseconds(blinky::loopCycles(calibration), blinky::board::cpu::hz)),
               static_cast<long>(
                 blinky::errorPpm(calibration, blinky::blink::halfPeriodMs, blinky::board::cpu::hz)));
  }
}

int main()
{
  blinky::log::begin();
  BLINKY_LOG("boot, %lu Hz, log %lu baud",
             static_cast<unsigned long>(blinky::board::cpu::hz),
             static_cast<unsigned long>(blinky::board::log::baud));

  blinky::OutputPin led({&DDRB, &PORTB, blinky::board::led::bit});
  const Timer timer(blinky::board::cpu::hz);
  blinky::BlinkLoop<blinky::OutputPin, Timer> blink(led, timer, HalfPeriod::value);

  reportCalibration(blink.halfPeriod());

  if (!blink.begin())
  {
    BLINKY_ERROR("half period can't be run by the delay loop.");
    blinky::log::flush();

    for (;;)
    {
      // Nothing to blink with, stay parked.
    }
  }

  BLINKY_LOG("PB%u blinking", static_cast<unsigned>(blinky::board::led::bit));
  blinky::log::flush();

  blink.run();
}
