#ifndef BLINKY_AVR_DELAY_LOOP_H
#define BLINKY_AVR_DELAY_LOOP_H

#include <stdint.h>

#include <avr/interrupt.h>
#include <avr/io.h>
#include <util/delay_basic.h>

#include "blinky/calibration.h"

namespace blinky
{
  namespace avr
  {
    // avr-libc's 16 bit counting loop: sbiw + brne, 4 cycles per iteration.
    // The outer count is kept to one 8 bit register.
    struct DelayLoop2
    {
      static constexpr LoopGeometry geometry()
      {
        return LoopGeometry{4, 0xFFFF, 0xFF, 28000};
      }

      // _delay_loop_2(0) runs 65536 iterations, callers never pass 0.
      static void spin(uint16_t count)
      {
        _delay_loop_2(count);
      }
    };

    // Masks interrupts for its lifetime and puts SREG back afterwards, as
    // ATOMIC_BLOCK(ATOMIC_RESTORESTATE) does.
    class InterruptLock
    {
    public:
      InterruptLock() : sreg_(SREG)
      {
        cli();
      }

      ~InterruptLock()
      {
        SREG = sreg_;
      }

      InterruptLock(const InterruptLock&) = delete;
      InterruptLock& operator=(const InterruptLock&) = delete;

    private:
      uint8_t sreg_;
    };
  }
}

#endif
