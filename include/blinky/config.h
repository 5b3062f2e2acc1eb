#ifndef BLINKY_CONFIG_H
#define BLINKY_CONFIG_H

#include <stdint.h>

#ifndef F_CPU
#define F_CPU 16000000UL
#endif

#ifndef BLINKY_LOG_BAUD
#define BLINKY_LOG_BAUD 9600UL
#endif

namespace blinky
{
  namespace board
  {
    namespace cpu
    {
      constexpr uint32_t hz{F_CPU};
    }

    namespace led
    {
      constexpr uint8_t bit{5}; // PB5, Arduino D13
    }

    namespace log
    {
      constexpr uint32_t baud{BLINKY_LOG_BAUD}; // USART0, 8N1
    }
  }

  namespace blink
  {
    constexpr uint32_t halfPeriodMs{525};
  }
}

#endif
