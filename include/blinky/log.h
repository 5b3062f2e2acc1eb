#ifndef BLINKY_LOG_H
#define BLINKY_LOG_H

#include <stdio.h>

#include <avr/pgmspace.h>

// Format strings stay in flash. Lines end in CRLF on the wire.
#define BLINKY_LOG(fmt, ...) printf_P(PSTR("blinky: " fmt "\n"), ##__VA_ARGS__)
#define BLINKY_ERROR(fmt, ...) printf_P(PSTR("ERROR: " fmt "\n"), ##__VA_ARGS__)

namespace blinky
{
  namespace log
  {
    // Brings up USART0 transmit at board::log::baud and binds it to stdout.
    void begin();

    // Blocks until the last byte has left the shift register.
    void flush();
  }
}

#endif
