#include "blinky/log.h"

#include "blinky/config.h"

#include <avr/io.h>

#define BAUD BLINKY_LOG_BAUD
#include <util/setbaud.h>

namespace
{
  FILE uartOut;
  bool pending = false;

  int putChar(char c, FILE* stream)
  {
    if (c == '\n')
    {
      putChar('\r', stream);
    }

    loop_until_bit_is_set(UCSR0A, UDRE0);
    UCSR0A |= _BV(TXC0);
    UDR0 = c;
    pending = true;
    return 0;
  }
}

namespace blinky
{
  namespace log
  {
    void begin()
    {
      UBRR0H = UBRRH_VALUE;
      UBRR0L = UBRRL_VALUE;
#if USE_2X
      UCSR0A |= _BV(U2X0);
#else
      UCSR0A &= ~_BV(U2X0);
#endif
      UCSR0C = _BV(UCSZ01) | _BV(UCSZ00);
      UCSR0B = _BV(TXEN0);

      fdev_setup_stream(&uartOut, putChar, nullptr, _FDEV_SETUP_WRITE);
      stdout = &uartOut;
    }

    void flush()
    {
      if (!pending)
      {
        return;
      }

      loop_until_bit_is_set(UCSR0A, TXC0);
      pending = false;
    }
  }
}
