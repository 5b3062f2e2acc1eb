#ifndef BLINKY_PIN_H
#define BLINKY_PIN_H

#include <stdint.h>

namespace blinky
{
  enum class Level : uint8_t
  {
    low,
    high
  };

  // Registers driving one line: data direction, output latch and bit number.
  struct PinConfig
  {
    volatile uint8_t* ddr;
    volatile uint8_t* port;
    uint8_t bit;
  };

  /**
   * One digital output line.
   *
   * Only the configured bit of each register is read-modify-written, the
   * other lines on the port keep their state. The line is driven low before
   * it becomes an output so it never glitches high on configuration.
   */
  class OutputPin
  {
  public:
    explicit OutputPin(const PinConfig& config);

    void configureAsOutput();

    void setHigh();
    void setLow();
    void setLevel(Level level);

    Level level() const;
    bool isOutput() const;

  private:
    uint8_t mask() const;

    PinConfig config_;
  };
}

#endif
