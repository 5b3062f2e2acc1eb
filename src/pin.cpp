#include "blinky/pin.h"

namespace blinky
{
  OutputPin::OutputPin(const PinConfig& config) : config_(config)
  {
  }

  void OutputPin::configureAsOutput()
  {
    *config_.port &= static_cast<uint8_t>(~mask());
    *config_.ddr |= mask();
  }

  void OutputPin::setHigh()
  {
    *config_.port |= mask();
  }

  void OutputPin::setLow()
  {
    *config_.port &= static_cast<uint8_t>(~mask());
  }

  void OutputPin::setLevel(Level level)
  {
    if (level == Level::high)
    {
      setHigh();
    }
    else
    {
      setLow();
    }
  }

  Level OutputPin::level() const
  {
    return (*config_.port & mask()) ? Level::high : Level::low;
  }

  bool OutputPin::isOutput() const
  {
    return (*config_.ddr & mask()) != 0;
  }

  uint8_t OutputPin::mask() const
  {
    return static_cast<uint8_t>(1u << config_.bit);
  }
}
