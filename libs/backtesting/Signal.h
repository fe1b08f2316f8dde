// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SIGNAL_H
#define __SIGNAL_H 1

#include <algorithm>
#include <cmath>
#include <optional>
#include <ostream>
#include <string>
#include "Candle.h"

namespace mkc_backtest
{
  enum class SignalDirection
    {
      LONG,
      SHORT,
      EXIT,
      HOLD
    };

  inline const char *toString(SignalDirection direction)
  {
    switch (direction)
      {
      case SignalDirection::LONG:
	return "Long";
      case SignalDirection::SHORT:
	return "Short";
      case SignalDirection::EXIT:
	return "Exit";
      case SignalDirection::HOLD:
	return "Hold";
      }
    return "Unknown";
  }

  inline std::ostream& operator<<(std::ostream& os, SignalDirection direction)
  {
    return os << toString(direction);
  }

  /**
   * @brief Conviction of a signal, a value clamped to [0, 1].
   *
   * Values are bucketed as weak (< 0.45), medium (< 0.8) or strong.
   */
  class SignalStrength
  {
  public:
    enum class Bucket
      {
	WEAK,
	MEDIUM,
	STRONG
      };

    explicit SignalStrength(double value = 1.0)
      : mValue(clamp(value))
    {}

    static SignalStrength weak()
    {
      return SignalStrength(0.3);
    }

    static SignalStrength medium()
    {
      return SignalStrength(0.6);
    }

    static SignalStrength strong()
    {
      return SignalStrength(1.0);
    }

    double getValue() const
    {
      return mValue;
    }

    Bucket getBucket() const
    {
      if (mValue < 0.45)
	return Bucket::WEAK;
      if (mValue < 0.8)
	return Bucket::MEDIUM;
      return Bucket::STRONG;
    }

  private:
    static double clamp(double value)
    {
      if (std::isnan(value))
	return 0.0;
      return std::min(1.0, std::max(0.0, value));
    }

  private:
    double mValue;
  };

  /**
   * @class Signal
   * @brief A strategy's instruction for one bar.
   */
  class Signal
  {
  public:
    Signal(const ptime& timestamp,
	   double price,
	   SignalDirection direction,
	   SignalStrength strength = SignalStrength::strong(),
	   std::optional<std::string> reason = std::nullopt)
      : mTimestamp(timestamp),
	mPrice(price),
	mDirection(direction),
	mStrength(strength),
	mReason(std::move(reason))
    {}

    static Signal longSignal(const ptime& timestamp, double price)
    {
      return Signal(timestamp, price, SignalDirection::LONG);
    }

    static Signal shortSignal(const ptime& timestamp, double price)
    {
      return Signal(timestamp, price, SignalDirection::SHORT);
    }

    static Signal exitSignal(const ptime& timestamp, double price)
    {
      return Signal(timestamp, price, SignalDirection::EXIT);
    }

    static Signal holdSignal(const ptime& timestamp, double price)
    {
      return Signal(timestamp, price, SignalDirection::HOLD);
    }

    Signal withReason(const std::string& reason) const
    {
      Signal copy(*this);
      copy.mReason = reason;
      return copy;
    }

    Signal withStrength(SignalStrength strength) const
    {
      Signal copy(*this);
      copy.mStrength = strength;
      return copy;
    }

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    double getPrice() const
    {
      return mPrice;
    }

    SignalDirection getDirection() const
    {
      return mDirection;
    }

    const SignalStrength& getStrength() const
    {
      return mStrength;
    }

    const std::optional<std::string>& getReason() const
    {
      return mReason;
    }

    bool isHold() const
    {
      return mDirection == SignalDirection::HOLD;
    }

    bool isEntry() const
    {
      return mDirection == SignalDirection::LONG || mDirection == SignalDirection::SHORT;
    }

    bool isExit() const
    {
      return mDirection == SignalDirection::EXIT;
    }

  private:
    ptime mTimestamp;
    double mPrice;
    SignalDirection mDirection;
    SignalStrength mStrength;
    std::optional<std::string> mReason;
  };

  /**
   * @brief History entry for every non-hold signal, executed or not.
   */
  struct SignalRecord
  {
    ptime timestamp;
    double price;
    SignalDirection direction;
    double strength;
    std::optional<std::string> reason;
    bool executed;

    static SignalRecord fromSignal(const Signal& signal, bool executed)
    {
      return SignalRecord{signal.getTimestamp(),
			  signal.getPrice(),
			  signal.getDirection(),
			  signal.getStrength().getValue(),
			  signal.getReason(),
			  executed};
    }
  };
}

#endif
