// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PARAM_RANGE_H
#define __PARAM_RANGE_H 1

#include <cmath>
#include <cstdio>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace mkc_backtest
{
  /**
   * @class ParamValue
   * @brief One value of a sweepable strategy parameter, integer or floating.
   */
  class ParamValue
  {
  public:
    enum Kind
      {
	INT,
	FLOAT
      };

    static ParamValue intValue(long long v)
    {
      return ParamValue(INT, v, static_cast<double>(v));
    }

    static ParamValue floatValue(double v)
    {
      return ParamValue(FLOAT, static_cast<long long>(v), v);
    }

    ParamValue()
      : ParamValue(INT, 0, 0.0)
    {}

    Kind getKind() const
    {
      return mKind;
    }

    bool isInt() const
    {
      return mKind == INT;
    }

    // Float values truncate toward zero.
    long long asInt() const
    {
      return mKind == INT ? mInt : static_cast<long long>(mFloat);
    }

    double asFloat() const
    {
      return mKind == INT ? static_cast<double>(mInt) : mFloat;
    }

    std::size_t asSize() const
    {
      const long long v = asInt();
      return v < 0 ? 0 : static_cast<std::size_t>(v);
    }

    std::string toString() const
    {
      if (mKind == INT)
	return std::to_string(mInt);

      char buf[64];
      std::snprintf(buf, sizeof(buf), "%.4f", mFloat);
      return std::string(buf);
    }

    bool operator==(const ParamValue& rhs) const
    {
      if (mKind != rhs.mKind)
	return false;
      return mKind == INT ? mInt == rhs.mInt : mFloat == rhs.mFloat;
    }

    bool operator!=(const ParamValue& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    ParamValue(Kind kind, long long i, double f)
      : mKind(kind),
	mInt(i),
	mFloat(f)
    {}

    Kind mKind;
    long long mInt;
    double mFloat;
  };

  inline std::ostream& operator<<(std::ostream& os, const ParamValue& v)
  {
    return os << v.toString();
  }

  /// Parameter name -> value for one grid combination.
  typedef std::map<std::string, ParamValue> ParamMap;

  inline std::string toString(const ParamMap& params)
  {
    std::string out;
    for (const auto& entry : params)
      {
	if (!out.empty())
	  out += ", ";
	out += entry.first + "=" + entry.second.toString();
      }
    return out;
  }

  /**
   * @class ParamRange
   * @brief The domain of one parameter: an integer range, a float range or
   * an explicit list of values.
   */
  class ParamRange
  {
  public:
    enum Kind
      {
	INT_RANGE,
	FLOAT_RANGE,
	VALUES
      };

    static ParamRange intRange(long long start, long long end, long long step)
    {
      ParamRange r(INT_RANGE);
      r.mIntStart = start;
      r.mIntEnd = end;
      r.mIntStep = step;
      return r;
    }

    static ParamRange floatRange(double start, double end, double step)
    {
      ParamRange r(FLOAT_RANGE);
      r.mFloatStart = start;
      r.mFloatEnd = end;
      r.mFloatStep = step;
      return r;
    }

    static ParamRange values(std::vector<ParamValue> values)
    {
      ParamRange r(VALUES);
      r.mValues = std::move(values);
      return r;
    }

    Kind getKind() const
    {
      return mKind;
    }

    /**
     * @brief Every value of the range, in ascending order for ranges.
     *
     * A non-positive step or an end before the start yields no values.
     * Float ranges take round((end - start) / step) steps and the last
     * element is exactly end, so no value lies outside [start, end].
     */
    std::vector<ParamValue> expand() const
    {
      std::vector<ParamValue> out;
      switch (mKind)
	{
	case INT_RANGE:
	  if (mIntStep <= 0 || mIntEnd < mIntStart)
	    return out;
	  for (long long v = mIntStart; ; v += mIntStep)
	    {
	      out.push_back(ParamValue::intValue(v));
	      // v <= end here, so the unsigned distance is exact and cannot overflow
	      const unsigned long long remaining =
		static_cast<unsigned long long>(mIntEnd) - static_cast<unsigned long long>(v);
	      if (remaining < static_cast<unsigned long long>(mIntStep))
		break;
	    }
	  break;

	case FLOAT_RANGE:
	  {
	    if (!(mFloatStep > 0.0) || mFloatEnd < mFloatStart)
	      return out;

	    const long long steps = std::llround((mFloatEnd - mFloatStart) / mFloatStep);
	    for (long long i = 0; i <= steps; ++i)
	      {
		if (i == steps)
		  out.push_back(ParamValue::floatValue(mFloatEnd));
		else
		  out.push_back(ParamValue::floatValue(mFloatStart + static_cast<double>(i) * mFloatStep));
	      }
	    break;
	  }

	case VALUES:
	  out = mValues;
	  break;
	}
      return out;
    }

  private:
    explicit ParamRange(Kind kind)
      : mKind(kind)
    {}

    Kind mKind;
    long long mIntStart = 0;
    long long mIntEnd = 0;
    long long mIntStep = 0;
    double mFloatStart = 0.0;
    double mFloatEnd = 0.0;
    double mFloatStep = 0.0;
    std::vector<ParamValue> mValues;
  };
}

#endif
