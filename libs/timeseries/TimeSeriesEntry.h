// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SWING_TIMESERIES_ENTRY_H
#define __SWING_TIMESERIES_ENTRY_H 1

#include <stdexcept>
#include <string>
#include <sstream>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace swing_timeseries
{
  // Raised for bars that are internally inconsistent.
  class TimeSeriesEntryException : public std::domain_error
  {
  public:
    explicit TimeSeriesEntryException(const std::string& msg)
      : std::domain_error(msg)
    {}
  };

  // A dated scalar, e.g. one point of a moving average.
  template <class Decimal> class NumericTimeSeriesEntry
  {
  public:
    NumericTimeSeriesEntry (const boost::gregorian::date& entryDate,
			    const Decimal& value)
      : mDate(entryDate),
	mEntryValue(value)
    {}

    const boost::gregorian::date& getDateValue() const
    {
      return mDate;
    }

    const Decimal& getValue() const
    {
      return mEntryValue;
    }

  private:
    boost::gregorian::date mDate;
    Decimal mEntryValue;
  };

  template <class Decimal>
  inline bool operator==(const NumericTimeSeriesEntry<Decimal>& lhs,
			 const NumericTimeSeriesEntry<Decimal>& rhs)
  {
    return (lhs.getDateValue() == rhs.getDateValue()) &&
      (lhs.getValue() == rhs.getValue());
  }

  template <class Decimal>
  inline bool operator!=(const NumericTimeSeriesEntry<Decimal>& lhs,
			 const NumericTimeSeriesEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief One daily OHLCV bar.
   *
   * The constructor rejects bars whose high or low do not bracket the open and
   * close, and negative volume. For the last bar of an intraday scan the
   * volume is the quantity traded so far in the session.
   */
  template <class Decimal> class OHLCTimeSeriesEntry
  {
  public:
    OHLCTimeSeriesEntry (const boost::gregorian::date& entryDate,
			 const Decimal& open,
			 const Decimal& high,
			 const Decimal& low,
			 const Decimal& close,
			 const Decimal& volumeForEntry)
      : mDate(entryDate),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close),
	mVolume(volumeForEntry)
    {
      requireOrdered(mLow, mHigh, "low", "high");
      requireOrdered(mOpen, mHigh, "open", "high");
      requireOrdered(mClose, mHigh, "close", "high");
      requireOrdered(mLow, mOpen, "low", "open");
      requireOrdered(mLow, mClose, "low", "close");
      requireOrdered(Decimal(0), mVolume, "zero", "volume");
    }

    const boost::gregorian::date& getDateValue() const
    {
      return mDate;
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    const Decimal& getVolumeValue() const
    {
      return mVolume;
    }

    // (High - Low) / Close, the daily spread proxy. Close must be positive.
    Decimal getRelativeRange() const
    {
      if (!(mClose > Decimal(0)))
	throw TimeSeriesEntryException(describe() + ": relative range needs a positive close, got " +
				       toString(mClose));
      return (mHigh - mLow) / mClose;
    }

    // Largest of High - Low, |High - priorClose| and |Low - priorClose|.
    Decimal getTrueRange(const Decimal& priorClose) const
    {
      Decimal highLow = mHigh - mLow;
      Decimal highClose = (mHigh > priorClose) ? mHigh - priorClose : priorClose - mHigh;
      Decimal lowClose = (mLow > priorClose) ? mLow - priorClose : priorClose - mLow;

      Decimal range = (highClose > highLow) ? highClose : highLow;
      return (lowClose > range) ? lowClose : range;
    }

  private:
    void requireOrdered(const Decimal& lower, const Decimal& upper,
			const char* lowerName, const char* upperName) const
    {
      if (upper < lower)
	throw TimeSeriesEntryException(describe() + ": " + upperName + " " + toString(upper) +
				       " is below " + lowerName + " " + toString(lower));
    }

    std::string describe() const
    {
      return "bar on " + boost::gregorian::to_simple_string(mDate);
    }

    static std::string toString(const Decimal& value)
    {
      std::ostringstream oss;
      oss << value;
      return oss.str();
    }

  private:
    boost::gregorian::date mDate;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
    Decimal mVolume;
  };

  template <class Decimal>
  inline bool operator==(const OHLCTimeSeriesEntry<Decimal>& lhs,
			 const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return ((lhs.getDateValue() == rhs.getDateValue()) &&
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()));
  }

  template <class Decimal>
  inline bool operator!=(const OHLCTimeSeriesEntry<Decimal>& lhs,
			 const OHLCTimeSeriesEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

} // namespace swing_timeseries

#endif // __SWING_TIMESERIES_ENTRY_H
