// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SWING_TIMESERIES_H
#define __SWING_TIMESERIES_H 1

#include <vector>
#include <string>
#include <algorithm>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeriesException.h"

namespace swing_timeseries
{
  using boost::gregorian::date;

  //
  // class NumericTimeSeries
  //
  // Dated scalar values kept in ascending date order. Indicator outputs are
  // returned as NumericTimeSeries so that they can be joined by date.
  //

  template <class Decimal> class NumericTimeSeries
  {
  public:
    typedef typename std::vector<NumericTimeSeriesEntry<Decimal>>::const_iterator ConstSortedIterator;

    NumericTimeSeries()
      : mEntries()
    {}

    explicit NumericTimeSeries (unsigned long numElements)
      : mEntries()
    {
      mEntries.reserve(numElements);
    }

    void addEntry (const NumericTimeSeriesEntry<Decimal>& entry)
    {
      if (!mEntries.empty() && !(mEntries.back().getDateValue() < entry.getDateValue()))
	throw TimeSeriesException("NumericTimeSeries:addEntry: entry on " +
				  boost::gregorian::to_simple_string(entry.getDateValue()) +
				  " is not after last entry on " +
				  boost::gregorian::to_simple_string(mEntries.back().getDateValue()));

      mEntries.push_back(entry);
    }

    void addEntry (const date& entryDate, const Decimal& value)
    {
      addEntry(NumericTimeSeriesEntry<Decimal>(entryDate, value));
    }

    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mEntries.size());
    }

    bool isEmpty() const
    {
      return mEntries.empty();
    }

    const NumericTimeSeriesEntry<Decimal>& getEntry (unsigned long index) const
    {
      if (index >= mEntries.size())
	throw TimeSeriesOffsetOutOfRangeException("NumericTimeSeries:getEntry: index " +
						  std::to_string(index) + " out of range");
      return mEntries[index];
    }

    const Decimal& getValue (unsigned long index) const
    {
      return getEntry(index).getValue();
    }

    const Decimal& getLastValue() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("NumericTimeSeries:getLastValue: no entries in time series");
      return mEntries.back().getValue();
    }

    // Value at date; throws TimeSeriesDataNotFoundException if the date is absent.
    const Decimal& getValue (const date& entryDate) const
    {
      auto it = std::lower_bound(mEntries.begin(), mEntries.end(), entryDate,
				 [](const NumericTimeSeriesEntry<Decimal>& e, const date& d)
				 { return e.getDateValue() < d; });

      if (it == mEntries.end() || it->getDateValue() != entryDate)
	throw TimeSeriesDataNotFoundException("NumericTimeSeries:getValue: no entry on " +
					      boost::gregorian::to_simple_string(entryDate));
      return it->getValue();
    }

    std::vector<Decimal> getTimeSeriesAsVector() const
    {
      std::vector<Decimal> values;
      values.reserve(mEntries.size());
      for (const auto& entry : mEntries)
	values.push_back(entry.getValue());

      return values;
    }

    ConstSortedIterator beginSortedAccess() const
    {
      return mEntries.begin();
    }

    ConstSortedIterator endSortedAccess() const
    {
      return mEntries.end();
    }

    const date& getFirstDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("NumericTimeSeries:getFirstDate: no entries in time series");
      return mEntries.front().getDateValue();
    }

    const date& getLastDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("NumericTimeSeries:getLastDate: no entries in time series");
      return mEntries.back().getDateValue();
    }

  private:
    std::vector<NumericTimeSeriesEntry<Decimal>> mEntries;
  };

  //
  // class OHLCTimeSeries
  //
  // Daily bars in strictly ascending date order. Gaps between sessions are
  // allowed; consecutive entries are treated as consecutive sessions.
  //

  template <class Decimal> class OHLCTimeSeries
  {
  public:
    typedef typename std::vector<OHLCTimeSeriesEntry<Decimal>>::const_iterator ConstSortedIterator;

    OHLCTimeSeries()
      : mEntries()
    {}

    explicit OHLCTimeSeries (unsigned long numElements)
      : mEntries()
    {
      mEntries.reserve(numElements);
    }

    void addEntry (const OHLCTimeSeriesEntry<Decimal>& entry)
    {
      checkOrder(entry);
      mEntries.push_back(entry);
    }

    void addEntry (OHLCTimeSeriesEntry<Decimal>&& entry)
    {
      checkOrder(entry);
      mEntries.push_back(std::move(entry));
    }

    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mEntries.size());
    }

    bool isEmpty() const
    {
      return mEntries.empty();
    }

    const OHLCTimeSeriesEntry<Decimal>& getEntry (unsigned long index) const
    {
      if (index >= mEntries.size())
	throw TimeSeriesOffsetOutOfRangeException("OHLCTimeSeries:getEntry: index " +
						  std::to_string(index) + " out of range");
      return mEntries[index];
    }

    // Entry `offset` sessions before the most recent one (0 == last entry).
    const OHLCTimeSeriesEntry<Decimal>& getEntryFromEnd (unsigned long offset) const
    {
      if (offset >= mEntries.size())
	throw TimeSeriesOffsetOutOfRangeException("OHLCTimeSeries:getEntryFromEnd: offset " +
						  std::to_string(offset) + " out of range");
      return mEntries[mEntries.size() - 1 - offset];
    }

    const OHLCTimeSeriesEntry<Decimal>& getLastEntry() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("OHLCTimeSeries:getLastEntry: no entries in time series");
      return mEntries.back();
    }

    ConstSortedIterator beginSortedAccess() const
    {
      return mEntries.begin();
    }

    ConstSortedIterator endSortedAccess() const
    {
      return mEntries.end();
    }

    const date& getFirstDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("OHLCTimeSeries:getFirstDate: no entries in time series");
      return mEntries.front().getDateValue();
    }

    const date& getLastDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException("OHLCTimeSeries:getLastDate: no entries in time series");
      return mEntries.back().getDateValue();
    }

    NumericTimeSeries<Decimal> CloseTimeSeries() const
    {
      return extract([](const OHLCTimeSeriesEntry<Decimal>& e) { return e.getCloseValue(); });
    }

  private:
    void checkOrder (const OHLCTimeSeriesEntry<Decimal>& entry) const
    {
      if (!mEntries.empty() && !(mEntries.back().getDateValue() < entry.getDateValue()))
	throw TimeSeriesException("OHLCTimeSeries:addEntry: entry on " +
				  boost::gregorian::to_simple_string(entry.getDateValue()) +
				  " is not after last entry on " +
				  boost::gregorian::to_simple_string(mEntries.back().getDateValue()));
    }

    template <class Accessor>
    NumericTimeSeries<Decimal> extract (Accessor accessor) const
    {
      NumericTimeSeries<Decimal> result(getNumEntries());
      for (const auto& entry : mEntries)
	result.addEntry(entry.getDateValue(), accessor(entry));

      return result;
    }

  private:
    std::vector<OHLCTimeSeriesEntry<Decimal>> mEntries;
  };

} // namespace swing_timeseries

#endif // __SWING_TIMESERIES_H
