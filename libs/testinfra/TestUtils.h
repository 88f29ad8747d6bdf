#ifndef __SWING_TEST_UTILS_H
#define __SWING_TEST_UTILS_H 1

#include <string>
#include <memory>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeries.h"

typedef double DecimalType;
typedef swing_timeseries::OHLCTimeSeriesEntry<DecimalType> EntryType;
typedef swing_timeseries::OHLCTimeSeries<DecimalType> SeriesType;

std::shared_ptr<EntryType>
createTimeSeriesEntry (const std::string& dateString,
		       const std::string& openPrice,
		       const std::string& highPrice,
		       const std::string& lowPrice,
		       const std::string& closePrice,
		       const std::string& vol);

// Consecutive Monday..Friday dates starting on (or after) firstDate.
std::vector<boost::gregorian::date>
weekdaySessions (const boost::gregorian::date& firstDate, unsigned long numSessions);

boost::gregorian::date defaultFirstSession();

// close = 100 * exp(5e-6 * t^2), high = 1.01 * close, low = 0.99 * close,
// constant volume. Satisfies the trend template after 220 sessions and has
// rising relative strength against a flat benchmark.
SeriesType
createAcceleratingUptrendSeries (unsigned long numSessions,
				 DecimalType volume = 1000000.0);

// Every bar has open = high = low = close = price.
SeriesType
createFlatSeries (unsigned long numSessions,
		  DecimalType price = 100.0,
		  DecimalType volume = 1000000.0);

// Constant close with (high - low) / close == relativeRange on every bar.
SeriesType
createConstantRangeSeries (unsigned long numSessions,
			   DecimalType close,
			   DecimalType relativeRange,
			   DecimalType volume = 1000000.0);

// Copy of series with the volume of the final bar replaced.
SeriesType
replaceLastVolume (const SeriesType& series, DecimalType volume);

#endif
