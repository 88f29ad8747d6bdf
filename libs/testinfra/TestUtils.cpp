#include <cmath>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "TestUtils.h"

using namespace boost::gregorian;
using namespace swing_timeseries;

std::shared_ptr<EntryType>
createTimeSeriesEntry (const std::string& dateString,
		       const std::string& openPrice,
		       const std::string& highPrice,
		       const std::string& lowPrice,
		       const std::string& closePrice,
		       const std::string& vol)
{
  date d1 (from_undelimited_string (dateString));

  return std::make_shared<EntryType>(d1,
				     boost::lexical_cast<DecimalType>(openPrice),
				     boost::lexical_cast<DecimalType>(highPrice),
				     boost::lexical_cast<DecimalType>(lowPrice),
				     boost::lexical_cast<DecimalType>(closePrice),
				     boost::lexical_cast<DecimalType>(vol));
}

date defaultFirstSession()
{
  // a Monday
  return date(2024, Jan, 1);
}

std::vector<date>
weekdaySessions (const date& firstDate, unsigned long numSessions)
{
  std::vector<date> sessions;
  sessions.reserve(numSessions);

  date current(firstDate);
  while (sessions.size() < numSessions)
    {
      if (current.day_of_week() != Saturday && current.day_of_week() != Sunday)
	sessions.push_back(current);
      current += days(1);
    }

  return sessions;
}

SeriesType
createAcceleratingUptrendSeries (unsigned long numSessions, DecimalType volume)
{
  std::vector<date> sessions(weekdaySessions(defaultFirstSession(), numSessions));
  SeriesType series(numSessions);

  for (unsigned long t = 0; t < numSessions; ++t)
    {
      double td = static_cast<double>(t);
      DecimalType close = 100.0 * std::exp(5.0e-6 * td * td);
      series.addEntry(EntryType(sessions[t], close, close * 1.01, close * 0.99, close, volume));
    }

  return series;
}

SeriesType
createFlatSeries (unsigned long numSessions, DecimalType price, DecimalType volume)
{
  std::vector<date> sessions(weekdaySessions(defaultFirstSession(), numSessions));
  SeriesType series(numSessions);

  for (const auto& session : sessions)
    series.addEntry(EntryType(session, price, price, price, price, volume));

  return series;
}

SeriesType
createConstantRangeSeries (unsigned long numSessions,
			   DecimalType close,
			   DecimalType relativeRange,
			   DecimalType volume)
{
  if (relativeRange < 0.0 || relativeRange >= 2.0)
    throw std::invalid_argument("createConstantRangeSeries: relative range out of bounds");

  std::vector<date> sessions(weekdaySessions(defaultFirstSession(), numSessions));
  SeriesType series(numSessions);
  DecimalType halfRange = close * relativeRange / 2.0;

  for (const auto& session : sessions)
    series.addEntry(EntryType(session, close, close + halfRange, close - halfRange, close, volume));

  return series;
}

SeriesType
replaceLastVolume (const SeriesType& series, DecimalType volume)
{
  SeriesType result(series.getNumEntries());
  if (series.isEmpty())
    return result;

  unsigned long last = series.getNumEntries() - 1;
  for (unsigned long i = 0; i < last; ++i)
    result.addEntry(series.getEntry(i));

  const EntryType& finalBar = series.getEntry(last);
  result.addEntry(EntryType(finalBar.getDateValue(),
			    finalBar.getOpenValue(),
			    finalBar.getHighValue(),
			    finalBar.getLowValue(),
			    finalBar.getCloseValue(),
			    volume));
  return result;
}
