// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __SWING_TIMESERIES_CSVREADER_H
#define __SWING_TIMESERIES_CSVREADER_H 1

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include "TimeSeries.h"
#include "csv.h"

namespace swing_timeseries
{
  template <class Decimal>
  class TimeSeriesCsvReader
  {
  public:
    explicit TimeSeriesCsvReader (const std::string& fileName)
      : mFileName (fileName),
	mTimeSeries(std::make_shared<OHLCTimeSeries<Decimal>>())
    {
      // ensure file exists (all readers inherit this check)
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw std::runtime_error("Cannot open file: " + mFileName);
    }

    virtual ~TimeSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    void addEntry (OHLCTimeSeriesEntry<Decimal>&& entry)
    {
      mTimeSeries->addEntry(std::move(entry));
    }

    std::shared_ptr<OHLCTimeSeries<Decimal>> getTimeSeries()
    {
      return mTimeSeries;
    }

    virtual void readFile() = 0;

  protected:
    Decimal parseValue (const std::string& field, const std::string& fieldName, int lineNo) const
    {
      try
	{
	  return boost::lexical_cast<Decimal>(boost::algorithm::trim_copy(field));
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw TimeSeriesException(mFileName + ": line " + std::to_string(lineNo) +
				    ": invalid " + fieldName + " value '" + field + "'");
	}
    }

  private:
    std::string mFileName;
    std::shared_ptr<OHLCTimeSeries<Decimal>> mTimeSeries;
  };

  //
  // Reader for daily OHLCV files with a header line
  //
  //   Date,Open,High,Low,Close,Volume
  //   20240102,101.5,103.0,100.8,102.2,1250000
  //
  // Extra columns are ignored. Rows must be in ascending date order.
  //

  template <class Decimal>
  class OHLCVCsvReader : public TimeSeriesCsvReader<Decimal>
  {
  public:
    explicit OHLCVCsvReader (const std::string& fileName)
      : TimeSeriesCsvReader<Decimal> (fileName),
	mCsvFile (fileName.c_str())
    {}

    ~OHLCVCsvReader()
    {}

    void readFile()
    {
      mCsvFile.read_header(io::ignore_extra_column, "Date", "Open", "High", "Low", "Close", "Volume");

      std::string dateStamp;
      std::string openString, highString, lowString, closeString, volumeString;
      boost::gregorian::date entryDate;

      // header is line 1
      int lineNo = 1;
      while (mCsvFile.read_row(dateStamp, openString, highString, lowString, closeString, volumeString))
	{
	  ++lineNo;
	  try
	    {
	      entryDate = boost::gregorian::from_undelimited_string(boost::algorithm::trim_copy(dateStamp));
	    }
	  catch (const std::exception& e)
	    {
	      throw TimeSeriesException(this->getFileName() + ": line " + std::to_string(lineNo) +
					": invalid date '" + dateStamp + "': " + e.what());
	    }

	  TimeSeriesCsvReader<Decimal>::addEntry (OHLCTimeSeriesEntry<Decimal> (entryDate,
										this->parseValue(openString, "Open", lineNo),
										this->parseValue(highString, "High", lineNo),
										this->parseValue(lowString, "Low", lineNo),
										this->parseValue(closeString, "Close", lineNo),
										this->parseValue(volumeString, "Volume", lineNo)));
	}
    }

  private:
    io::CSVReader<6, io::trim_chars<' ', '\t'>> mCsvFile;
  };

} // namespace swing_timeseries

#endif // __SWING_TIMESERIES_CSVREADER_H
