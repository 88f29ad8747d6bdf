#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <stdexcept>

#include "TimeSeriesIndicators.h"
#include "TimeSeries.h"
#include "TestUtils.h"

using namespace swing_timeseries;
using namespace boost::gregorian;
using Catch::Approx;

TEST_CASE ("Mean and population standard deviation", "[TimeSeriesIndicators]")
{
  std::vector<DecimalType> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

  REQUIRE (Mean (values) == Approx (5.0));
  REQUIRE (StandardDeviation (values) == Approx (2.0));

  std::vector<DecimalType> empty;
  REQUIRE (Mean (empty) == 0.0);
  REQUIRE (StandardDeviation (empty) == 0.0);
}

TEST_CASE ("SmaSeries", "[TimeSeriesIndicators]")
{
  NumericTimeSeries<DecimalType> series;
  std::vector<date> sessions (weekdaySessions (defaultFirstSession(), 5));
  for (unsigned long i = 0; i < sessions.size(); ++i)
    series.addEntry (sessions[i], static_cast<DecimalType>(i + 1));

  NumericTimeSeries<DecimalType> sma (SmaSeries (series, 3));

  REQUIRE (sma.getNumEntries() == 3);
  REQUIRE (sma.getFirstDate() == sessions[2]);
  REQUIRE (sma.getValue (0) == Approx (2.0));
  REQUIRE (sma.getValue (1) == Approx (3.0));
  REQUIRE (sma.getLastValue() == Approx (4.0));

  REQUIRE_THROWS_AS (SmaSeries (series, 6), InsufficientDataException);
  REQUIRE_THROWS_AS (SmaSeries (series, 0), std::domain_error);
}

TEST_CASE ("AverageRelativeRange", "[TimeSeriesIndicators]")
{
  SECTION ("Constant range")
    {
      SeriesType series (createConstantRangeSeries (30, 50.0, 0.02));
      REQUIRE (AverageRelativeRange (series, 20) == Approx (0.02));
    }

  SECTION ("Only the trailing window is used")
    {
      SeriesType series;
      std::vector<date> sessions (weekdaySessions (defaultFirstSession(), 4));
      series.addEntry (EntryType (sessions[0], 100.0, 150.0, 50.0, 100.0, 1.0));
      series.addEntry (EntryType (sessions[1], 100.0, 101.0, 99.0, 100.0, 1.0));
      series.addEntry (EntryType (sessions[2], 100.0, 102.0, 98.0, 100.0, 1.0));
      series.addEntry (EntryType (sessions[3], 100.0, 103.0, 97.0, 100.0, 1.0));

      REQUIRE (AverageRelativeRange (series, 3) == Approx (0.04));
    }

  SECTION ("Short series")
    {
      SeriesType series (createConstantRangeSeries (19, 50.0, 0.02));
      REQUIRE_THROWS_AS (AverageRelativeRange (series, 20), InsufficientDataException);

      try
	{
	  AverageRelativeRange (series, 20);
	}
      catch (const InsufficientDataException& e)
	{
	  REQUIRE (e.getRequired() == 20);
	  REQUIRE (e.getAvailable() == 19);
	}
    }

  SECTION ("Non-positive close")
    {
      SeriesType series (createFlatSeries (20, 0.0));
      REQUIRE_THROWS_AS (AverageRelativeRange (series, 20), std::domain_error);
    }
}

TEST_CASE ("True range and ATR", "[TimeSeriesIndicators]")
{
  SeriesType series;
  series.addEntry (*createTimeSeriesEntry ("20240102", "10", "11", "9", "10", "100"));
  series.addEntry (*createTimeSeriesEntry ("20240103", "12", "14", "12", "13", "100"));
  series.addEntry (*createTimeSeriesEntry ("20240104", "13", "13.5", "11", "12", "100"));

  NumericTimeSeries<DecimalType> tr (TrueRangeSeries (series));
  REQUIRE (tr.getNumEntries() == 3);
  REQUIRE (tr.getValue (0) == Approx (2.0));
  REQUIRE (tr.getValue (1) == Approx (4.0));
  REQUIRE (tr.getValue (2) == Approx (2.5));

  NumericTimeSeries<DecimalType> atr (AverageTrueRangeSeries (series, 2));
  REQUIRE (atr.getNumEntries() == 2);
  REQUIRE (atr.getFirstDate() == date (2024, Jan, 3));
  REQUIRE (atr.getValue (0) == Approx (3.0));
  REQUIRE (atr.getLastValue() == Approx (2.75));

  REQUIRE_THROWS_AS (AverageTrueRangeSeries (series, 4), InsufficientDataException);
}

TEST_CASE ("AdxSeries", "[TimeSeriesIndicators]")
{
  SECTION ("Flat series has no directional movement")
    {
      NumericTimeSeries<DecimalType> adx (AdxSeries (createFlatSeries (60), 14));
      REQUIRE (adx.getNumEntries() == 60 - 28 + 1);
      REQUIRE (adx.getLastValue() == Approx (0.0));
    }

  SECTION ("One-directional trend reads 100")
    {
      SeriesType series (createAcceleratingUptrendSeries (60));
      NumericTimeSeries<DecimalType> adx (AdxSeries (series, 14));
      REQUIRE (adx.getFirstDate() == series.getEntry (27).getDateValue());
      REQUIRE (adx.getLastDate() == series.getLastDate());
      REQUIRE (adx.getLastValue() == Approx (100.0));
    }

  SECTION ("Needs two periods of history")
    {
      REQUIRE_THROWS_AS (AdxSeries (createFlatSeries (27), 14), InsufficientDataException);
      REQUIRE_NOTHROW (AdxSeries (createFlatSeries (28), 14));
    }
}

TEST_CASE ("Weekly sampling", "[TimeSeriesIndicators]")
{
  NumericTimeSeries<DecimalType> daily;
  std::vector<date> sessions (weekdaySessions (date (2024, Jan, 1), 10));
  for (unsigned long i = 0; i < sessions.size(); ++i)
    daily.addEntry (sessions[i], static_cast<DecimalType>(i + 1));

  NumericTimeSeries<DecimalType> weekly (WeeklyLastValueSeries (daily));

  REQUIRE (weekly.getNumEntries() == 2);
  REQUIRE (weekly.getEntry (0).getDateValue() == date (2024, Jan, 5));
  REQUIRE (weekly.getValue (0) == 5.0);
  REQUIRE (weekly.getEntry (1).getDateValue() == date (2024, Jan, 12));
  REQUIRE (weekly.getValue (1) == 10.0);
}

TEST_CASE ("RelativePerformanceSeries joins on shared dates", "[TimeSeriesIndicators]")
{
  NumericTimeSeries<DecimalType> stock, index;
  stock.addEntry (date (2024, Jan, 2), 10.0);
  stock.addEntry (date (2024, Jan, 3), 12.0);
  stock.addEntry (date (2024, Jan, 5), 15.0);
  index.addEntry (date (2024, Jan, 3), 4.0);
  index.addEntry (date (2024, Jan, 4), 5.0);
  index.addEntry (date (2024, Jan, 5), 5.0);

  NumericTimeSeries<DecimalType> rp (RelativePerformanceSeries (stock, index));
  REQUIRE (rp.getNumEntries() == 2);
  REQUIRE (rp.getValue (date (2024, Jan, 3)) == Approx (3.0));
  REQUIRE (rp.getValue (date (2024, Jan, 5)) == Approx (3.0));
}

TEST_CASE ("Linear regression slope", "[TimeSeriesIndicators]")
{
  REQUIRE (LinearRegressionSlope (std::vector<DecimalType>{1.0, 3.0, 5.0, 7.0}) == Approx (2.0));
  REQUIRE (LinearRegressionSlope (std::vector<DecimalType>{4.0, 4.0, 4.0}) == Approx (0.0));
  REQUIRE (LinearRegressionSlope (std::vector<DecimalType>{3.0, 2.0}) == Approx (-1.0));
  REQUIRE_THROWS_AS (LinearRegressionSlope (std::vector<DecimalType>{5.0}), InsufficientDataException);
}

TEST_CASE ("Mansfield relative strength", "[TimeSeriesIndicators]")
{
  SeriesType benchmark (createFlatSeries (320, 1000.0));

  SECTION ("Outperformer has rising MRS")
    {
      SeriesType series (createAcceleratingUptrendSeries (320));
      NumericTimeSeries<DecimalType> mrs (MansfieldRelativeStrengthSeries (series, benchmark, 52));

      REQUIRE (mrs.getNumEntries() == 64 - 52 + 1);
      REQUIRE (mrs.getLastValue() > 0.0);
      REQUIRE (TrailingSlope (mrs, 4) > 0.01);
    }

  SECTION ("Series matching the benchmark has zero MRS")
    {
      SeriesType series (createFlatSeries (320, 50.0));
      NumericTimeSeries<DecimalType> mrs (MansfieldRelativeStrengthSeries (series, benchmark, 52));

      REQUIRE (mrs.getLastValue() == Approx (0.0).margin (1e-9));
      REQUIRE (TrailingSlope (mrs, 4) == Approx (0.0).margin (1e-9));
    }

  SECTION ("Not enough weeks")
    {
      SeriesType series (createAcceleratingUptrendSeries (200));
      REQUIRE_THROWS_AS (MansfieldRelativeStrengthSeries (series, benchmark, 52), InsufficientDataException);
    }

  SECTION ("Empty benchmark")
    {
      SeriesType series (createAcceleratingUptrendSeries (320));
      REQUIRE_THROWS_AS (MansfieldRelativeStrengthSeries (series, SeriesType(), 52), InsufficientDataException);
    }
}
