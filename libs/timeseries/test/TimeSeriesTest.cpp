#include <catch2/catch_test_macros.hpp>
#include "TimeSeries.h"
#include "TestUtils.h"

using namespace swing_timeseries;
using namespace boost::gregorian;

TEST_CASE ("OHLCTimeSeries operations", "[TimeSeries]")
{
  SeriesType series;

  auto entry0 = createTimeSeriesEntry ("19851118", "3664.51", "3687.58", "3656.49", "3672.55", "0");
  auto entry1 = createTimeSeriesEntry ("19851119", "3710.65", "3722.18", "3679.68", "3714.49", "0");
  auto entry2 = createTimeSeriesEntry ("19851120", "3737.02", "3737.02", "3699.49", "3704.12", "0");
  auto entry3 = createTimeSeriesEntry ("19851121", "3713.07", "3717.19", "3690.57", "3710.65", "0");

  series.addEntry (*entry0);
  series.addEntry (*entry1);
  series.addEntry (*entry2);
  series.addEntry (*entry3);

  SECTION ("Size and endpoints")
    {
      REQUIRE (series.getNumEntries() == 4);
      REQUIRE_FALSE (series.isEmpty());
      REQUIRE (series.getFirstDate() == date (1985, Nov, 18));
      REQUIRE (series.getLastDate() == date (1985, Nov, 21));
      REQUIRE (series.getLastEntry() == *entry3);
    }

  SECTION ("Indexed access")
    {
      REQUIRE (series.getEntry (0) == *entry0);
      REQUIRE (series.getEntry (2) == *entry2);
      REQUIRE (series.getEntryFromEnd (0) == *entry3);
      REQUIRE (series.getEntryFromEnd (3) == *entry0);
      REQUIRE_THROWS_AS (series.getEntry (4), TimeSeriesOffsetOutOfRangeException);
      REQUIRE_THROWS_AS (series.getEntryFromEnd (4), TimeSeriesOffsetOutOfRangeException);
    }

  SECTION ("Entries must be in ascending date order")
    {
      auto duplicate = createTimeSeriesEntry ("19851121", "3713.07", "3717.19", "3690.57", "3710.65", "0");
      auto earlier = createTimeSeriesEntry ("19851115", "3713.07", "3717.19", "3690.57", "3710.65", "0");

      REQUIRE_THROWS_AS (series.addEntry (*duplicate), TimeSeriesException);
      REQUIRE_THROWS_AS (series.addEntry (*earlier), TimeSeriesException);
      REQUIRE (series.getNumEntries() == 4);
    }

  SECTION ("Close series")
    {
      NumericTimeSeries<DecimalType> closes (series.CloseTimeSeries());

      REQUIRE (closes.getNumEntries() == 4);
      REQUIRE (closes.getValue (date (1985, Nov, 20)) == 3704.12);
    }

  SECTION ("Empty series")
    {
      SeriesType empty;
      REQUIRE (empty.isEmpty());
      REQUIRE_THROWS_AS (empty.getLastEntry(), TimeSeriesDataNotFoundException);
      REQUIRE_THROWS_AS (empty.getFirstDate(), TimeSeriesDataNotFoundException);
    }
}

TEST_CASE ("NumericTimeSeries operations", "[NumericTimeSeries]")
{
  NumericTimeSeries<DecimalType> series;
  series.addEntry (date (2021, Apr, 5), 100.0);
  series.addEntry (date (2021, Apr, 6), 101.0);
  series.addEntry (date (2021, Apr, 8), 102.0);

  REQUIRE (series.getNumEntries() == 3);
  REQUIRE (series.getValue (date (2021, Apr, 6)) == 101.0);
  REQUIRE_THROWS_AS (series.getValue (date (2021, Apr, 7)), TimeSeriesDataNotFoundException);
  REQUIRE (series.getTimeSeriesAsVector() == std::vector<DecimalType>{100.0, 101.0, 102.0});
  REQUIRE_THROWS_AS (series.addEntry (date (2021, Apr, 8), 1.0), TimeSeriesException);
}
