#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <boost/filesystem.hpp>
#include "TimeSeriesCsvReader.h"
#include "TestUtils.h"

using namespace swing_timeseries;
using namespace boost::gregorian;

namespace
{
  std::string writeTempFile (const std::string& contents)
  {
    boost::filesystem::path path = boost::filesystem::temp_directory_path() /
      boost::filesystem::unique_path("ohlcv-%%%%-%%%%.csv");
    std::ofstream out (path.string());
    out << contents;
    return path.string();
  }
}

TEST_CASE ("OHLCVCsvReader reads daily bars", "[TimeSeriesCsvReader]")
{
  std::string fileName = writeTempFile ("Date,Open,High,Low,Close,Volume\n"
					"20240102,101.5,103.0,100.8,102.2,1250000\n"
					"20240103,102.2,104.1,101.9,103.7,1430000\n"
					"20240104,103.7,103.9,101.0,101.4,990000\n");

  OHLCVCsvReader<DecimalType> reader (fileName);
  reader.readFile();
  auto series = reader.getTimeSeries();

  REQUIRE (series->getNumEntries() == 3);
  REQUIRE (series->getFirstDate() == date (2024, Jan, 2));
  REQUIRE (series->getLastEntry().getCloseValue() == 101.4);
  REQUIRE (series->getEntry (1).getVolumeValue() == 1430000.0);

  boost::filesystem::remove (fileName);
}

TEST_CASE ("OHLCVCsvReader error handling", "[TimeSeriesCsvReader]")
{
  SECTION ("Missing file")
    {
      REQUIRE_THROWS_AS (OHLCVCsvReader<DecimalType> ("/nonexistent/ticker.csv"), std::runtime_error);
    }

  SECTION ("Bad number")
    {
      std::string fileName = writeTempFile ("Date,Open,High,Low,Close,Volume\n"
					    "20240102,abc,103.0,100.8,102.2,1250000\n");
      OHLCVCsvReader<DecimalType> reader (fileName);
      REQUIRE_THROWS_AS (reader.readFile(), TimeSeriesException);
      boost::filesystem::remove (fileName);
    }

  SECTION ("Out of order rows")
    {
      std::string fileName = writeTempFile ("Date,Open,High,Low,Close,Volume\n"
					    "20240103,101.5,103.0,100.8,102.2,1250000\n"
					    "20240102,101.5,103.0,100.8,102.2,1250000\n");
      OHLCVCsvReader<DecimalType> reader (fileName);
      REQUIRE_THROWS_AS (reader.readFile(), TimeSeriesException);
      boost::filesystem::remove (fileName);
    }
}
