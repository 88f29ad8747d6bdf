#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include "screening/gates/TechnicalTrendGate.h"
#include "ScannerTestFixtures.h"

using namespace swingscanner;
using namespace swingscanner::screening;
using namespace swingscanner::screening::gates;
using Catch::Approx;

namespace
{
  // Three 10-session segments with lows giving depths 0.20, 0.10 and 0.05.
  SeriesType createContractingSeries (double finalSegmentLow = 95.0)
  {
    const double lows[3] = { 80.0, 90.0, finalSegmentLow };
    std::vector<boost::gregorian::date> sessions (weekdaySessions (defaultFirstSession(), 30));

    SeriesType series (30);
    for (unsigned long i = 0; i < sessions.size(); ++i)
      series.addEntry (EntryType (sessions[i], 100.0, 100.0, lows[i / 10], 100.0, 1000000.0));

    return series;
  }

  InstrumentBatch singleInstrumentBatch (const SeriesType& series,
					 std::shared_ptr<const SeriesType> benchmark = flatBenchmark())
  {
    std::vector<Instrument> instruments;
    instruments.push_back (makeInstrument ("TEST", series));
    return InstrumentBatch (instruments, benchmark);
  }
}

TEST_CASE ("Volatility contraction detection", "[TechnicalTrendGate]")
{
  SECTION ("Segment depths")
    {
      std::vector<double> depths (TechnicalTrendGate::segmentDepths (createContractingSeries(), 10, 3));
      REQUIRE (depths.size() == 3);
      REQUIRE (depths[0] == Approx (0.20));
      REQUIRE (depths[1] == Approx (0.10));
      REQUIRE (depths[2] == Approx (0.05));
    }

  SECTION ("Contracting with a tight final segment")
    {
      REQUIRE (TechnicalTrendGate::detectVcp (createContractingSeries(), 10, 0.10));
    }

  SECTION ("Final segment too deep")
    {
      REQUIRE_FALSE (TechnicalTrendGate::detectVcp (createContractingSeries(), 10, 0.04));
    }

  SECTION ("Not strictly contracting")
    {
      REQUIRE_FALSE (TechnicalTrendGate::detectVcp (createContractingSeries (90.0), 10, 0.10));
    }

  SECTION ("Too short")
    {
      REQUIRE (TechnicalTrendGate::segmentDepths (createFlatSeries (29), 10, 3).empty());
      REQUIRE_FALSE (TechnicalTrendGate::detectVcp (createFlatSeries (29), 10, 0.10));
    }

  SECTION ("Expanding ranges are not a contraction")
    {
      REQUIRE_FALSE (TechnicalTrendGate::detectVcp (createAcceleratingUptrendSeries (320), 10, 0.10));
    }
}

TEST_CASE ("Shortfall text separates value from threshold", "[TechnicalTrendGate]")
{
  REQUIRE (TechnicalTrendGate::describeShortfall ("ADX", 12.0, 20.0) == "ADX 12.00 < 20.00");
  REQUIRE (TechnicalTrendGate::describeShortfall ("RS Slope", 0.0099999, 0.01) == "RS Slope 0.0099999 < 0.0100000");
  REQUIRE (TechnicalTrendGate::describeShortfall ("ADX", 19.996, 20.0) == "ADX 19.996 < 20.000");
  REQUIRE (TechnicalTrendGate::describeShortfall ("RS Slope", -0.004, 0.0) == "RS Slope -0.004 < 0.000");
}

TEST_CASE ("Confirmed uptrend passes", "[TechnicalTrendGate]")
{
  TechnicalTrendGate gate ((TechnicalGateConfig()));
  GateStageResult stage (runGate (gate, singleInstrumentBatch (createAcceleratingUptrendSeries (320))));

  const GateResult& result = resultFor (stage, "TEST");
  REQUIRE (result.passed());
  REQUIRE (stage.survivors.size() == 1);
  REQUIRE (result.getLabel ("pattern") == "Stage2");
  REQUIRE (result.getMetric ("close") > result.getMetric ("ma_short"));
  REQUIRE (result.getMetric ("ma_short") > result.getMetric ("ma_mid"));
  REQUIRE (result.getMetric ("ma_mid") > result.getMetric ("ma_long"));
  REQUIRE (result.getMetric ("ma_long") > result.getMetric ("ma_long_prior"));
  REQUIRE (result.getMetric ("adx") == Approx (100.0));
  REQUIRE (result.getMetric ("mrs_slope") == Approx (0.7719).epsilon (1e-3));
}

TEST_CASE ("Trend template failures are hard", "[TechnicalTrendGate]")
{
  TechnicalTrendGate gate ((TechnicalGateConfig()));

  SECTION ("Flat series")
    {
      GateStageResult stage (runGate (gate, singleInstrumentBatch (createFlatSeries (250))));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::HardFail);
      REQUIRE (result.getLabel ("pattern") == "None");
      REQUIRE (result.getReason().find ("trend template failed") == 0);
      REQUIRE (stage.survivors.empty());
    }

  SECTION ("One session short of the required history")
    {
      GateStageResult stage (runGate (gate, singleInstrumentBatch (createAcceleratingUptrendSeries (219))));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::HardFail);
      REQUIRE (result.getReason().find ("insufficient history") == 0);
    }
}

TEST_CASE ("Relative strength inputs", "[TechnicalTrendGate]")
{
  TechnicalTrendGate gate ((TechnicalGateConfig()));

  SECTION ("No benchmark")
    {
      GateStageResult stage (runGate (gate, singleInstrumentBatch (createAcceleratingUptrendSeries (320), nullptr)));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::HardFail);
      REQUIRE (result.getReason().find ("insufficient history") == 0);
    }

  SECTION ("Fewer weekly points than the lookback")
    {
      // 220 sessions hold the template but only 44 weekly closes
      GateStageResult stage (runGate (gate, singleInstrumentBatch (createAcceleratingUptrendSeries (220))));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::HardFail);
      REQUIRE (result.getReason().find ("insufficient history") == 0);
      REQUIRE (result.getLabel ("pattern") == "Stage2");
    }
}

TEST_CASE ("Weak trend strength is a soft failure", "[TechnicalTrendGate]")
{
  SECTION ("ADX below minimum")
    {
      TechnicalGateConfig config;
      config.minAdx = 101.0;

      GateStageResult stage (runGate (TechnicalTrendGate (config),
				      singleInstrumentBatch (createAcceleratingUptrendSeries (320))));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::SoftFail);
      REQUIRE (result.getReason().find ("ADX 100.00 < 101.00") != std::string::npos);
      REQUIRE (result.hasMetric ("adx"));
      REQUIRE (stage.survivors.empty());
    }

  SECTION ("Relative strength slope below minimum")
    {
      TechnicalGateConfig config;
      config.minMansfieldSlope = 5.0;

      GateStageResult stage (runGate (TechnicalTrendGate (config),
				      singleInstrumentBatch (createAcceleratingUptrendSeries (320))));
      const GateResult& result = resultFor (stage, "TEST");

      REQUIRE (result.getOutcome() == GateOutcome::SoftFail);
      REQUIRE (result.getReason().find ("RS Slope") != std::string::npos);
      REQUIRE (result.hasMetric ("mrs_slope"));
    }
}
