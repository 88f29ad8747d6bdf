#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include "screening/gates/SpreadQualityGate.h"
#include "ScannerTestFixtures.h"

using namespace swingscanner;
using namespace swingscanner::screening;
using namespace swingscanner::screening::gates;
using Catch::Approx;

namespace
{
  SectorSpreadTable singleSectorTable (const std::string& sector, std::size_t count, double mean, double stdDev)
  {
    std::map<std::string, SectorSpreadStats> stats;
    stats[sector] = SectorSpreadTable::makeStats (sector, count, mean, stdDev);
    return SectorSpreadTable (stats);
  }
}

TEST_CASE ("Spread z-score boundary", "[SpreadQualityGate]")
{
  SpreadQualityGate gate ((SpreadGateConfig()));
  SectorSpreadTable table (singleSectorTable ("Tech", 5, 0.125, 0.0625));

  SECTION ("z exactly at the maximum passes")
    {
      GateResult result (gate.evaluateSpread (0.25, "Tech", table));
      REQUIRE (result.passed());
      REQUIRE (result.getMetric ("spread_z") == Approx (2.0));
    }

  SECTION ("z just above the maximum fails")
    {
      GateResult result (gate.evaluateSpread (0.25 + 1e-9, "Tech", table));
      REQUIRE_FALSE (result.passed());
      REQUIRE (result.getOutcome() == GateOutcome::HardFail);
      REQUIRE (result.getReason().find ("z-score") != std::string::npos);
    }
}

TEST_CASE ("Absolute spread cap is exclusive", "[SpreadQualityGate]")
{
  SpreadQualityGate gate ((SpreadGateConfig()));
  SectorSpreadTable table (singleSectorTable ("Tech", 5, 0.45, 0.1));

  REQUIRE (gate.evaluateSpread (0.49, "Tech", table).passed());
  REQUIRE_FALSE (gate.evaluateSpread (0.5, "Tech", table).passed());
}

TEST_CASE ("Degenerate sectors", "[SpreadQualityGate]")
{
  SECTION ("Classification")
    {
      REQUIRE (SectorSpreadTable::makeStats (UNKNOWN_SECTOR, 10, 0.02, 0.01).degenerate);
      REQUIRE (SectorSpreadTable::makeStats ("Tech", 1, 0.02, 0.0).degenerate);
      REQUIRE (SectorSpreadTable::makeStats ("Tech", 4, 0.02, 1e-13).degenerate);
      REQUIRE_FALSE (SectorSpreadTable::makeStats ("Tech", 2, 0.02, 0.01).degenerate);
    }

  SECTION ("zScore throws for a degenerate sector")
    {
      SectorSpreadTable table (singleSectorTable ("Tech", 1, 0.02, 0.0));
      REQUIRE_THROWS_AS (table.zScore ("Tech", 0.02), DegenerateGroupException);
    }

  SECTION ("Only the absolute cap applies")
    {
      SpreadQualityGate gate ((SpreadGateConfig()));
      SectorSpreadTable table (singleSectorTable ("Tech", 1, 0.3, 0.0));

      GateResult result (gate.evaluateSpread (0.3, "Tech", table));
      REQUIRE (result.passed());
      REQUIRE_FALSE (result.hasMetric ("spread_z"));
      REQUIRE (result.getReason().find ("absolute cap only") != std::string::npos);
    }
}

TEST_CASE ("Outlier fails the absolute cap with z inside the bound", "[SpreadQualityGate]")
{
  const std::vector<std::pair<std::string, double>> spreads{
    { "A", 0.01 }, { "B", 0.02 }, { "C", 0.015 }, { "D", 0.5 }, { "E", 0.018 } };

  std::vector<Instrument> instruments;
  for (const auto& entry : spreads)
    instruments.push_back (makeInstrument (entry.first, createConstantRangeSeries (30, 100.0, entry.second), "Tech"));

  InstrumentBatch batch (instruments);
  SpreadQualityGate gate ((SpreadGateConfig()));
  GateStageResult stage (runGate (gate, batch));

  REQUIRE (stage.results.size() == 5);
  REQUIRE (stage.survivors == std::vector<std::string>{ "A", "B", "C", "E" });

  const GateResult& outlier = resultFor (stage, "D");
  REQUIRE_FALSE (outlier.passed());
  REQUIRE (outlier.getMetric ("spread") == Approx (0.5));
  REQUIRE (outlier.getMetric ("sector_mean") == Approx (0.1126));
  REQUIRE (outlier.getMetric ("sector_std") == Approx (0.193729).epsilon (1e-4));
  REQUIRE (outlier.getMetric ("spread_z") == Approx (1.9997).epsilon (1e-4));
  REQUIRE (outlier.getMetric ("spread_z") <= 2.0);
  REQUIRE (outlier.getReason().find ("absolute cap") != std::string::npos);
  REQUIRE (outlier.getLabel ("sector") == "Tech");
}

TEST_CASE ("Spread gate batch handling", "[SpreadQualityGate]")
{
  SECTION ("Short series fail with insufficient history")
    {
      std::vector<Instrument> instruments;
      instruments.push_back (makeInstrument ("SHORT", createConstantRangeSeries (19, 100.0, 0.02)));
      instruments.push_back (makeInstrument ("LONG", createConstantRangeSeries (30, 100.0, 0.02)));

      GateStageResult stage (runGate (SpreadQualityGate (SpreadGateConfig()), InstrumentBatch (instruments)));

      REQUIRE (stage.survivors == std::vector<std::string>{ "LONG" });
      REQUIRE (resultFor (stage, "SHORT").getReason().find ("insufficient history") == 0);
    }

  SECTION ("Unsectored instruments use the absolute cap only")
    {
      std::vector<Instrument> instruments;
      instruments.push_back (makeInstrument ("U1", createConstantRangeSeries (30, 100.0, 0.02), ""));
      instruments.push_back (makeInstrument ("U2", createConstantRangeSeries (30, 100.0, 0.4), "Unknown"));
      instruments.push_back (makeInstrument ("U3", createConstantRangeSeries (30, 100.0, 0.6), ""));

      GateStageResult stage (runGate (SpreadQualityGate (SpreadGateConfig()), InstrumentBatch (instruments)));

      REQUIRE (stage.survivors == std::vector<std::string>{ "U1", "U2" });
      REQUIRE (resultFor (stage, "U1").getLabel ("sector") == UNKNOWN_SECTOR);
      REQUIRE_FALSE (resultFor (stage, "U3").hasMetric ("spread_z"));
    }

  SECTION ("Empty input")
    {
      GateStageResult stage (runGate (SpreadQualityGate (SpreadGateConfig()), InstrumentBatch()));
      REQUIRE (stage.results.empty());
      REQUIRE (stage.survivors.empty());
    }
}
