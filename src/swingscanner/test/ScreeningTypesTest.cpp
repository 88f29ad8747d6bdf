#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "screening/InstrumentBatch.h"
#include "screening/ScreeningTypes.h"
#include "ScannerTestFixtures.h"

using namespace swingscanner::screening;

TEST_CASE ("Cap tier parsing", "[ScreeningTypes]")
{
  REQUIRE (parseCapTier ("LARGE") == CapTier::Large);
  REQUIRE (parseCapTier (" mid ") == CapTier::Mid);
  REQUIRE (parseCapTier ("Small Cap") == CapTier::Small);
  REQUIRE (parseCapTier ("SMALLCAP") == CapTier::Small);
  REQUIRE_FALSE (parseCapTier ("").has_value());
  REQUIRE_FALSE (parseCapTier ("MICRO").has_value());

  REQUIRE (toString (CapTier::Large) == "LARGE");
  REQUIRE (toString (CapTier::Mid) == "MID");
  REQUIRE (toString (CapTier::Small) == "SMALL");
}

TEST_CASE ("Instrument metadata", "[ScreeningTypes]")
{
  SECTION ("Unresolved tier is treated as SMALL")
    {
      Instrument instrument (makeInstrument ("ABC", createFlatSeries (5), "Tech", std::nullopt));
      REQUIRE_FALSE (instrument.getCapTier().has_value());
      REQUIRE (instrument.getEffectiveCapTier() == CapTier::Small);
    }

  SECTION ("Sector knowledge")
    {
      REQUIRE (makeInstrument ("A", createFlatSeries (5), "Banks").hasKnownSector());
      REQUIRE_FALSE (makeInstrument ("B", createFlatSeries (5), "").hasKnownSector());
      REQUIRE_FALSE (makeInstrument ("C", createFlatSeries (5), "Unknown").hasKnownSector());
    }

  SECTION ("Empty ticker rejected")
    {
      REQUIRE_THROWS_AS (makeInstrument ("", createFlatSeries (5)), std::invalid_argument);
    }
}

TEST_CASE ("GateResult factories", "[ScreeningTypes]")
{
  GateResult pass (GateResult::Pass ("ok", { { "adx", 25.0 } }, { { "pattern", "VCP" } }));
  REQUIRE (pass.passed());
  REQUIRE (pass.getOutcome() == GateOutcome::Pass);
  REQUIRE (pass.getMetric ("adx") == 25.0);
  REQUIRE (pass.getLabel ("pattern") == "VCP");
  REQUIRE_FALSE (pass.hasMetric ("mrs_slope"));
  REQUIRE_THROWS_AS (pass.getMetric ("mrs_slope"), std::out_of_range);

  GateResult soft (GateResult::SoftFail ("weak"));
  REQUIRE_FALSE (soft.passed());
  REQUIRE (toString (soft.getOutcome()) == "SoftFail");

  REQUIRE_FALSE (GateResult::HardFail ("bad").passed());
  REQUIRE_THROWS_AS (GateResult::Pass (""), std::invalid_argument);
}

TEST_CASE ("RationaleTrail is append only", "[ScreeningTypes]")
{
  RationaleTrail trail;
  REQUIRE (trail.isEmpty());

  trail.record ("ABC", gate_names::SPREAD, GateResult::Pass ("ok"));
  trail.record ("ABC", gate_names::FUNDAMENTALS, GateResult::HardFail ("F-score 2 < 4"));
  trail.record ("XYZ", gate_names::SPREAD, GateResult::Pass ("ok"));

  REQUIRE (trail.getNumInstruments() == 2);
  REQUIRE (trail.contains ("ABC", gate_names::FUNDAMENTALS));
  REQUIRE_FALSE (trail.contains ("XYZ", gate_names::FUNDAMENTALS));
  REQUIRE (trail.getResults ("ABC").size() == 2);
  REQUIRE (trail.getResult ("ABC", gate_names::FUNDAMENTALS).getReason() == "F-score 2 < 4");

  REQUIRE_THROWS_AS (trail.record ("ABC", gate_names::SPREAD, GateResult::Pass ("again")), std::logic_error);
  REQUIRE_THROWS_AS (trail.getResult ("XYZ", gate_names::TECHNICALS), std::out_of_range);
}

TEST_CASE ("InstrumentBatch", "[InstrumentBatch]")
{
  std::vector<Instrument> instruments;
  instruments.push_back (makeInstrument ("ZZZ", createFlatSeries (5)));
  instruments.push_back (makeInstrument ("AAA", createFlatSeries (5)));

  InstrumentBatch batch (instruments);
  REQUIRE (batch.size() == 2);
  REQUIRE (batch.getTickers() == std::vector<std::string>{ "AAA", "ZZZ" });
  REQUIRE (batch.contains ("ZZZ"));
  REQUIRE_FALSE (batch.hasBenchmark());
  REQUIRE_FALSE (batch.getAsOf().has_value());
  REQUIRE_THROWS_AS (batch.getInstrument ("MISSING"), std::out_of_range);

  instruments.push_back (makeInstrument ("AAA", createFlatSeries (5)));
  REQUIRE_THROWS_AS (InstrumentBatch (instruments), std::invalid_argument);

  REQUIRE (InstrumentBatch().isEmpty());
}
