#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <map>
#include <string>
#include "screening/gates/FundamentalQualityGate.h"
#include "ScannerTestFixtures.h"

using namespace swingscanner;
using namespace swingscanner::screening;
using namespace swingscanner::screening::gates;
using Catch::Approx;

TEST_CASE ("F-score signals", "[FundamentalQualityGate]")
{
  FScoreBreakdown breakdown (FundamentalQualityGate::computeFScore (boundaryFundamentals()));

  REQUIRE (breakdown.score == 4);
  REQUIRE (breakdown.signals.size() == 9);

  std::map<std::string, bool> signals (breakdown.signals.begin(), breakdown.signals.end());
  REQUIRE (signals["roa_positive"]);
  REQUIRE (signals["cfo_positive"]);
  REQUIRE (signals["roa_improved"]);
  REQUIRE (signals["no_dilution"]);
  REQUIRE_FALSE (signals["cfo_exceeds_net_income"]);
  REQUIRE_FALSE (signals["leverage_declined"]);
  REQUIRE_FALSE (signals["current_ratio_improved"]);
  REQUIRE_FALSE (signals["gross_margin_improved"]);
  REQUIRE_FALSE (signals["asset_turnover_improved"]);
  REQUIRE (breakdown.unavailable.empty());
}

TEST_CASE ("Missing inputs fail their signals", "[FundamentalQualityGate]")
{
  FundamentalsSnapshot snapshot (boundaryFundamentals());
  snapshot.prior.sharesOutstanding.reset();
  snapshot.current.totalAssets = 0.0;

  FScoreBreakdown breakdown (FundamentalQualityGate::computeFScore (snapshot));

  // only cfo_positive survives; ratios over zero assets are unavailable
  REQUIRE (breakdown.score == 1);
  REQUIRE (std::find (breakdown.unavailable.begin(), breakdown.unavailable.end(), "no_dilution") !=
	   breakdown.unavailable.end());
  REQUIRE (std::find (breakdown.unavailable.begin(), breakdown.unavailable.end(), "roa_positive") !=
	   breakdown.unavailable.end());

  // zero assets is a compute failure, not a missing field
  REQUIRE (breakdown.missingFields == std::vector<std::string> (1, "prior_shares_outstanding"));

  FundamentalsSnapshot noCashFlow (boundaryFundamentals());
  noCashFlow.current.cashFlowFromOperations.reset();
  FScoreBreakdown cashFlowBreakdown (FundamentalQualityGate::computeFScore (noCashFlow));
  REQUIRE (cashFlowBreakdown.missingFields == std::vector<std::string> (1, "cfo"));

  FundamentalQualityGate gate ((FundamentalGateConfig()));
  REQUIRE (gate.evaluateFundamentals (snapshot).getReason().find ("missing fields: prior_shares_outstanding") !=
	   std::string::npos);

  REQUIRE (FundamentalQualityGate::computeFScore (FundamentalsSnapshot()).score == 0);
}

TEST_CASE ("Fundamental gate thresholds", "[FundamentalQualityGate]")
{
  FundamentalQualityGate gate ((FundamentalGateConfig()));

  SECTION ("All checks exactly at their limits pass")
    {
      GateResult result (gate.evaluateFundamentals (boundaryFundamentals()));
      REQUIRE (result.passed());
      REQUIRE (result.getMetric ("f_score") == 4.0);
      REQUIRE (result.getMetric ("cfo_pat") == Approx (0.5));
      REQUIRE (result.getMetric ("promoter_pledge") == Approx (5.0));
      REQUIRE (result.getMetric ("signal_roa_positive") == 1.0);
      REQUIRE (result.getMetric ("signal_leverage_declined") == 0.0);
    }

  SECTION ("F-score one below the minimum fails")
    {
      FundamentalsSnapshot snapshot (boundaryFundamentals());
      snapshot.current.sharesOutstanding = 101.0;

      GateResult result (gate.evaluateFundamentals (snapshot));
      REQUIRE_FALSE (result.passed());
      REQUIRE (result.getMetric ("f_score") == 3.0);
      REQUIRE (result.getReason().find ("F-score 3 < 4") != std::string::npos);
    }

  SECTION ("Low cash conversion fails")
    {
      FundamentalsSnapshot snapshot (boundaryFundamentals());
      snapshot.current.cashFlowFromOperations = 49.0;
      REQUIRE_FALSE (gate.evaluateFundamentals (snapshot).passed());
    }

  SECTION ("Non-positive PAT fails the cash conversion check")
    {
      FundamentalsSnapshot snapshot (boundaryFundamentals());
      snapshot.current.netIncome = -10.0;

      GateResult result (gate.evaluateFundamentals (snapshot));
      REQUIRE_FALSE (result.passed());
      REQUIRE_FALSE (result.hasMetric ("cfo_pat"));
    }

  SECTION ("Pledge above the maximum fails")
    {
      FundamentalsSnapshot snapshot (boundaryFundamentals());
      snapshot.promoterPledgePct = 5.01;
      REQUIRE_FALSE (gate.evaluateFundamentals (snapshot).passed());
    }

  SECTION ("Missing pledge fails")
    {
      FundamentalsSnapshot snapshot (boundaryFundamentals());
      snapshot.promoterPledgePct.reset();

      GateResult result (gate.evaluateFundamentals (snapshot));
      REQUIRE_FALSE (result.passed());
      REQUIRE (result.getReason().find ("promoter pledge unavailable") != std::string::npos);
    }
}

TEST_CASE ("Fundamental gate over a batch", "[FundamentalQualityGate]")
{
  FundamentalsSnapshot diluted (boundaryFundamentals());
  diluted.current.sharesOutstanding = 101.0;

  std::vector<Instrument> instruments;
  instruments.push_back (makeInstrument ("GOOD", createFlatSeries (5), "Tech", CapTier::Large, boundaryFundamentals()));
  instruments.push_back (makeInstrument ("DILUTED", createFlatSeries (5), "Tech", CapTier::Large, diluted));

  GateStageResult stage (runGate (FundamentalQualityGate (FundamentalGateConfig()), InstrumentBatch (instruments)));

  REQUIRE (stage.survivors == std::vector<std::string>{ "GOOD" });
  REQUIRE (resultFor (stage, "DILUTED").getOutcome() == GateOutcome::HardFail);
}
