// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/FundamentalQualityGate.h"
#include <algorithm>
#include <functional>
#include <iomanip>
#include <optional>
#include <sstream>
#include <boost/algorithm/string/join.hpp>

namespace swingscanner::screening::gates
{
  namespace
  {
    Num require(const std::optional<Num>& value, const std::string& fieldName)
    {
      if (!value)
	throw MissingFieldException(fieldName);
      return *value;
    }

    Num ratio(const std::optional<Num>& numerator,
	      const std::optional<Num>& denominator,
	      const std::string& numeratorName,
	      const std::string& denominatorName)
    {
      Num n = require(numerator, numeratorName);
      Num d = require(denominator, denominatorName);
      if (d == 0)
	throw ComputeException("division by zero: " + denominatorName + " is zero");
      return n / d;
    }

    using SignalTest = std::function<bool(const FundamentalsPeriod&, const FundamentalsPeriod&)>;

    const std::vector<std::pair<std::string, SignalTest>>& signalTests()
    {
      static const std::vector<std::pair<std::string, SignalTest>> tests = {
	{ "roa_positive", [](const FundamentalsPeriod& cur, const FundamentalsPeriod&) {
	    return ratio(cur.netIncome, cur.totalAssets, "net_income", "total_assets") > 0;
	  } },
	{ "cfo_positive", [](const FundamentalsPeriod& cur, const FundamentalsPeriod&) {
	    return require(cur.cashFlowFromOperations, "cfo") > 0;
	  } },
	{ "roa_improved", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return ratio(cur.netIncome, cur.totalAssets, "net_income", "total_assets") >
	      ratio(prior.netIncome, prior.totalAssets, "prior_net_income", "prior_total_assets");
	  } },
	{ "cfo_exceeds_net_income", [](const FundamentalsPeriod& cur, const FundamentalsPeriod&) {
	    return require(cur.cashFlowFromOperations, "cfo") > require(cur.netIncome, "net_income");
	  } },
	{ "leverage_declined", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return ratio(cur.longTermDebt, cur.totalAssets, "long_term_debt", "total_assets") <
	      ratio(prior.longTermDebt, prior.totalAssets, "prior_long_term_debt", "prior_total_assets");
	  } },
	{ "current_ratio_improved", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return ratio(cur.currentAssets, cur.currentLiabilities, "current_assets", "current_liabilities") >
	      ratio(prior.currentAssets, prior.currentLiabilities, "prior_current_assets", "prior_current_liabilities");
	  } },
	{ "no_dilution", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return require(cur.sharesOutstanding, "shares_outstanding") <=
	      require(prior.sharesOutstanding, "prior_shares_outstanding");
	  } },
	{ "gross_margin_improved", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return ratio(cur.grossProfit, cur.revenue, "gross_profit", "revenue") >
	      ratio(prior.grossProfit, prior.revenue, "prior_gross_profit", "prior_revenue");
	  } },
	{ "asset_turnover_improved", [](const FundamentalsPeriod& cur, const FundamentalsPeriod& prior) {
	    return ratio(cur.revenue, cur.totalAssets, "revenue", "total_assets") >
	      ratio(prior.revenue, prior.totalAssets, "prior_revenue", "prior_total_assets");
	  } }
      };

      return tests;
    }
  }

  FundamentalQualityGate::FundamentalQualityGate(const FundamentalGateConfig& config)
    : mConfig(config)
  {}

  const std::string& FundamentalQualityGate::getName() const
  {
    return gate_names::FUNDAMENTALS;
  }

  std::string FundamentalQualityGate::getLogTag() const
  {
    return "FundamentalQuality";
  }

  FScoreBreakdown FundamentalQualityGate::computeFScore(const FundamentalsSnapshot& fundamentals)
  {
    FScoreBreakdown breakdown;

    for (const auto& test : signalTests())
      {
	bool satisfied = false;
	try
	  {
	    satisfied = test.second(fundamentals.current, fundamentals.prior);
	  }
	catch (const MissingFieldException& e)
	  {
	    breakdown.unavailable.push_back(test.first);
	    if (std::find(breakdown.missingFields.begin(), breakdown.missingFields.end(), e.getFieldName()) ==
		breakdown.missingFields.end())
	      breakdown.missingFields.push_back(e.getFieldName());
	  }
	catch (const ComputeException&)
	  {
	    breakdown.unavailable.push_back(test.first);
	  }

	if (satisfied)
	  ++breakdown.score;
	breakdown.signals.emplace_back(test.first, satisfied);
      }

    return breakdown;
  }

  GateResult FundamentalQualityGate::evaluateFundamentals(const FundamentalsSnapshot& fundamentals) const
  {
    FScoreBreakdown breakdown = computeFScore(fundamentals);

    GateResult::MetricMap metrics;
    metrics["f_score"] = breakdown.score;
    for (const auto& signal : breakdown.signals)
      metrics["signal_" + signal.first] = signal.second ? 1.0 : 0.0;

    std::vector<std::string> failures;
    std::ostringstream detail;
    detail << std::fixed << std::setprecision(2);

    if (breakdown.score < mConfig.minFScore)
      failures.push_back("F-score " + std::to_string(breakdown.score) + " < " + std::to_string(mConfig.minFScore));

    // CFO / PAT
    const FundamentalsPeriod& current = fundamentals.current;
    if (!current.cashFlowFromOperations || !current.netIncome)
      failures.push_back("CFO/PAT unavailable (missing " +
			 std::string(!current.cashFlowFromOperations ? "cfo" : "net_income") + ")");
    else if (!(*current.netIncome > 0))
      failures.push_back("CFO/PAT undefined for non-positive PAT");
    else
      {
	Num cfoPat = *current.cashFlowFromOperations / *current.netIncome;
	metrics["cfo_pat"] = cfoPat;
	if (cfoPat < mConfig.minCfoPat)
	  {
	    std::ostringstream msg;
	    msg << std::fixed << std::setprecision(2) << "CFO/PAT " << cfoPat << " < " << mConfig.minCfoPat;
	    failures.push_back(msg.str());
	  }
      }

    // Promoter pledge
    if (!fundamentals.promoterPledgePct)
      failures.push_back("promoter pledge unavailable");
    else
      {
	metrics["promoter_pledge"] = *fundamentals.promoterPledgePct;
	if (*fundamentals.promoterPledgePct > mConfig.maxPromoterPledge)
	  {
	    std::ostringstream msg;
	    msg << std::fixed << std::setprecision(2) << "promoter pledge " << *fundamentals.promoterPledgePct
		<< "% > " << mConfig.maxPromoterPledge << "%";
	    failures.push_back(msg.str());
	  }
      }

    if (!breakdown.unavailable.empty())
      {
	detail << " [unavailable signals: " << boost::algorithm::join(breakdown.unavailable, ", ");
	if (!breakdown.missingFields.empty())
	  detail << "; missing fields: " << boost::algorithm::join(breakdown.missingFields, ", ");
	detail << "]";
      }

    if (failures.empty())
      return GateResult::Pass("F-score " + std::to_string(breakdown.score) + "/9, CFO/PAT and pledge within limits" +
			      detail.str(), std::move(metrics));

    return GateResult::HardFail(boost::algorithm::join(failures, "; ") + detail.str(), std::move(metrics));
  }

  GateResult FundamentalQualityGate::evaluate(const Instrument& instrument, const GateContext&) const
  {
    return evaluateFundamentals(instrument.getFundamentals());
  }

} // namespace swingscanner::screening::gates
