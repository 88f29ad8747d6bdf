// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/ScreeningTypes.h"
#include <stdexcept>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace swingscanner::screening
{
  std::string toString(CapTier tier)
  {
    switch (tier)
      {
      case CapTier::Large:
	return "LARGE";
      case CapTier::Mid:
	return "MID";
      case CapTier::Small:
	return "SMALL";
      }

    throw std::invalid_argument("toString: unknown CapTier value");
  }

  std::optional<CapTier> parseCapTier(const std::string& text)
  {
    std::string normalized = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(text));

    if (boost::algorithm::ends_with(normalized, "CAP"))
      normalized = boost::algorithm::trim_copy(normalized.substr(0, normalized.size() - 3));

    if (normalized == "LARGE")
      return CapTier::Large;
    if (normalized == "MID")
      return CapTier::Mid;
    if (normalized == "SMALL")
      return CapTier::Small;

    return std::nullopt;
  }

  Instrument::Instrument(const std::string& ticker,
			 OHLCSeries series,
			 const std::string& sector,
			 std::optional<CapTier> capTier,
			 const FundamentalsSnapshot& fundamentals,
			 const InstitutionalSnapshot& institutional)
    : mTicker(ticker),
      mSeries(std::move(series)),
      mSector(sector),
      mCapTier(capTier),
      mFundamentals(fundamentals),
      mInstitutional(institutional)
  {
    if (mTicker.empty())
      throw std::invalid_argument("Instrument: ticker must not be empty");
  }

  bool Instrument::hasKnownSector() const
  {
    std::string trimmed = boost::algorithm::trim_copy(mSector);
    return !trimmed.empty() && !boost::algorithm::iequals(trimmed, "Unknown");
  }

  std::string toString(GateOutcome outcome)
  {
    switch (outcome)
      {
      case GateOutcome::Pass:
	return "Pass";
      case GateOutcome::SoftFail:
	return "SoftFail";
      case GateOutcome::HardFail:
	return "HardFail";
      }

    throw std::invalid_argument("toString: unknown GateOutcome value");
  }

  GateResult::GateResult(GateOutcome outcome,
			 const std::string& reason,
			 MetricMap metrics,
			 LabelMap labels)
    : mOutcome(outcome),
      mReason(reason),
      mMetrics(std::move(metrics)),
      mLabels(std::move(labels))
  {
    if (mReason.empty())
      throw std::invalid_argument("GateResult: reason must be populated");
  }

  GateResult GateResult::Pass(const std::string& reason, MetricMap metrics, LabelMap labels)
  {
    return GateResult(GateOutcome::Pass, reason, std::move(metrics), std::move(labels));
  }

  GateResult GateResult::SoftFail(const std::string& reason, MetricMap metrics, LabelMap labels)
  {
    return GateResult(GateOutcome::SoftFail, reason, std::move(metrics), std::move(labels));
  }

  GateResult GateResult::HardFail(const std::string& reason, MetricMap metrics, LabelMap labels)
  {
    return GateResult(GateOutcome::HardFail, reason, std::move(metrics), std::move(labels));
  }

  bool GateResult::hasMetric(const std::string& name) const
  {
    return mMetrics.find(name) != mMetrics.end();
  }

  double GateResult::getMetric(const std::string& name) const
  {
    auto it = mMetrics.find(name);
    if (it == mMetrics.end())
      throw std::out_of_range("GateResult::getMetric: no metric named " + name);
    return it->second;
  }

  bool GateResult::hasLabel(const std::string& name) const
  {
    return mLabels.find(name) != mLabels.end();
  }

  const std::string& GateResult::getLabel(const std::string& name) const
  {
    auto it = mLabels.find(name);
    if (it == mLabels.end())
      throw std::out_of_range("GateResult::getLabel: no label named " + name);
    return it->second;
  }

  void RationaleTrail::record(const std::string& ticker,
			      const std::string& gateName,
			      const GateResult& result)
  {
    GateResults& gates = mEntries[ticker];
    if (!gates.emplace(gateName, result).second)
      throw std::logic_error("RationaleTrail::record: " + ticker + " already has a result for " + gateName);
  }

  bool RationaleTrail::contains(const std::string& ticker) const
  {
    return mEntries.find(ticker) != mEntries.end();
  }

  bool RationaleTrail::contains(const std::string& ticker, const std::string& gateName) const
  {
    auto it = mEntries.find(ticker);
    return it != mEntries.end() && it->second.find(gateName) != it->second.end();
  }

  const GateResult& RationaleTrail::getResult(const std::string& ticker,
					      const std::string& gateName) const
  {
    const GateResults& gates = getResults(ticker);
    auto it = gates.find(gateName);
    if (it == gates.end())
      throw std::out_of_range("RationaleTrail::getResult: no " + gateName + " result for " + ticker);
    return it->second;
  }

  const RationaleTrail::GateResults& RationaleTrail::getResults(const std::string& ticker) const
  {
    auto it = mEntries.find(ticker);
    if (it == mEntries.end())
      throw std::out_of_range("RationaleTrail::getResults: no results for " + ticker);
    return it->second;
  }

  std::string toString(CandidateStatus status)
  {
    switch (status)
      {
      case CandidateStatus::Buy:
	return "BUY";
      case CandidateStatus::CoilingSpring:
	return "COILING_SPRING";
      }

    throw std::invalid_argument("toString: unknown CandidateStatus value");
  }

  ScreeningSummary::ScreeningSummary()
    : mScannedCount(0),
      mSpreadSurvivorCount(0),
      mFundamentalSurvivorCount(0),
      mInstitutionalSurvivorCount(0),
      mTrendConfirmedCount(0),
      mCoilingSpringCount(0),
      mBuyCount(0)
  {}

} // namespace swingscanner::screening
