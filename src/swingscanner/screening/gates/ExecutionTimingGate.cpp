// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/ExecutionTimingGate.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeriesIndicators.h"
#include "screening/gates/TechnicalTrendGate.h"

namespace swingscanner::screening::gates
{
  namespace
  {
    // Absorbs rounding in (target - entry) / risk.
    constexpr double kRatioTolerance = 1e-9;
  }

  ExecutionTimingGate::ExecutionTimingGate(const ExecutionGateConfig& config, const SessionConfig& session)
    : mConfig(config),
      mSession(session),
      mCalculator(config)
  {}

  const std::string& ExecutionTimingGate::getName() const
  {
    return gate_names::EXECUTION;
  }

  std::string ExecutionTimingGate::getLogTag() const
  {
    return "ExecutionTiming";
  }

  Num ExecutionTimingGate::elapsedMinutes(const std::optional<boost::posix_time::ptime>& asOf,
					   const boost::gregorian::date& lastSession) const
  {
    const Num sessionMinutes = static_cast<Num>(mConfig.marketOpenMinutes);
    if (!asOf || asOf->date() != lastSession)
      return sessionMinutes;

    boost::posix_time::time_duration sinceOpen = asOf->time_of_day() - mSession.sessionOpen;
    Num minutes = static_cast<Num>(sinceOpen.total_seconds()) / 60.0;
    return std::clamp(minutes, 0.0, sessionMinutes);
  }

  GateResult ExecutionTimingGate::evaluate(const Instrument& instrument, const GateContext& ctx) const
  {
    const OHLCSeries& series = instrument.getSeries();
    const unsigned long required = static_cast<unsigned long>(mConfig.volAvgDays) + 1;
    if (series.getNumEntries() < required)
      throw InsufficientHistoryException(std::to_string(series.getNumEntries()) + " sessions available, " +
					 std::to_string(required) + " required for volume average");

    // Volume
    const unsigned long n = series.getNumEntries();
    std::vector<Num> priorVolumes;
    priorVolumes.reserve(mConfig.volAvgDays);
    for (unsigned long i = n - 1 - mConfig.volAvgDays; i < n - 1; ++i)
      priorVolumes.push_back(series.getEntry(i).getVolumeValue());

    const Num currentVolume = series.getLastEntry().getVolumeValue();
    const Num averageVolume = swing_timeseries::Mean(priorVolumes);
    const boost::gregorian::date& lastSession = series.getLastEntry().getDateValue();
    const std::optional<boost::posix_time::ptime>& asOf = ctx.batch.getAsOf();
    const bool completedSession = asOf && asOf->date() != lastSession;
    const Num elapsed = elapsedMinutes(asOf, lastSession);
    const Num expectedVolume = averageVolume * (elapsed / static_cast<Num>(mConfig.marketOpenMinutes)) *
      mConfig.volProrateFactor;

    GateResult::MetricMap metrics{
      { "current_volume", currentVolume },
      { "average_volume", averageVolume },
      { "expected_volume", expectedVolume },
      { "elapsed_minutes", elapsed }
    };

    std::string pattern = pattern_names::STAGE2;
    const std::string& ticker = instrument.getTicker();
    if (ctx.trail.contains(ticker, gate_names::TECHNICALS))
      {
	const GateResult& trend = ctx.trail.getResult(ticker, gate_names::TECHNICALS);
	if (trend.hasLabel("pattern"))
	  pattern = trend.getLabel("pattern");
      }
    GateResult::LabelMap labels{ { "pattern", pattern } };

    std::ostringstream reason;
    reason << std::fixed << std::setprecision(2);

    const bool volumeOk = currentVolume >= expectedVolume;
    if (!volumeOk)
      {
	reason << "volume " << currentVolume << " below expected " << expectedVolume
	       << " at " << elapsed << " minutes";
	if (completedSession)
	  reason << " (last bar " << boost::gregorian::to_simple_string(lastSession) << " is a completed session)";
      }

    // Risk / reward
    TradeMetadata trade;
    try
      {
	trade = mCalculator.calculate(instrument, pattern);
      }
    catch (const ComputeException& e)
      {
	if (!volumeOk)
	  reason << "; ";
	reason << "risk/reward rejected: " << e.what();
	return GateResult::HardFail(reason.str(), std::move(metrics), std::move(labels));
      }

    metrics["atr"] = trade.atr;
    metrics["entry"] = trade.entry;
    metrics["stop"] = trade.stop;
    metrics["target"] = trade.target;
    metrics["rr_ratio"] = trade.riskRewardRatio;
    labels["holding_period"] = trade.holdingPeriod;

    const bool rrOk = trade.riskRewardRatio + kRatioTolerance >= mConfig.minRRRatio;
    if (!rrOk)
      reason << (volumeOk ? "" : "; ") << "reward/risk " << trade.riskRewardRatio << " < " << mConfig.minRRRatio;

    if (volumeOk && rrOk)
      {
	reason << "volume " << currentVolume << " >= expected " << expectedVolume;
	if (completedSession)
	  reason << " (last bar " << boost::gregorian::to_simple_string(lastSession) << " is a completed session)";
	reason << "; entry " << trade.entry << " stop " << trade.stop << " target " << trade.target
	       << " (" << trade.riskRewardLabel << ")";
	return GateResult::Pass(reason.str(), std::move(metrics), std::move(labels));
      }

    return GateResult::HardFail(reason.str(), std::move(metrics), std::move(labels));
  }

} // namespace swingscanner::screening::gates
