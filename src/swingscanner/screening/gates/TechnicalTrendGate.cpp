// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/TechnicalTrendGate.h"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <boost/algorithm/string/join.hpp>
#include "TimeSeriesIndicators.h"

namespace swingscanner::screening::gates
{
  using swing_timeseries::NumericTimeSeries;

  namespace
  {
    constexpr unsigned int kVcpSegments = 3;

    std::string formatValue(Num value, int precision = 2)
    {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(precision) << value;
      return oss.str();
    }
  }

  std::string TechnicalTrendGate::describeShortfall(const std::string& name, Num value, Num threshold)
  {
    int precision = 2;
    while (precision < std::numeric_limits<Num>::max_digits10 &&
	   std::stod(formatValue(value, precision)) == std::stod(formatValue(threshold, precision)))
      ++precision;

    return name + " " + formatValue(value, precision) + " < " + formatValue(threshold, precision);
  }

  TechnicalTrendGate::TechnicalTrendGate(const TechnicalGateConfig& config)
    : mConfig(config)
  {}

  const std::string& TechnicalTrendGate::getName() const
  {
    return gate_names::TECHNICALS;
  }

  std::string TechnicalTrendGate::getLogTag() const
  {
    return "TechnicalTrend";
  }

  std::vector<Num> TechnicalTrendGate::segmentDepths(const OHLCSeries& series,
						     unsigned int segmentSessions,
						     unsigned int numSegments)
  {
    std::vector<Num> depths;
    const unsigned long required = static_cast<unsigned long>(segmentSessions) * numSegments;
    if (segmentSessions == 0 || series.getNumEntries() < required)
      return depths;

    const unsigned long start = series.getNumEntries() - required;
    for (unsigned int segment = 0; segment < numSegments; ++segment)
      {
	Num maxHigh = 0;
	Num minLow = 0;
	for (unsigned int i = 0; i < segmentSessions; ++i)
	  {
	    const OHLCEntry& entry = series.getEntry(start + segment * segmentSessions + i);
	    if (i == 0)
	      {
		maxHigh = entry.getHighValue();
		minLow = entry.getLowValue();
	      }
	    else
	      {
		maxHigh = std::max(maxHigh, entry.getHighValue());
		minLow = std::min(minLow, entry.getLowValue());
	      }
	  }

	if (!(maxHigh > 0))
	  throw ComputeException("segmentDepths: non-positive high in segment");
	depths.push_back((maxHigh - minLow) / maxHigh);
      }

    return depths;
  }

  bool TechnicalTrendGate::detectVcp(const OHLCSeries& series,
				     unsigned int segmentSessions,
				     Num maxFinalDepth)
  {
    std::vector<Num> depths = segmentDepths(series, segmentSessions, kVcpSegments);
    if (depths.size() != kVcpSegments)
      return false;

    return depths[0] > depths[1] && depths[1] > depths[2] && depths[2] <= maxFinalDepth;
  }

  GateResult TechnicalTrendGate::evaluate(const Instrument& instrument, const GateContext& ctx) const
  {
    const OHLCSeries& series = instrument.getSeries();
    const unsigned long required = static_cast<unsigned long>(mConfig.maLong) + mConfig.maLongTrendSessions;

    if (series.getNumEntries() < required)
      throw InsufficientHistoryException(std::to_string(series.getNumEntries()) + " sessions available, " +
					 std::to_string(required) + " required for trend template");

    NumericTimeSeries<Num> closes(series.CloseTimeSeries());
    NumericTimeSeries<Num> maLongSeries(swing_timeseries::SmaSeries(closes, mConfig.maLong));

    const Num close = closes.getLastValue();
    const Num maShort = swing_timeseries::SmaSeries(closes, mConfig.maShort).getLastValue();
    const Num maMid = swing_timeseries::SmaSeries(closes, mConfig.maMid).getLastValue();
    const Num maLong = maLongSeries.getLastValue();
    const Num maLongPrior = maLongSeries.getValue(maLongSeries.getNumEntries() - 1 - mConfig.maLongTrendSessions);

    GateResult::MetricMap metrics{
      { "close", close },
      { "ma_short", maShort },
      { "ma_mid", maMid },
      { "ma_long", maLong },
      { "ma_long_prior", maLongPrior }
    };

    // Trend template
    std::vector<std::string> templateFailures;
    if (!(close > maShort && close > maMid && close > maLong))
      templateFailures.push_back("close " + formatValue(close) + " not above all moving averages");
    if (!(maShort > maMid && maMid > maLong))
      templateFailures.push_back("moving averages not stacked (" + formatValue(maShort) + " / " +
				 formatValue(maMid) + " / " + formatValue(maLong) + ")");
    if (!(maLong > maLongPrior))
      templateFailures.push_back("long moving average not rising (" + formatValue(maLong) + " vs " +
				 formatValue(maLongPrior) + ")");

    if (!templateFailures.empty())
      return GateResult::HardFail("trend template failed: " + boost::algorithm::join(templateFailures, "; "),
				  std::move(metrics), { { "pattern", pattern_names::NONE } });

    const std::string pattern = detectVcp(series, mConfig.vcpSegmentSessions, mConfig.vcpMaxFinalDepth) ?
      pattern_names::VCP : pattern_names::STAGE2;
    GateResult::LabelMap labels{ { "pattern", pattern } };

    std::vector<Num> depths = segmentDepths(series, mConfig.vcpSegmentSessions, kVcpSegments);
    for (std::size_t i = 0; i < depths.size(); ++i)
      metrics["segment_depth_" + std::to_string(i + 1)] = depths[i];

    // Trend strength
    const Num adx = swing_timeseries::AdxSeries(series, mConfig.adxPeriod).getLastValue();
    metrics["adx"] = adx;

    if (!ctx.batch.hasBenchmark())
      return GateResult::HardFail("insufficient history: no benchmark series for relative strength",
				  std::move(metrics), std::move(labels));

    Num mrsSlope = 0;
    try
      {
	NumericTimeSeries<Num> mrs(swing_timeseries::MansfieldRelativeStrengthSeries(series,
										      *ctx.batch.getBenchmark(),
										      mConfig.rsLookbackWeeks));
	mrsSlope = swing_timeseries::TrailingSlope(mrs, mConfig.rsSlopeWeeks);
	metrics["mrs"] = mrs.getLastValue();
      }
    catch (const swing_timeseries::InsufficientDataException& e)
      {
	return GateResult::HardFail(std::string("insufficient history: relative strength needs more weekly overlap with benchmark (") +
				    e.what() + ")",
				    std::move(metrics), std::move(labels));
      }
    metrics["mrs_slope"] = mrsSlope;

    std::vector<std::string> weak;
    if (adx < mConfig.minAdx)
      weak.push_back(describeShortfall("ADX", adx, mConfig.minAdx));
    if (mrsSlope < mConfig.minMansfieldSlope)
      weak.push_back(describeShortfall("RS Slope", mrsSlope, mConfig.minMansfieldSlope));

    if (!weak.empty())
      return GateResult::SoftFail("trend template holds, strength lacking: " + boost::algorithm::join(weak, "; "),
				  std::move(metrics), std::move(labels));

    return GateResult::Pass("trend template holds with ADX " + formatValue(adx) + " and RS Slope " +
			    formatValue(mrsSlope) + " (" + pattern + ")",
			    std::move(metrics), std::move(labels));
  }

} // namespace swingscanner::screening::gates
