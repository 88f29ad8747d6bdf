// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/TradeMetadataCalculator.h"
#include <iomanip>
#include <sstream>
#include "TimeSeriesIndicators.h"
#include "screening/gates/TechnicalTrendGate.h"

namespace swingscanner::screening
{
  TradeMetadataCalculator::TradeMetadataCalculator(const ExecutionGateConfig& config)
    : mConfig(config)
  {}

  const std::string& TradeMetadataCalculator::holdingPeriodFor(const std::string& pattern)
  {
    if (pattern == gates::pattern_names::VCP)
      return HOLDING_PERIOD_SWING;
    return HOLDING_PERIOD_POSITIONAL;
  }

  TradeMetadata TradeMetadataCalculator::calculate(const Instrument& instrument, const std::string& pattern) const
  {
    const OHLCSeries& series = instrument.getSeries();
    if (series.getNumEntries() < mConfig.atrPeriod)
      throw InsufficientHistoryException(std::to_string(series.getNumEntries()) + " sessions available, " +
					 std::to_string(mConfig.atrPeriod) + " required for ATR");

    TradeMetadata metadata;
    metadata.atr = swing_timeseries::AverageTrueRangeSeries(series, mConfig.atrPeriod).getLastValue();
    metadata.entry = series.getLastEntry().getCloseValue();

    if (!(metadata.atr > 0))
      throw ComputeException("ATR is not positive");

    metadata.stop = metadata.entry - mConfig.atrStopMultiplier * metadata.atr;
    if (metadata.stop >= metadata.entry)
      throw ComputeException("stop is not below entry");
    if (!(metadata.stop > 0))
      {
	std::ostringstream msg;
	msg << std::fixed << std::setprecision(2) << "stop distance " << (metadata.entry - metadata.stop)
	    << " exceeds entry price " << metadata.entry;
	throw ComputeException(msg.str());
      }

    const Num risk = metadata.entry - metadata.stop;
    metadata.target = metadata.entry + kRewardRiskMultiple * risk;
    metadata.riskRewardRatio = (metadata.target - metadata.entry) / risk;
    metadata.riskRewardLabel = "1:2";
    metadata.holdingPeriod = holdingPeriodFor(pattern);

    return metadata;
  }

} // namespace swingscanner::screening
