// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include "ScannerConfiguration.h"
#include "screening/ScreeningTypes.h"

namespace swingscanner::screening
{
  // Reward is fixed at this multiple of risk.
  constexpr double kRewardRiskMultiple = 2.0;

  /**
   * @brief ATR based entry, stop and target for an instrument.
   *
   * entry = last close, stop = entry - ATR_STOP_MULTIPLIER * ATR,
   * target = entry + 2 * (entry - stop).
   */
  class TradeMetadataCalculator
  {
  public:
    explicit TradeMetadataCalculator(const ExecutionGateConfig& config);

    // Throws InsufficientHistoryException when ATR cannot be computed and
    // ComputeException when the ATR is not positive or the stop is not
    // strictly between zero and the entry.
    TradeMetadata calculate(const Instrument& instrument, const std::string& pattern) const;

    static const std::string& holdingPeriodFor(const std::string& pattern);

  private:
    ExecutionGateConfig mConfig;
  };

} // namespace swingscanner::screening
