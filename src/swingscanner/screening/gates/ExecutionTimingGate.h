// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ScannerConfiguration.h"
#include "screening/TradeMetadataCalculator.h"
#include "screening/gates/ScreeningGate.h"

namespace swingscanner::screening::gates
{
  /**
   * @brief Gate 4: intraday volume confirmation and risk/reward.
   *
   * Volume passes when the current session's volume is at least the 20-day
   * average prorated to the elapsed part of the session. Risk/reward passes
   * when an ATR stop is valid; the 2:1 target then holds by construction.
   */
  class ExecutionTimingGate : public PerInstrumentGate
  {
  public:
    ExecutionTimingGate(const ExecutionGateConfig& config, const SessionConfig& session);

    const std::string& getName() const override;

    // Minutes since session open, clamped to [0, MARKET_OPEN_MINUTES].
    // A full session when no as-of time is given or when the as-of time
    // falls on a day other than lastSession, whose bar is then complete.
    Num elapsedMinutes(const std::optional<boost::posix_time::ptime>& asOf,
		       const boost::gregorian::date& lastSession) const;

  protected:
    GateResult evaluate(const Instrument& instrument, const GateContext& ctx) const override;
    std::string getLogTag() const override;

  private:
    ExecutionGateConfig mConfig;
    SessionConfig mSession;
    TradeMetadataCalculator mCalculator;
  };

} // namespace swingscanner::screening::gates
