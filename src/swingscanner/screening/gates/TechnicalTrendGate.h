// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include <vector>
#include "ScannerConfiguration.h"
#include "screening/gates/ScreeningGate.h"

namespace swingscanner::screening::gates
{
  // Values of the "pattern" label recorded by Gate 3.
  namespace pattern_names
  {
    inline const std::string VCP = "VCP";
    inline const std::string STAGE2 = "Stage2";
    inline const std::string NONE = "None";
  }

  /**
   * @brief Gate 3: trend template (hard) and trend strength (soft).
   *
   * The template requires close > MA50, MA150, MA200, MA50 > MA150 > MA200
   * and a rising MA200. An instrument that holds the template but lacks ADX
   * or relative strength momentum is a soft failure (COILING_SPRING).
   */
  class TechnicalTrendGate : public PerInstrumentGate
  {
  public:
    explicit TechnicalTrendGate(const TechnicalGateConfig& config);

    const std::string& getName() const override;

    // Depth (max high - min low) / max high of each of the last numSegments
    // consecutive segments, oldest first. Empty if the series is too short.
    static std::vector<Num> segmentDepths(const OHLCSeries& series,
					  unsigned int segmentSessions,
					  unsigned int numSegments);

    // "<name> <value> < <threshold>", printed with as many decimals as it
    // takes for value and threshold to read differently.
    static std::string describeShortfall(const std::string& name, Num value, Num threshold);

    // Volatility contraction: three segments with strictly decreasing depth,
    // the last no deeper than maxFinalDepth.
    static bool detectVcp(const OHLCSeries& series,
			  unsigned int segmentSessions,
			  Num maxFinalDepth);

  protected:
    GateResult evaluate(const Instrument& instrument, const GateContext& ctx) const override;
    std::string getLogTag() const override;

  private:
    TechnicalGateConfig mConfig;
  };

} // namespace swingscanner::screening::gates
