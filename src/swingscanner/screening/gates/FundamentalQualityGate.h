// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "ScannerConfiguration.h"
#include "screening/gates/ScreeningGate.h"

namespace swingscanner::screening::gates
{
  /**
   * @brief Piotroski-style breakdown: nine named binary signals.
   *
   * A signal whose inputs are missing (or whose ratio has a zero
   * denominator) counts as failed and is listed in unavailable. The
   * absent input fields are collected, once each, in missingFields.
   */
  struct FScoreBreakdown
  {
    unsigned int score{0};
    std::vector<std::pair<std::string, bool>> signals;
    std::vector<std::string> unavailable;
    std::vector<std::string> missingFields;
  };

  /**
   * @brief Gate 2: accounting health and governance.
   *
   * Pass iff F-score >= MIN_F_SCORE, CFO / PAT >= MIN_CFO_PAT (PAT must be
   * positive) and promoter pledge <= MAX_PROMOTER_PLEDGE. Boundaries are
   * inclusive; missing inputs fail the check they feed.
   */
  class FundamentalQualityGate : public PerInstrumentGate
  {
  public:
    explicit FundamentalQualityGate(const FundamentalGateConfig& config);

    const std::string& getName() const override;

    static FScoreBreakdown computeFScore(const FundamentalsSnapshot& fundamentals);

    GateResult evaluateFundamentals(const FundamentalsSnapshot& fundamentals) const;

  protected:
    GateResult evaluate(const Instrument& instrument, const GateContext& ctx) const override;
    std::string getLogTag() const override;

  private:
    FundamentalGateConfig mConfig;
  };

} // namespace swingscanner::screening::gates
