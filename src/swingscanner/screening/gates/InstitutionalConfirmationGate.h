// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <string>
#include "ScannerConfiguration.h"
#include "screening/gates/ScreeningGate.h"

namespace swingscanner::screening::gates
{
  /**
   * @brief Gate 2B: institutional ownership and free float by cap tier.
   *
   * Pass iff both percentages meet the thresholds of the instrument's tier
   * (inclusive). Instruments without a resolved tier are held to the SMALL
   * thresholds.
   */
  class InstitutionalConfirmationGate : public PerInstrumentGate
  {
  public:
    explicit InstitutionalConfirmationGate(const InstitutionalThresholdTable& thresholds);

    const std::string& getName() const override;

  protected:
    GateResult evaluate(const Instrument& instrument, const GateContext& ctx) const override;
    std::string getLogTag() const override;

  private:
    InstitutionalThresholdTable mThresholds;
  };

} // namespace swingscanner::screening::gates
