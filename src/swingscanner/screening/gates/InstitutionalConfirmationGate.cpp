// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/InstitutionalConfirmationGate.h"
#include <iomanip>
#include <sstream>
#include <vector>
#include <boost/algorithm/string/join.hpp>

namespace swingscanner::screening::gates
{
  InstitutionalConfirmationGate::InstitutionalConfirmationGate(const InstitutionalThresholdTable& thresholds)
    : mThresholds(thresholds)
  {}

  const std::string& InstitutionalConfirmationGate::getName() const
  {
    return gate_names::INSTITUTIONAL;
  }

  std::string InstitutionalConfirmationGate::getLogTag() const
  {
    return "InstitutionalConfirmation";
  }

  GateResult InstitutionalConfirmationGate::evaluate(const Instrument& instrument, const GateContext&) const
  {
    const CapTier tier = instrument.getEffectiveCapTier();
    const InstitutionalThreshold& threshold = mThresholds.getThreshold(tier);
    const InstitutionalSnapshot& snapshot = instrument.getInstitutional();

    GateResult::MetricMap metrics{
      { "min_institutional_pct", threshold.minInstitutionalPct },
      { "min_free_float_pct", threshold.minFreeFloatPct }
    };
    GateResult::LabelMap labels{ { "cap_tier", toString(tier) } };

    std::string tierNote = toString(tier);
    if (!instrument.getCapTier())
      tierNote += " (cap tier unresolved, defaulted to SMALL)";

    std::vector<std::string> failures;

    if (!snapshot.institutionalOwnershipPct)
      failures.push_back("institutional ownership unavailable");
    else
      {
	metrics["institutional_pct"] = *snapshot.institutionalOwnershipPct;
	if (*snapshot.institutionalOwnershipPct < threshold.minInstitutionalPct)
	  {
	    std::ostringstream msg;
	    msg << std::fixed << std::setprecision(2) << "institutional ownership "
		<< *snapshot.institutionalOwnershipPct << "% < " << threshold.minInstitutionalPct << "%";
	    failures.push_back(msg.str());
	  }
      }

    if (!snapshot.freeFloatPct)
      failures.push_back("free float unavailable");
    else
      {
	metrics["free_float_pct"] = *snapshot.freeFloatPct;
	if (*snapshot.freeFloatPct < threshold.minFreeFloatPct)
	  {
	    std::ostringstream msg;
	    msg << std::fixed << std::setprecision(2) << "free float "
		<< *snapshot.freeFloatPct << "% < " << threshold.minFreeFloatPct << "%";
	    failures.push_back(msg.str());
	  }
      }

    if (failures.empty())
      return GateResult::Pass("institutional ownership and free float meet " + tierNote + " thresholds",
			      std::move(metrics), std::move(labels));

    return GateResult::HardFail(boost::algorithm::join(failures, "; ") + " [tier " + tierNote + "]",
				std::move(metrics), std::move(labels));
  }

} // namespace swingscanner::screening::gates
