// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "screening/ScreeningTypes.h"

namespace swingscanner::reporting
{
  class AuditTrailWriterException : public std::runtime_error
  {
  public:
    explicit AuditTrailWriterException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  /**
   * @brief Persists the rationale trail and candidate list as CSV.
   *
   * Trail:       Ticker,Gate,Passed,Outcome,Reason,Metrics,Labels
   *              (metrics and labels as name=value;name=value)
   * Candidates:  Ticker,Status,Entry,Stop,Target,HoldingPeriod,RiskReward
   */
  class AuditTrailWriter
  {
  public:
    static void writeTrail(std::ostream& out, const screening::RationaleTrail& trail);
    static void writeCandidates(std::ostream& out, const std::vector<screening::Candidate>& candidates);

    // Throw AuditTrailWriterException when the file cannot be written.
    static void writeTrailFile(const std::string& fileName, const screening::RationaleTrail& trail);
    static void writeCandidatesFile(const std::string& fileName,
				    const std::vector<screening::Candidate>& candidates);
  };

} // namespace swingscanner::reporting
