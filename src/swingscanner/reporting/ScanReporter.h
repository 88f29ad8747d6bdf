// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "screening/InstrumentBatch.h"
#include "screening/ScreeningTypes.h"

namespace swingscanner::reporting
{
  /**
   * @brief Console summary of a scan.
   *
   * Prints stage survivor counts, up to topPicksPerTier BUY candidates per
   * cap tier with their rationale ids, and the MID/SMALL coiling springs.
   */
  class ScanReporter
  {
  public:
    explicit ScanReporter(unsigned int topPicksPerTier = 3);

    void writeSummary(std::ostream& os,
		      const screening::ScanResult& result,
		      const screening::InstrumentBatch& batch,
		      const boost::gregorian::date& scanDate) const;

    // BUY candidates grouped by effective cap tier, in candidate order.
    std::map<screening::CapTier, std::vector<std::string>>
    topPicks(const screening::ScanResult& result, const screening::InstrumentBatch& batch) const;

    // RAT-<ticker without exchange suffix>-<TIER>-<year>
    static std::string rationaleId(const std::string& ticker, screening::CapTier tier, int year);

  private:
    unsigned int mTopPicksPerTier;
  };

} // namespace swingscanner::reporting
