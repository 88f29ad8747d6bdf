// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "reporting/ScanReporter.h"
#include <iomanip>
#include "reporting/CsvFormat.h"
#include "watchlist/Watchlist.h"

namespace swingscanner::reporting
{
  using screening::CandidateStatus;
  using screening::CapTier;

  namespace
  {
    const std::string kRule(80, '=');
    const std::string kSeparator(80, '-');

    std::string truncate(const std::string& text, std::size_t width)
    {
      return text.size() <= width ? text : text.substr(0, width);
    }
  }

  ScanReporter::ScanReporter(unsigned int topPicksPerTier)
    : mTopPicksPerTier(topPicksPerTier)
  {}

  std::string ScanReporter::rationaleId(const std::string& ticker, CapTier tier, int year)
  {
    std::string base = ticker.substr(0, ticker.find('.'));
    return "RAT-" + base + "-" + screening::toString(tier) + "-" + std::to_string(year);
  }

  std::map<CapTier, std::vector<std::string>>
  ScanReporter::topPicks(const screening::ScanResult& result, const screening::InstrumentBatch& batch) const
  {
    std::map<CapTier, std::vector<std::string>> picks;

    for (const auto& candidate : result.candidates)
      {
	if (candidate.status != CandidateStatus::Buy)
	  continue;

	std::vector<std::string>& tierPicks = picks[batch.getInstrument(candidate.ticker).getEffectiveCapTier()];
	if (tierPicks.size() < mTopPicksPerTier)
	  tierPicks.push_back(candidate.ticker);
      }

    return picks;
  }

  void ScanReporter::writeSummary(std::ostream& os,
				  const screening::ScanResult& result,
				  const screening::InstrumentBatch& batch,
				  const boost::gregorian::date& scanDate) const
  {
    const screening::ScreeningSummary& summary = result.summary;

    os << "\n" << kRule << "\n";
    os << " CONSOLIDATED HEATMAP - SWING SCAN " << boost::gregorian::to_simple_string(scanDate) << "\n";
    os << kRule << "\n";
    os << "Total Stocks Scanned:   " << summary.getScannedCount() << "\n";
    os << "Passed G1 (Spread):     " << summary.getSpreadSurvivorCount() << "\n";
    os << "Passed G2 (Quality):    " << summary.getFundamentalSurvivorCount() << "\n";
    os << "Passed G2B (Inst.):     " << summary.getInstitutionalSurvivorCount() << "\n";
    os << "Passed G3 (Trend):      " << summary.getTrendConfirmedCount() << "\n";
    os << "Coiling Springs:        " << summary.getCoilingSpringCount() << "\n";
    os << "Total Candidates:       " << summary.getBuyCount() << "\n";
    os << kSeparator << "\n";

    std::map<CapTier, std::vector<std::string>> picks = topPicks(result, batch);
    if (picks.empty())
      os << "No candidates met all criteria.\n";
    else
      {
	os << "TOP PICKS BY CATEGORY (Rationale IDs)\n";
	for (CapTier tier : { CapTier::Large, CapTier::Mid, CapTier::Small })
	  {
	    auto it = picks.find(tier);
	    if (it == picks.end())
	      continue;

	    for (const auto& ticker : it->second)
	      {
		os << std::left << std::setw(8) << screening::toString(tier)
		   << " | Pick: " << std::setw(12) << ticker
		   << " | Rationale ID: " << rationaleId(ticker, tier, scanDate.year());

		auto meta = result.tradeMetadata.find(ticker);
		if (meta != result.tradeMetadata.end())
		  os << " | Entry " << formatDecimal(meta->second.entry)
		     << " Stop " << formatDecimal(meta->second.stop)
		     << " Target " << formatDecimal(meta->second.target)
		     << " | " << meta->second.holdingPeriod;
		os << std::right << "\n";
	      }
	  }
	os << kSeparator << "\n";
      }

    std::vector<watchlist::WatchlistEntry> springs;
    for (auto& entry : watchlist::buildWatchlistEntries(result, batch))
      if (entry.capTier == screening::toString(CapTier::Mid) || entry.capTier == screening::toString(CapTier::Small))
	springs.push_back(std::move(entry));

    if (!springs.empty())
      {
	os << "COILING SPRINGS - MID/SMALL CAPS (Daily Watchlist): " << springs.size() << "\n";
	os << kSeparator << "\n";
	os << std::left << std::setw(14) << "Ticker" << std::setw(7) << "Cap" << std::setw(17) << "Sector"
	   << std::right << std::setw(10) << "Close" << std::setw(8) << "Inst%" << "  Reason\n";

	for (const auto& entry : springs)
	  {
	    os << std::left << std::setw(14) << entry.ticker
	       << std::setw(7) << entry.capTier
	       << std::setw(17) << truncate(entry.sector, 15)
	       << std::right << std::setw(10) << formatDecimal(entry.close)
	       << std::setw(8) << (entry.institutionalPct ? formatDecimal(*entry.institutionalPct, 1) : std::string("-"))
	       << "  " << truncate(entry.reason, 60) << "\n";
	  }
      }

    os << kRule << "\n";
  }

} // namespace swingscanner::reporting
