// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "screening/InstrumentBatch.h"
#include "screening/ScreeningTypes.h"

namespace swingscanner::watchlist
{
  using screening::Num;

  class WatchlistException : public std::runtime_error
  {
  public:
    explicit WatchlistException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  /**
   * @brief One COILING_SPRING instrument as written to a watchlist file.
   */
  struct WatchlistEntry
  {
    std::string ticker;
    std::string sector;
    std::string capTier;
    Num close{0};
    std::optional<Num> institutionalPct;
    std::string reason;
    // Number of daily watchlists the ticker appeared on (digest only).
    unsigned int daysOnWatchlist{1};
  };

  // Entries for the COILING_SPRING candidates of a scan, in candidate order.
  // The reason is the Gate 3 soft failure reason.
  std::vector<WatchlistEntry> buildWatchlistEntries(const screening::ScanResult& result,
						    const screening::InstrumentBatch& batch);

  /**
   * @brief Writes and reads watchlist_daily_YYYYMMDD.csv files.
   *
   * Columns: Ticker,Sector,CapTier,Close,InstitutionalPct,Reason
   */
  class DailyWatchlistWriter
  {
  public:
    explicit DailyWatchlistWriter(const std::string& directory);

    // Returns the path written. Throws WatchlistException on I/O failure.
    std::string write(const std::vector<WatchlistEntry>& entries,
		      const boost::gregorian::date& scanDate) const;

    static std::string fileNameFor(const boost::gregorian::date& scanDate);

    // Date encoded in a daily watchlist file name, if it is one.
    static std::optional<boost::gregorian::date> dateFromFileName(const std::string& fileName);

    static std::vector<WatchlistEntry> read(const std::string& fileName);

  private:
    std::string mDirectory;
  };

  /**
   * @brief Weekly digest of instruments that keep reappearing as coiling springs.
   *
   * Reads the daily files dated within the lookbackDays calendar days that
   * end on the reference date and keeps tickers seen on at least
   * minOccurrences of them. Each kept ticker carries its most recent entry.
   * Results are ordered by occurrence count descending, then ticker.
   */
  class WatchlistAggregator
  {
  public:
    WatchlistAggregator(const std::string& directory,
			std::ostream& log,
			unsigned int lookbackDays = 7,
			unsigned int minOccurrences = 3);

    std::vector<WatchlistEntry> aggregate(const boost::gregorian::date& referenceDate) const;

    // Columns as the daily file plus DaysOnWatchlist. Returns the path written.
    std::string writeDigest(const std::vector<WatchlistEntry>& digest,
			    const std::string& fileName = "watchlist_weekly_digest.csv") const;

  private:
    std::string mDirectory;
    std::ostream& mLog;
    unsigned int mLookbackDays;
    unsigned int mMinOccurrences;
  };

} // namespace swingscanner::watchlist
