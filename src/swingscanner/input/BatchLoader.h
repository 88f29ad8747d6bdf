// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "screening/InstrumentBatch.h"
#include "screening/ScreeningTypes.h"

namespace swingscanner::input
{
  using screening::Num;

  class BatchLoaderException : public std::runtime_error
  {
  public:
    explicit BatchLoaderException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~BatchLoaderException() noexcept override = default;
  };

  struct BatchLoaderOptions
  {
    std::string universeFile;
    std::optional<std::string> fundamentalsFile;
    std::optional<std::string> benchmarkFile;
    std::optional<boost::posix_time::ptime> asOf;
  };

  // One row of the universe file.
  struct UniverseRow
  {
    std::string ticker;
    std::string sector;
    std::optional<screening::CapTier> capTier;
    screening::InstitutionalSnapshot institutional;
    std::optional<Num> promoterPledgePct;
    std::string dataPath;
  };

  /**
   * @brief Builds an InstrumentBatch from CSV files.
   *
   * Universe:      Ticker,Sector,CapTier,InstitutionalPct,FreeFloatPct,PromoterPledgePct,DataPath
   * Fundamentals:  Ticker,Period,NetIncome,CFO,TotalAssets,CurrentAssets,CurrentLiabilities,
   *                LongTermDebt,SharesOutstanding,Revenue,GrossProfit   (Period is Current or Prior)
   * Price data:    Date,Open,High,Low,Close,Volume
   *
   * Empty cells are missing values. Relative data paths are resolved against
   * the directory of the universe file.
   */
  class BatchLoader
  {
  public:
    explicit BatchLoader(std::ostream& log);

    // Throws BatchLoaderException for malformed universe or fundamentals
    // files and for an unreadable benchmark file. An unreadable price file
    // gives the instrument an empty series and logs a warning.
    screening::InstrumentBatch load(const BatchLoaderOptions& options) const;

    static std::vector<UniverseRow> readUniverse(const std::string& fileName);

    // Keyed by ticker; promoter pledge is not part of this file.
    static std::map<std::string, screening::FundamentalsSnapshot> readFundamentals(const std::string& fileName);

    // Throws the underlying reader exception on failure.
    static screening::OHLCSeries readPriceSeries(const std::string& fileName);

    // Accepts "YYYY-MM-DD HH:MM[:SS]" and ISO "YYYYMMDDTHHMMSS".
    static boost::posix_time::ptime parseAsOf(const std::string& text);

  private:
    screening::OHLCSeries readSeriesOrEmpty(const std::string& ticker, const std::string& fileName) const;

  private:
    std::ostream& mLog;
  };

} // namespace swingscanner::input
