// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "screening/ScreeningTypes.h"

namespace swingscanner::screening
{
  /**
   * @brief Immutable snapshot of one scan's inputs.
   *
   * Holds every instrument keyed by ticker, the optional benchmark series used
   * for relative strength, and the optional as-of time of the most recent
   * bar (absent for end-of-day scans).
   */
  class InstrumentBatch
  {
  public:
    using InstrumentPtr = std::shared_ptr<const Instrument>;

    InstrumentBatch();

    // Throws std::invalid_argument on duplicate tickers.
    InstrumentBatch(std::vector<Instrument> instruments,
		    std::shared_ptr<const OHLCSeries> benchmark = nullptr,
		    std::optional<boost::posix_time::ptime> asOf = std::nullopt);

    std::size_t size() const
    {
      return mInstruments.size();
    }

    bool isEmpty() const
    {
      return mInstruments.empty();
    }

    bool contains(const std::string& ticker) const;

    // Throws std::out_of_range for unknown tickers.
    const Instrument& getInstrument(const std::string& ticker) const;

    // All tickers in ascending order.
    std::vector<std::string> getTickers() const;

    bool hasBenchmark() const
    {
      return mBenchmark != nullptr && !mBenchmark->isEmpty();
    }

    const std::shared_ptr<const OHLCSeries>& getBenchmark() const
    {
      return mBenchmark;
    }

    const std::optional<boost::posix_time::ptime>& getAsOf() const
    {
      return mAsOf;
    }

  private:
    std::map<std::string, InstrumentPtr> mInstruments;
    std::shared_ptr<const OHLCSeries> mBenchmark;
    std::optional<boost::posix_time::ptime> mAsOf;
  };

} // namespace swingscanner::screening
