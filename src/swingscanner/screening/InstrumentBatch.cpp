// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/InstrumentBatch.h"
#include <stdexcept>

namespace swingscanner::screening
{
  InstrumentBatch::InstrumentBatch()
    : mInstruments(),
      mBenchmark(),
      mAsOf()
  {}

  InstrumentBatch::InstrumentBatch(std::vector<Instrument> instruments,
				   std::shared_ptr<const OHLCSeries> benchmark,
				   std::optional<boost::posix_time::ptime> asOf)
    : mInstruments(),
      mBenchmark(std::move(benchmark)),
      mAsOf(asOf)
  {
    for (auto& instrument : instruments)
      {
	std::string ticker = instrument.getTicker();
	auto ptr = std::make_shared<const Instrument>(std::move(instrument));

	if (!mInstruments.emplace(ticker, std::move(ptr)).second)
	  throw std::invalid_argument("InstrumentBatch: duplicate ticker " + ticker);
      }
  }

  bool InstrumentBatch::contains(const std::string& ticker) const
  {
    return mInstruments.find(ticker) != mInstruments.end();
  }

  const Instrument& InstrumentBatch::getInstrument(const std::string& ticker) const
  {
    auto it = mInstruments.find(ticker);
    if (it == mInstruments.end())
      throw std::out_of_range("InstrumentBatch::getInstrument: unknown ticker " + ticker);
    return *it->second;
  }

  std::vector<std::string> InstrumentBatch::getTickers() const
  {
    std::vector<std::string> tickers;
    tickers.reserve(mInstruments.size());
    for (const auto& entry : mInstruments)
      tickers.push_back(entry.first);

    return tickers;
  }

} // namespace swingscanner::screening
