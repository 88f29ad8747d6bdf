// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/SpreadQualityGate.h"
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <boost/algorithm/string/trim.hpp>
#include "ParallelFor.h"
#include "TimeSeriesIndicators.h"

namespace swingscanner::screening::gates
{
  SectorSpreadTable::SectorSpreadTable(std::map<std::string, SectorSpreadStats> stats)
    : mStats(std::move(stats))
  {}

  SectorSpreadStats SectorSpreadTable::makeStats(const std::string& sector,
						 std::size_t count,
						 Num mean,
						 Num stdDev)
  {
    SectorSpreadStats stats;
    stats.count = count;
    stats.mean = mean;
    stats.stdDev = stdDev;
    stats.degenerate = false;

    if (sector == UNKNOWN_SECTOR)
      {
	stats.degenerate = true;
	stats.degenerateReason = "unsectored instruments";
      }
    else if (count < 2)
      {
	stats.degenerate = true;
	stats.degenerateReason = "fewer than 2 sector peers";
      }
    else if (stdDev <= kDegenerateStdDev)
      {
	stats.degenerate = true;
	stats.degenerateReason = "zero spread dispersion in sector";
      }

    return stats;
  }

  SectorSpreadTable SectorSpreadTable::build(const std::map<std::string, std::vector<Num>>& spreadsBySector)
  {
    std::map<std::string, SectorSpreadStats> stats;

    for (const auto& entry : spreadsBySector)
      {
	const std::vector<Num>& spreads = entry.second;
	stats.emplace(entry.first,
		      makeStats(entry.first,
				spreads.size(),
				swing_timeseries::Mean(spreads),
				swing_timeseries::StandardDeviation(spreads)));
      }

    return SectorSpreadTable(std::move(stats));
  }

  bool SectorSpreadTable::contains(const std::string& sector) const
  {
    return mStats.find(sector) != mStats.end();
  }

  const SectorSpreadStats& SectorSpreadTable::getStats(const std::string& sector) const
  {
    auto it = mStats.find(sector);
    if (it == mStats.end())
      throw std::out_of_range("SectorSpreadTable: no statistics for sector " + sector);
    return it->second;
  }

  Num SectorSpreadTable::zScore(const std::string& sector, Num spread) const
  {
    const SectorSpreadStats& stats = getStats(sector);
    if (stats.degenerate)
      throw DegenerateGroupException("sector " + sector + " is degenerate (" + stats.degenerateReason + ")");

    return (spread - stats.mean) / stats.stdDev;
  }

  SpreadQualityGate::SpreadQualityGate(const SpreadGateConfig& config)
    : mConfig(config)
  {}

  const std::string& SpreadQualityGate::getName() const
  {
    return gate_names::SPREAD;
  }

  std::string SpreadQualityGate::sectorKey(const Instrument& instrument)
  {
    if (!instrument.hasKnownSector())
      return UNKNOWN_SECTOR;
    return boost::algorithm::trim_copy(instrument.getSector());
  }

  Num SpreadQualityGate::computeSpread(const Instrument& instrument) const
  {
    const OHLCSeries& series = instrument.getSeries();
    if (series.getNumEntries() < mConfig.rollingWindow)
      throw InsufficientHistoryException(std::to_string(series.getNumEntries()) + " sessions available, " +
					 std::to_string(mConfig.rollingWindow) + " required for spread");

    try
      {
	return swing_timeseries::AverageRelativeRange(series, mConfig.rollingWindow);
      }
    catch (const std::domain_error& e)
      {
	throw ComputeException(e.what());
      }
  }

  GateResult SpreadQualityGate::evaluateSpread(Num spread,
					       const std::string& sector,
					       const SectorSpreadTable& table) const
  {
    const SectorSpreadStats& stats = table.getStats(sector);

    GateResult::MetricMap metrics{
      { "spread", spread },
      { "sector_mean", stats.mean },
      { "sector_std", stats.stdDev },
      { "sector_count", static_cast<double>(stats.count) }
    };
    GateResult::LabelMap labels{ { "sector", sector } };

    bool capOk = spread < mConfig.maxAbsSpread;
    std::ostringstream reason;
    reason << std::fixed << std::setprecision(4);

    try
      {
	Num z = table.zScore(sector, spread);
	metrics["spread_z"] = z;
	bool zOk = z <= mConfig.maxSpreadZScore;

	if (zOk && capOk)
	  {
	    reason << "spread " << spread << " z=" << z << " <= " << mConfig.maxSpreadZScore
		   << " and below cap " << mConfig.maxAbsSpread;
	    return GateResult::Pass(reason.str(), std::move(metrics), std::move(labels));
	  }

	if (!zOk)
	  reason << "spread z-score " << z << " exceeds " << mConfig.maxSpreadZScore;
	if (!capOk)
	  reason << (zOk ? "" : "; ") << "spread " << spread << " not below absolute cap " << mConfig.maxAbsSpread;

	return GateResult::HardFail(reason.str(), std::move(metrics), std::move(labels));
      }
    catch (const DegenerateGroupException& e)
      {
	reason << e.what() << ": z-test skipped, absolute cap only; spread " << spread
	       << (capOk ? " below cap " : " not below cap ") << mConfig.maxAbsSpread;

	if (capOk)
	  return GateResult::Pass(reason.str(), std::move(metrics), std::move(labels));
	return GateResult::HardFail(reason.str(), std::move(metrics), std::move(labels));
      }
  }

  GateStageResult SpreadQualityGate::execute(const std::vector<std::string>& tickers,
					     const GateContext& ctx,
					     concurrency::IParallelExecutor& executor,
					     std::ostream& os) const
  {
    const uint32_t total = static_cast<uint32_t>(tickers.size());
    std::vector<std::optional<Num>> spreads(tickers.size());
    std::vector<std::optional<GateResult>> results(tickers.size());

    // Pass 1: per-instrument spread
    concurrency::parallel_for(total, executor,
			      [this, &tickers, &ctx, &spreads, &results](uint32_t i) {
				const Instrument& instrument = ctx.batch.getInstrument(tickers[i]);
				try
				  {
				    spreads[i] = computeSpread(instrument);
				  }
				catch (const InsufficientHistoryException& e)
				  {
				    results[i] = GateResult::HardFail(std::string("insufficient history: ") + e.what(),
								      {}, { { "sector", sectorKey(instrument) } });
				  }
				catch (const std::exception& e)
				  {
				    results[i] = GateResult::HardFail(std::string("computation error: ") + e.what(),
								      {}, { { "sector", sectorKey(instrument) } });
				  }
			      });

    // Barrier: reduce valid spreads into the immutable sector table
    std::map<std::string, std::vector<Num>> spreadsBySector;
    for (std::size_t i = 0; i < tickers.size(); ++i)
      if (spreads[i])
	spreadsBySector[sectorKey(ctx.batch.getInstrument(tickers[i]))].push_back(*spreads[i]);

    const SectorSpreadTable table(SectorSpreadTable::build(spreadsBySector));

    // Pass 2: z-score and absolute cap
    concurrency::parallel_for(total, executor,
			      [this, &tickers, &ctx, &spreads, &results, &table](uint32_t i) {
				if (!spreads[i])
				  return;
				const Instrument& instrument = ctx.batch.getInstrument(tickers[i]);
				results[i] = evaluateSpread(*spreads[i], sectorKey(instrument), table);
			      });

    GateStageResult stage = collectStageResult(tickers, results);

    os << "   [SpreadQuality] sectors=" << table.getNumSectors() << "\n";
    logStageSummary(os, "SpreadQuality", stage);
    return stage;
  }

} // namespace swingscanner::screening::gates
