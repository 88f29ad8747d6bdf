#include <fstream>
#include <sstream>
#include <stdexcept>
#include <boost/filesystem.hpp>
#include "ParallelExecutors.h"
#include "ScannerTestFixtures.h"

using namespace swingscanner;
using namespace swingscanner::screening;

FundamentalsSnapshot boundaryFundamentals()
{
  FundamentalsSnapshot snapshot;

  snapshot.current.netIncome = 100.0;
  snapshot.current.cashFlowFromOperations = 50.0;
  snapshot.current.totalAssets = 1000.0;
  snapshot.current.currentAssets = 150.0;
  snapshot.current.currentLiabilities = 100.0;
  snapshot.current.longTermDebt = 200.0;
  snapshot.current.sharesOutstanding = 100.0;
  snapshot.current.revenue = 1000.0;
  snapshot.current.grossProfit = 300.0;

  snapshot.prior.netIncome = 80.0;
  snapshot.prior.totalAssets = 1000.0;
  snapshot.prior.currentAssets = 150.0;
  snapshot.prior.currentLiabilities = 100.0;
  snapshot.prior.longTermDebt = 200.0;
  snapshot.prior.sharesOutstanding = 100.0;
  snapshot.prior.revenue = 1000.0;
  snapshot.prior.grossProfit = 300.0;

  snapshot.promoterPledgePct = 5.0;
  return snapshot;
}

InstitutionalSnapshot institutionalSnapshot (double institutionalPct, double freeFloatPct)
{
  InstitutionalSnapshot snapshot;
  snapshot.institutionalOwnershipPct = institutionalPct;
  snapshot.freeFloatPct = freeFloatPct;
  return snapshot;
}

Instrument makeInstrument (const std::string& ticker,
			   const SeriesType& series,
			   const std::string& sector,
			   std::optional<CapTier> tier,
			   const FundamentalsSnapshot& fundamentals,
			   const InstitutionalSnapshot& institutional)
{
  return Instrument(ticker, series, sector, tier, fundamentals, institutional);
}

InstitutionalThresholdTable defaultTierThresholds()
{
  std::map<CapTier, InstitutionalThreshold> thresholds;
  thresholds[CapTier::Large] = InstitutionalThreshold{40.0, 30.0};
  thresholds[CapTier::Mid] = InstitutionalThreshold{30.0, 25.0};
  thresholds[CapTier::Small] = InstitutionalThreshold{20.0, 20.0};
  return InstitutionalThresholdTable(thresholds);
}

ScannerConfiguration defaultConfiguration (const ScannerParameters& parameters)
{
  return ScannerConfiguration(parameters, defaultTierThresholds());
}

std::shared_ptr<const SeriesType> flatBenchmark (unsigned long numSessions)
{
  return std::make_shared<const SeriesType>(createFlatSeries(numSessions, 1000.0));
}

gates::GateStageResult runGate (const gates::ScreeningGate& gate,
				const InstrumentBatch& batch,
				const RationaleTrail& trail)
{
  concurrency::SingleThreadExecutor executor;
  std::ostringstream log;
  gates::GateContext ctx{ batch, trail };
  return gate.execute(batch.getTickers(), ctx, executor, log);
}

const GateResult& resultFor (const gates::GateStageResult& stage, const std::string& ticker)
{
  for (const auto& entry : stage.results)
    if (entry.first == ticker)
      return entry.second;

  throw std::out_of_range("no result for " + ticker);
}

std::string writeTempFile (const std::string& contents, const std::string& pattern)
{
  boost::filesystem::path path = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path(pattern);
  std::ofstream out (path.string());
  out << contents;
  return path.string();
}
