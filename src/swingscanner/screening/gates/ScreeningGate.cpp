// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/gates/ScreeningGate.h"
#include <cstdint>
#include <stdexcept>
#include "ParallelFor.h"
#include "TimeSeriesException.h"

namespace swingscanner::screening::gates
{
  GateStageResult PerInstrumentGate::execute(const std::vector<std::string>& tickers,
					     const GateContext& ctx,
					     concurrency::IParallelExecutor& executor,
					     std::ostream& os) const
  {
    std::vector<std::optional<GateResult>> results(tickers.size());

    concurrency::parallel_for(static_cast<uint32_t>(tickers.size()), executor,
			      [this, &tickers, &ctx, &results](uint32_t i) {
				const Instrument& instrument = ctx.batch.getInstrument(tickers[i]);
				results[i] = evaluateSafely(instrument, ctx);
			      });

    GateStageResult stage = collectStageResult(tickers, results);
    logStageSummary(os, getLogTag(), stage);
    return stage;
  }

  GateResult PerInstrumentGate::evaluateSafely(const Instrument& instrument, const GateContext& ctx) const
  {
    try
      {
	return evaluate(instrument, ctx);
      }
    catch (const InsufficientHistoryException& e)
      {
	return GateResult::HardFail(std::string("insufficient history: ") + e.what());
      }
    catch (const swing_timeseries::InsufficientDataException& e)
      {
	return GateResult::HardFail(std::string("insufficient history: ") + e.what());
      }
    catch (const MissingFieldException& e)
      {
	return GateResult::HardFail(e.what());
      }
    catch (const std::exception& e)
      {
	return GateResult::HardFail(std::string("computation error: ") + e.what());
      }
  }

  GateStageResult collectStageResult(const std::vector<std::string>& tickers,
				     std::vector<std::optional<GateResult>>& results)
  {
    if (results.size() != tickers.size())
      throw std::logic_error("collectStageResult: result count does not match ticker count");

    GateStageResult stage;
    stage.results.reserve(tickers.size());

    for (std::size_t i = 0; i < tickers.size(); ++i)
      {
	if (!results[i])
	  throw std::logic_error("collectStageResult: no result produced for " + tickers[i]);

	if (results[i]->passed())
	  stage.survivors.push_back(tickers[i]);
	stage.results.emplace_back(tickers[i], std::move(*results[i]));
      }

    return stage;
  }

  void logStageSummary(std::ostream& os, const std::string& tag, const GateStageResult& stage)
  {
    std::size_t soft = 0;
    std::size_t hard = 0;
    for (const auto& entry : stage.results)
      {
	if (entry.second.getOutcome() == GateOutcome::SoftFail)
	  ++soft;
	else if (entry.second.getOutcome() == GateOutcome::HardFail)
	  ++hard;
      }

    os << "   [" << tag << "] evaluated=" << stage.results.size()
       << " passed=" << stage.survivors.size()
       << " soft=" << soft
       << " failed=" << hard << "\n";
  }

} // namespace swingscanner::screening::gates
