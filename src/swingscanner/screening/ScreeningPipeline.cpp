// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "screening/ScreeningPipeline.h"
#include <algorithm>
#include "TimeSeriesException.h"

namespace swingscanner::screening
{
  namespace
  {
    PipelineStage nextStage(PipelineStage stage)
    {
      switch (stage)
	{
	case PipelineStage::Init:
	  return PipelineStage::SpreadGate;
	case PipelineStage::SpreadGate:
	  return PipelineStage::FundamentalGate;
	case PipelineStage::FundamentalGate:
	  return PipelineStage::InstitutionalGate;
	case PipelineStage::InstitutionalGate:
	  return PipelineStage::TechnicalGate;
	case PipelineStage::TechnicalGate:
	  return PipelineStage::ExecutionGate;
	default:
	  return PipelineStage::Done;
	}
    }
  }

  std::string toString(PipelineStage stage)
  {
    switch (stage)
      {
      case PipelineStage::Init:
	return "INIT";
      case PipelineStage::SpreadGate:
	return "G1";
      case PipelineStage::FundamentalGate:
	return "G2";
      case PipelineStage::InstitutionalGate:
	return "G2B";
      case PipelineStage::TechnicalGate:
	return "G3";
      case PipelineStage::ExecutionGate:
	return "G4";
      case PipelineStage::Done:
	return "DONE";
      }
    return "UNKNOWN";
  }

  ScreeningPipeline::ScreeningPipeline(const ScannerConfiguration& config,
				       concurrency::IParallelExecutor& executor,
				       std::ostream& os)
    : mSpreadGate(config.getSpreadConfig()),
      mFundamentalGate(config.getFundamentalConfig()),
      mInstitutionalGate(config.getTierThresholds()),
      mTechnicalGate(config.getTechnicalConfig()),
      mExecutionGate(config.getExecutionConfig(), config.getSessionConfig()),
      mTradeCalculator(config.getExecutionConfig()),
      mExecutor(executor),
      mLog(os)
  {}

  std::vector<std::string> ScreeningPipeline::runGate(const gates::ScreeningGate& gate,
						      const std::vector<std::string>& tickers,
						      const InstrumentBatch& batch,
						      RationaleTrail& trail,
						      std::vector<std::string>* softFailures) const
  {
    gates::GateContext ctx{ batch, trail };
    gates::GateStageResult stage = gate.execute(tickers, ctx, mExecutor, mLog);

    for (const auto& entry : stage.results)
      {
	trail.record(entry.first, gate.getName(), entry.second);
	if (softFailures && entry.second.getOutcome() == GateOutcome::SoftFail)
	  softFailures->push_back(entry.first);
      }

    return stage.survivors;
  }

  void ScreeningPipeline::computeTradeMetadata(const std::vector<std::string>& tickers,
					       const InstrumentBatch& batch,
					       ScanResult& result) const
  {
    for (const auto& ticker : tickers)
      {
	std::string pattern = gates::pattern_names::STAGE2;
	if (result.trail.contains(ticker, gate_names::TECHNICALS))
	  {
	    const GateResult& trend = result.trail.getResult(ticker, gate_names::TECHNICALS);
	    if (trend.hasLabel("pattern"))
	      pattern = trend.getLabel("pattern");
	  }

	try
	  {
	    result.tradeMetadata.emplace(ticker, mTradeCalculator.calculate(batch.getInstrument(ticker), pattern));
	  }
	catch (const ScreeningException& e)
	  {
	    mLog << "   [Pipeline] no trade metadata for " << ticker << ": " << e.what() << "\n";
	  }
	catch (const swing_timeseries::TimeSeriesException& e)
	  {
	    mLog << "   [Pipeline] no trade metadata for " << ticker << ": " << e.what() << "\n";
	  }
      }
  }

  std::vector<Candidate> ScreeningPipeline::buildCandidates(const std::vector<std::string>& buys,
							    const std::vector<std::string>& coilingSprings,
							    const ScanResult& result)
  {
    std::vector<Candidate> candidates;

    auto append = [&candidates, &result](std::vector<std::string> tickers, CandidateStatus status)
      {
	std::sort(tickers.begin(), tickers.end());
	for (const auto& ticker : tickers)
	  {
	    Candidate candidate;
	    candidate.ticker = ticker;
	    candidate.status = status;

	    auto it = result.tradeMetadata.find(ticker);
	    if (it != result.tradeMetadata.end())
	      candidate.tradeMetadata = it->second;

	    candidates.push_back(std::move(candidate));
	  }
      };

    append(buys, CandidateStatus::Buy);
    append(coilingSprings, CandidateStatus::CoilingSpring);
    return candidates;
  }

  ScanResult ScreeningPipeline::run(const InstrumentBatch& batch) const
  {
    ScanResult result;
    result.summary.setScannedCount(batch.size());

    std::vector<std::string> survivors = batch.getTickers();
    std::vector<std::string> institutionalSurvivors;
    std::vector<std::string> coilingSprings;
    std::vector<std::string> buys;

    PipelineStage stage = PipelineStage::Init;
    while (stage != PipelineStage::Done)
      {
	PipelineStage next = nextStage(stage);
	if (survivors.empty())
	  next = PipelineStage::Done;

	mLog << "[Pipeline] " << toString(stage) << " -> " << toString(next)
	     << " (" << survivors.size() << " instruments)\n";
	stage = next;

	switch (stage)
	  {
	  case PipelineStage::SpreadGate:
	    survivors = runGate(mSpreadGate, survivors, batch, result.trail);
	    result.summary.setSpreadSurvivorCount(survivors.size());
	    break;

	  case PipelineStage::FundamentalGate:
	    survivors = runGate(mFundamentalGate, survivors, batch, result.trail);
	    result.summary.setFundamentalSurvivorCount(survivors.size());
	    break;

	  case PipelineStage::InstitutionalGate:
	    survivors = runGate(mInstitutionalGate, survivors, batch, result.trail);
	    result.summary.setInstitutionalSurvivorCount(survivors.size());
	    institutionalSurvivors = survivors;
	    break;

	  case PipelineStage::TechnicalGate:
	    survivors = runGate(mTechnicalGate, survivors, batch, result.trail, &coilingSprings);
	    result.summary.setTrendConfirmedCount(survivors.size());
	    result.summary.setCoilingSpringCount(coilingSprings.size());
	    computeTradeMetadata(institutionalSurvivors, batch, result);
	    break;

	  case PipelineStage::ExecutionGate:
	    survivors = runGate(mExecutionGate, survivors, batch, result.trail);
	    result.summary.setBuyCount(survivors.size());
	    buys = survivors;
	    break;

	  case PipelineStage::Init:
	  case PipelineStage::Done:
	    break;
	  }
      }

    result.candidates = buildCandidates(buys, coilingSprings, result);

    mLog << "[Pipeline] scanned=" << result.summary.getScannedCount()
	 << " buy=" << result.summary.getBuyCount()
	 << " coiling_spring=" << result.summary.getCoilingSpringCount() << "\n";

    return result;
  }

} // namespace swingscanner::screening
