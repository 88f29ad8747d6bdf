// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "IParallelExecutor.h"
#include "ScannerConfiguration.h"
#include "screening/InstrumentBatch.h"
#include "screening/ScreeningTypes.h"
#include "screening/TradeMetadataCalculator.h"
#include "screening/gates/ExecutionTimingGate.h"
#include "screening/gates/FundamentalQualityGate.h"
#include "screening/gates/InstitutionalConfirmationGate.h"
#include "screening/gates/SpreadQualityGate.h"
#include "screening/gates/TechnicalTrendGate.h"

namespace swingscanner::screening
{
  enum class PipelineStage
  {
    Init,
    SpreadGate,
    FundamentalGate,
    InstitutionalGate,
    TechnicalGate,
    ExecutionGate,
    Done
  };

  std::string toString(PipelineStage stage);

  /**
   * @brief Runs the gates in order INIT -> G1 -> G2 -> G2B -> G3 -> G4 -> DONE.
   *
   * Each gate sees only the survivors of the previous one, and every result
   * is appended to the rationale trail. The scan ends early when no
   * instrument survives a gate.
   *
   * Stage transitions and gate summaries are logged to the supplied stream.
   */
  class ScreeningPipeline
  {
  public:
    ScreeningPipeline(const ScannerConfiguration& config,
		      concurrency::IParallelExecutor& executor,
		      std::ostream& os);

    ScanResult run(const InstrumentBatch& batch) const;

  private:
    std::vector<std::string> runGate(const gates::ScreeningGate& gate,
				     const std::vector<std::string>& tickers,
				     const InstrumentBatch& batch,
				     RationaleTrail& trail,
				     std::vector<std::string>* softFailures = nullptr) const;

    void computeTradeMetadata(const std::vector<std::string>& tickers,
			      const InstrumentBatch& batch,
			      ScanResult& result) const;

    static std::vector<Candidate> buildCandidates(const std::vector<std::string>& buys,
						  const std::vector<std::string>& coilingSprings,
						  const ScanResult& result);

  private:
    gates::SpreadQualityGate mSpreadGate;
    gates::FundamentalQualityGate mFundamentalGate;
    gates::InstitutionalConfirmationGate mInstitutionalGate;
    gates::TechnicalTrendGate mTechnicalGate;
    gates::ExecutionTimingGate mExecutionGate;
    TradeMetadataCalculator mTradeCalculator;
    concurrency::IParallelExecutor& mExecutor;
    std::ostream& mLog;
  };

} // namespace swingscanner::screening
