// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "IParallelExecutor.h"
#include "screening/ScreeningTypes.h"
#include "screening/InstrumentBatch.h"

namespace swingscanner::screening::gates
{
  /**
   * @brief Read-only inputs visible to a gate.
   *
   * The trail holds the results of the gates that already ran, so later gates
   * can consult earlier decisions (Gate 4 reads the Gate 3 pattern label).
   */
  struct GateContext
  {
    const InstrumentBatch& batch;
    const RationaleTrail& trail;
  };

  /**
   * @brief Output of one gate over the survivors of the previous stage.
   *
   * results holds one entry per input ticker, in input order. survivors holds
   * the tickers whose result passed, in the same order.
   */
  struct GateStageResult
  {
    std::vector<std::string> survivors;
    std::vector<std::pair<std::string, GateResult>> results;
  };

  /**
   * @brief A pipeline stage: (survivors, batch) -> (new survivors, results).
   */
  class ScreeningGate
  {
  public:
    virtual ~ScreeningGate() = default;

    // Name under which results are recorded in the rationale trail.
    virtual const std::string& getName() const = 0;

    virtual GateStageResult execute(const std::vector<std::string>& tickers,
				    const GateContext& ctx,
				    concurrency::IParallelExecutor& executor,
				    std::ostream& os) const = 0;
  };

  /**
   * @brief Gate whose decision for an instrument depends on that instrument only.
   *
   * Instruments are evaluated in parallel; exceptions raised while evaluating
   * one instrument become a HardFail result for it and never escape execute().
   */
  class PerInstrumentGate : public ScreeningGate
  {
  public:
    GateStageResult execute(const std::vector<std::string>& tickers,
			    const GateContext& ctx,
			    concurrency::IParallelExecutor& executor,
			    std::ostream& os) const override;

  protected:
    virtual GateResult evaluate(const Instrument& instrument, const GateContext& ctx) const = 0;

    // Tag printed in log lines, e.g. "FundamentalQuality".
    virtual std::string getLogTag() const = 0;

    GateResult evaluateSafely(const Instrument& instrument, const GateContext& ctx) const;
  };

  // Prints "   [Tag] evaluated=N passed=P soft=S failed=F".
  void logStageSummary(std::ostream& os, const std::string& tag, const GateStageResult& stage);

  // Builds a stage result from per-ticker results computed in input order.
  GateStageResult collectStageResult(const std::vector<std::string>& tickers,
				     std::vector<std::optional<GateResult>>& results);

} // namespace swingscanner::screening::gates
