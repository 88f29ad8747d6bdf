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
#include "TimeSeries.h"
#include "screening/ScreeningExceptions.h"

namespace swingscanner::screening
{
  using Num = double;
  using OHLCSeries = swing_timeseries::OHLCTimeSeries<Num>;
  using OHLCEntry = swing_timeseries::OHLCTimeSeriesEntry<Num>;

  // Names under which gate results are recorded in the rationale trail.
  namespace gate_names
  {
    inline const std::string SPREAD = "Gate1_Spread";
    inline const std::string FUNDAMENTALS = "Gate2_Fundamentals";
    inline const std::string INSTITUTIONAL = "Gate2B_Institutional";
    inline const std::string TECHNICALS = "Gate3_Technicals";
    inline const std::string EXECUTION = "Gate4_Execution";
  }

  enum class CapTier
  {
    Large,
    Mid,
    Small
  };

  std::string toString(CapTier tier);

  // Accepts LARGE/MID/SMALL (case-insensitive, optional "CAP" suffix);
  // anything else yields an empty optional.
  std::optional<CapTier> parseCapTier(const std::string& text);

  /**
   * @brief Accounting line items for one reporting period. Every item is optional.
   */
  struct FundamentalsPeriod
  {
    std::optional<Num> netIncome;
    std::optional<Num> cashFlowFromOperations;
    std::optional<Num> totalAssets;
    std::optional<Num> currentAssets;
    std::optional<Num> currentLiabilities;
    std::optional<Num> longTermDebt;
    std::optional<Num> sharesOutstanding;
    std::optional<Num> revenue;
    std::optional<Num> grossProfit;
  };

  struct FundamentalsSnapshot
  {
    FundamentalsPeriod current;
    FundamentalsPeriod prior;
    std::optional<Num> promoterPledgePct;
  };

  struct InstitutionalSnapshot
  {
    std::optional<Num> institutionalOwnershipPct;
    std::optional<Num> freeFloatPct;
  };

  /**
   * @brief One screened equity: daily bars plus descriptive metadata.
   *
   * Instances are owned by an InstrumentBatch and never modified by gates.
   */
  class Instrument
  {
  public:
    Instrument(const std::string& ticker,
	       OHLCSeries series,
	       const std::string& sector,
	       std::optional<CapTier> capTier,
	       const FundamentalsSnapshot& fundamentals,
	       const InstitutionalSnapshot& institutional);

    const std::string& getTicker() const
    {
      return mTicker;
    }

    const OHLCSeries& getSeries() const
    {
      return mSeries;
    }

    const std::string& getSector() const
    {
      return mSector;
    }

    // True when the sector is empty or "Unknown".
    bool hasKnownSector() const;

    const std::optional<CapTier>& getCapTier() const
    {
      return mCapTier;
    }

    // Cap tier used for thresholds: unresolved tiers are treated as SMALL.
    CapTier getEffectiveCapTier() const
    {
      return mCapTier.value_or(CapTier::Small);
    }

    const FundamentalsSnapshot& getFundamentals() const
    {
      return mFundamentals;
    }

    const InstitutionalSnapshot& getInstitutional() const
    {
      return mInstitutional;
    }

  private:
    std::string mTicker;
    OHLCSeries mSeries;
    std::string mSector;
    std::optional<CapTier> mCapTier;
    FundamentalsSnapshot mFundamentals;
    InstitutionalSnapshot mInstitutional;
  };

  enum class GateOutcome
  {
    Pass,
    SoftFail,
    HardFail
  };

  std::string toString(GateOutcome outcome);

  /**
   * @brief Immutable record of one gate's decision for one instrument.
   *
   * Only plain values are stored so that the trail can be persisted verbatim
   * as the audit record. The reason is always populated.
   */
  class GateResult
  {
  public:
    using MetricMap = std::map<std::string, double>;
    using LabelMap = std::map<std::string, std::string>;

    static GateResult Pass(const std::string& reason,
			   MetricMap metrics = {},
			   LabelMap labels = {});

    static GateResult SoftFail(const std::string& reason,
			       MetricMap metrics = {},
			       LabelMap labels = {});

    static GateResult HardFail(const std::string& reason,
			       MetricMap metrics = {},
			       LabelMap labels = {});

    bool passed() const
    {
      return mOutcome == GateOutcome::Pass;
    }

    GateOutcome getOutcome() const
    {
      return mOutcome;
    }

    const std::string& getReason() const
    {
      return mReason;
    }

    const MetricMap& getMetrics() const
    {
      return mMetrics;
    }

    const LabelMap& getLabels() const
    {
      return mLabels;
    }

    bool hasMetric(const std::string& name) const;
    double getMetric(const std::string& name) const;

    bool hasLabel(const std::string& name) const;
    const std::string& getLabel(const std::string& name) const;

  private:
    GateResult(GateOutcome outcome,
	       const std::string& reason,
	       MetricMap metrics,
	       LabelMap labels);

  private:
    GateOutcome mOutcome;
    std::string mReason;
    MetricMap mMetrics;
    LabelMap mLabels;
  };

  /**
   * @brief Append-only audit trail: ticker -> gate name -> GateResult.
   */
  class RationaleTrail
  {
  public:
    using GateResults = std::map<std::string, GateResult>;
    using Entries = std::map<std::string, GateResults>;

    // Throws std::logic_error if (ticker, gateName) already has a result.
    void record(const std::string& ticker, const std::string& gateName, const GateResult& result);

    bool contains(const std::string& ticker) const;
    bool contains(const std::string& ticker, const std::string& gateName) const;

    // Throws std::out_of_range when no result is recorded.
    const GateResult& getResult(const std::string& ticker, const std::string& gateName) const;
    const GateResults& getResults(const std::string& ticker) const;

    const Entries& getEntries() const
    {
      return mEntries;
    }

    std::size_t getNumInstruments() const
    {
      return mEntries.size();
    }

    bool isEmpty() const
    {
      return mEntries.empty();
    }

  private:
    Entries mEntries;
  };

  enum class CandidateStatus
  {
    Buy,
    CoilingSpring
  };

  std::string toString(CandidateStatus status);

  inline const std::string HOLDING_PERIOD_SWING = "Swing (2-6 Weeks)";
  inline const std::string HOLDING_PERIOD_POSITIONAL = "Positional (1-3 Months)";

  struct TradeMetadata
  {
    Num entry{0};
    Num stop{0};
    Num target{0};
    Num atr{0};
    std::string holdingPeriod;
    Num riskRewardRatio{0};
    std::string riskRewardLabel;
  };

  struct Candidate
  {
    std::string ticker;
    CandidateStatus status{CandidateStatus::Buy};
    std::optional<TradeMetadata> tradeMetadata;
  };

  /**
   * @brief Survivor counts per pipeline stage.
   */
  class ScreeningSummary
  {
  public:
    ScreeningSummary();

    std::size_t getScannedCount() const
    {
      return mScannedCount;
    }

    std::size_t getSpreadSurvivorCount() const
    {
      return mSpreadSurvivorCount;
    }

    std::size_t getFundamentalSurvivorCount() const
    {
      return mFundamentalSurvivorCount;
    }

    std::size_t getInstitutionalSurvivorCount() const
    {
      return mInstitutionalSurvivorCount;
    }

    std::size_t getTrendConfirmedCount() const
    {
      return mTrendConfirmedCount;
    }

    std::size_t getCoilingSpringCount() const
    {
      return mCoilingSpringCount;
    }

    std::size_t getBuyCount() const
    {
      return mBuyCount;
    }

    void setScannedCount(std::size_t count)
    {
      mScannedCount = count;
    }

    void setSpreadSurvivorCount(std::size_t count)
    {
      mSpreadSurvivorCount = count;
    }

    void setFundamentalSurvivorCount(std::size_t count)
    {
      mFundamentalSurvivorCount = count;
    }

    void setInstitutionalSurvivorCount(std::size_t count)
    {
      mInstitutionalSurvivorCount = count;
    }

    void setTrendConfirmedCount(std::size_t count)
    {
      mTrendConfirmedCount = count;
    }

    void setCoilingSpringCount(std::size_t count)
    {
      mCoilingSpringCount = count;
    }

    void setBuyCount(std::size_t count)
    {
      mBuyCount = count;
    }

  private:
    std::size_t mScannedCount;
    std::size_t mSpreadSurvivorCount;
    std::size_t mFundamentalSurvivorCount;
    std::size_t mInstitutionalSurvivorCount;
    std::size_t mTrendConfirmedCount;
    std::size_t mCoilingSpringCount;
    std::size_t mBuyCount;
  };

  /**
   * @brief Everything a scan produces.
   */
  struct ScanResult
  {
    std::vector<Candidate> candidates;
    RationaleTrail trail;
    ScreeningSummary summary;
    // Keyed by ticker; one entry per Gate 2B survivor with a computable ATR.
    std::map<std::string, TradeMetadata> tradeMetadata;
  };

} // namespace swingscanner::screening
