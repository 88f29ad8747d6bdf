// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <string>
#include <vector>
#include "ScannerConfiguration.h"
#include "screening/gates/ScreeningGate.h"

namespace swingscanner::screening::gates
{
  inline const std::string UNKNOWN_SECTOR = "Unknown";

  // Standard deviations at or below this are treated as zero.
  constexpr double kDegenerateStdDev = 1e-12;

  /**
   * @brief Spread statistics of one sector peer group.
   */
  struct SectorSpreadStats
  {
    std::size_t count{0};
    Num mean{0};
    Num stdDev{0};
    bool degenerate{true};
    std::string degenerateReason;
  };

  /**
   * @brief Immutable sector -> spread statistics lookup.
   *
   * Built once per scan after every spread is known; read concurrently by the
   * z-score pass.
   */
  class SectorSpreadTable
  {
  public:
    explicit SectorSpreadTable(std::map<std::string, SectorSpreadStats> stats);

    // Population statistics per sector; the Unknown sector is always degenerate.
    static SectorSpreadTable build(const std::map<std::string, std::vector<Num>>& spreadsBySector);

    // Statistics for a sector with a degenerate flag computed the same way build() does.
    static SectorSpreadStats makeStats(const std::string& sector,
				       std::size_t count,
				       Num mean,
				       Num stdDev);

    bool contains(const std::string& sector) const;

    // Throws std::out_of_range for sectors that are not in the table.
    const SectorSpreadStats& getStats(const std::string& sector) const;

    // Throws DegenerateGroupException when the sector cannot support a z-score.
    Num zScore(const std::string& sector, Num spread) const;

    std::size_t getNumSectors() const
    {
      return mStats.size();
    }

  private:
    std::map<std::string, SectorSpreadStats> mStats;
  };

  /**
   * @brief Gate 1: rejects sector-anomalous bid/ask-proxy spreads.
   *
   * Pass 1 computes each instrument's mean (High - Low) / Close over the
   * trailing window. The sector table is then reduced from all valid spreads,
   * and pass 2 applies z <= MAX_SPREAD_Z_SCORE together with the exclusive
   * absolute cap spread < MAX_ABS_SPREAD.
   */
  class SpreadQualityGate : public ScreeningGate
  {
  public:
    explicit SpreadQualityGate(const SpreadGateConfig& config);

    const std::string& getName() const override;

    GateStageResult execute(const std::vector<std::string>& tickers,
			    const GateContext& ctx,
			    concurrency::IParallelExecutor& executor,
			    std::ostream& os) const override;

    // Spread of a single instrument. Throws InsufficientHistoryException or ComputeException.
    Num computeSpread(const Instrument& instrument) const;

    // Pass 2 decision for a spread that has already been computed.
    GateResult evaluateSpread(Num spread,
			      const std::string& sector,
			      const SectorSpreadTable& table) const;

    static std::string sectorKey(const Instrument& instrument);

  private:
    SpreadGateConfig mConfig;
  };

} // namespace swingscanner::screening::gates
