// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "screening/ScreeningTypes.h"

namespace swingscanner
{
  using screening::Num;
  using screening::CapTier;

  class ScannerConfigurationException : public std::runtime_error
  {
  public:
    ScannerConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~ScannerConfigurationException()
    {}
  };

  struct SpreadGateConfig
  {
    unsigned int rollingWindow{20};
    Num maxSpreadZScore{2.0};
    // Exclusive cap: a spread equal to this value fails.
    Num maxAbsSpread{0.5};
  };

  struct FundamentalGateConfig
  {
    unsigned int minFScore{4};
    Num minCfoPat{0.5};
    Num maxPromoterPledge{5.0};
  };

  struct TechnicalGateConfig
  {
    unsigned int maShort{50};
    unsigned int maMid{150};
    unsigned int maLong{200};
    unsigned int maLongTrendSessions{20};
    unsigned int adxPeriod{14};
    Num minAdx{10.0};
    unsigned int rsLookbackWeeks{52};
    unsigned int rsSlopeWeeks{4};
    Num minMansfieldSlope{0.01};
    unsigned int vcpSegmentSessions{10};
    Num vcpMaxFinalDepth{0.10};
  };

  struct ExecutionGateConfig
  {
    unsigned int volAvgDays{20};
    unsigned int marketOpenMinutes{375};
    Num volProrateFactor{0.85};
    unsigned int atrPeriod{14};
    Num atrStopMultiplier{2.0};
    Num minRRRatio{2.0};
  };

  struct SessionConfig
  {
    boost::posix_time::time_duration sessionOpen{9, 15, 0};
  };

  // All tunables apart from the institutional threshold table.
  struct ScannerParameters
  {
    SpreadGateConfig spread;
    FundamentalGateConfig fundamental;
    TechnicalGateConfig technical;
    ExecutionGateConfig execution;
    SessionConfig session;
  };

  struct InstitutionalThreshold
  {
    Num minInstitutionalPct{0};
    Num minFreeFloatPct{0};
  };

  /**
   * @brief Per cap tier institutional ownership and free float minimums.
   *
   * There are no built-in values; every tier must be supplied.
   */
  class InstitutionalThresholdTable
  {
  public:
    // Throws ScannerConfigurationException if a tier is missing or a value is negative.
    explicit InstitutionalThresholdTable(const std::map<CapTier, InstitutionalThreshold>& thresholds);

    const InstitutionalThreshold& getThreshold(CapTier tier) const;

  private:
    std::map<CapTier, InstitutionalThreshold> mThresholds;
  };

  class ScannerConfiguration
  {
  public:
    ScannerConfiguration(const ScannerParameters& parameters,
			 const InstitutionalThresholdTable& tierThresholds);

    const SpreadGateConfig& getSpreadConfig() const
    {
      return mParameters.spread;
    }

    const FundamentalGateConfig& getFundamentalConfig() const
    {
      return mParameters.fundamental;
    }

    const TechnicalGateConfig& getTechnicalConfig() const
    {
      return mParameters.technical;
    }

    const ExecutionGateConfig& getExecutionConfig() const
    {
      return mParameters.execution;
    }

    const SessionConfig& getSessionConfig() const
    {
      return mParameters.session;
    }

    const InstitutionalThresholdTable& getTierThresholds() const
    {
      return mTierThresholds;
    }

  private:
    ScannerParameters mParameters;
    InstitutionalThresholdTable mTierThresholds;
  };

  // Sets the parameter named by its upper-case key (e.g. MIN_F_SCORE).
  // Throws ScannerConfigurationException for unknown names or bad values.
  void applyParameter(ScannerParameters& parameters,
		      const std::string& name,
		      const std::string& value);

  // Throws ScannerConfigurationException for inconsistent settings.
  void validateParameters(const ScannerParameters& parameters);

  /**
   * @brief Reads the scanner's CSV configuration files.
   *
   * Parameters file:        Parameter,Value
   * Tier thresholds file:   Tier,MinInstitutionalPct,MinFreeFloatPct
   */
  class ScannerConfigurationFileReader
  {
  public:
    static ScannerParameters readParametersFile(const std::string& fileName);
    static InstitutionalThresholdTable readTierThresholdsFile(const std::string& fileName);

    // Defaults are used when parametersFile is empty.
    static ScannerConfiguration readConfiguration(const std::optional<std::string>& parametersFile,
						  const std::string& tierThresholdsFile);
  };

} // namespace swingscanner
