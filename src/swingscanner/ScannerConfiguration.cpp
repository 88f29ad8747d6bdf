// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ScannerConfiguration.h"
#include <algorithm>
#include <functional>
#include <type_traits>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include "csv.h"

namespace swingscanner
{
  namespace
  {
    template <class T>
    T tryCast(const std::string& name, const std::string& inputString)
    {
      try
	{
	  std::string trimmed = boost::algorithm::trim_copy(inputString);
	  if constexpr (std::is_unsigned<T>::value)
	    {
	      // lexical_cast wraps negative input for unsigned targets
	      long long signedValue = boost::lexical_cast<long long>(trimmed);
	      if (signedValue < 0)
		throw ScannerConfigurationException("Parameter " + name + " must not be negative");
	      return boost::numeric_cast<T>(signedValue);
	    }
	  else
	    return boost::lexical_cast<T>(trimmed);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw ScannerConfigurationException("Cannot convert value '" + inputString +
					      "' of parameter " + name);
	}
      catch (const boost::numeric::bad_numeric_cast&)
	{
	  throw ScannerConfigurationException("Cannot convert value '" + inputString +
					      "' of parameter " + name);
	}
    }

    boost::posix_time::time_duration parseTimeOfDay(const std::string& name, const std::string& value)
    {
      try
	{
	  std::string trimmed = boost::algorithm::trim_copy(value);
	  // HH:MM is accepted as well as HH:MM:SS
	  if (std::count(trimmed.begin(), trimmed.end(), ':') == 1)
	    trimmed += ":00";

	  boost::posix_time::time_duration result = boost::posix_time::duration_from_string(trimmed);
	  if (result.is_negative() || result >= boost::posix_time::hours(24))
	    throw ScannerConfigurationException("Parameter " + name + " must be a time of day, got " + value);
	  return result;
	}
      catch (const ScannerConfigurationException&)
	{
	  throw;
	}
      catch (const std::exception& e)
	{
	  throw ScannerConfigurationException("Cannot convert value '" + value + "' of parameter " +
					      name + ": " + e.what());
	}
    }

    void requireFile(const std::string& fileName, const std::string& description)
    {
      if (!boost::filesystem::exists(boost::filesystem::path(fileName)))
	throw ScannerConfigurationException(description + " " + fileName + " does not exist");
    }

    using Setter = std::function<void(ScannerParameters&, const std::string&, const std::string&)>;

    template <class T, class Config>
    Setter fieldSetter(Config ScannerParameters::*section, T Config::*field)
    {
      return [section, field](ScannerParameters& p, const std::string& name, const std::string& value)
	{
	  (p.*section).*field = tryCast<T>(name, value);
	};
    }

    const std::map<std::string, Setter>& parameterSetters()
    {
      static const std::map<std::string, Setter> setters = {
	{ "ROLLING_WINDOW", fieldSetter(&ScannerParameters::spread, &SpreadGateConfig::rollingWindow) },
	{ "MAX_SPREAD_Z_SCORE", fieldSetter(&ScannerParameters::spread, &SpreadGateConfig::maxSpreadZScore) },
	{ "MAX_ABS_SPREAD", fieldSetter(&ScannerParameters::spread, &SpreadGateConfig::maxAbsSpread) },

	{ "MIN_F_SCORE", fieldSetter(&ScannerParameters::fundamental, &FundamentalGateConfig::minFScore) },
	{ "MIN_CFO_PAT", fieldSetter(&ScannerParameters::fundamental, &FundamentalGateConfig::minCfoPat) },
	{ "MAX_PROMOTER_PLEDGE", fieldSetter(&ScannerParameters::fundamental, &FundamentalGateConfig::maxPromoterPledge) },

	{ "MA_SHORT", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::maShort) },
	{ "MA_MID", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::maMid) },
	{ "MA_LONG", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::maLong) },
	{ "MA_LONG_TREND_SESSIONS", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::maLongTrendSessions) },
	{ "ADX_PERIOD", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::adxPeriod) },
	{ "MIN_ADX", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::minAdx) },
	{ "RS_LOOKBACK_WEEKS", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::rsLookbackWeeks) },
	{ "RS_SLOPE_WEEKS", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::rsSlopeWeeks) },
	{ "MIN_MANSFIELD_SLOPE", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::minMansfieldSlope) },
	{ "VCP_SEGMENT_SESSIONS", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::vcpSegmentSessions) },
	{ "VCP_MAX_FINAL_DEPTH", fieldSetter(&ScannerParameters::technical, &TechnicalGateConfig::vcpMaxFinalDepth) },

	{ "VOL_AVG_DAYS", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::volAvgDays) },
	{ "MARKET_OPEN_MINUTES", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::marketOpenMinutes) },
	{ "VOL_PRORATE_FACTOR", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::volProrateFactor) },
	{ "ATR_PERIOD", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::atrPeriod) },
	{ "ATR_STOP_MULTIPLIER", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::atrStopMultiplier) },
	{ "MIN_RR_RATIO", fieldSetter(&ScannerParameters::execution, &ExecutionGateConfig::minRRRatio) },

	{ "SESSION_OPEN", [](ScannerParameters& p, const std::string& name, const std::string& value)
			  {
			    p.session.sessionOpen = parseTimeOfDay(name, value);
			  } }
      };

      return setters;
    }

    void requirePositive(unsigned int value, const std::string& name)
    {
      if (value == 0)
	throw ScannerConfigurationException(name + " must be positive");
    }

    void requirePositive(Num value, const std::string& name)
    {
      if (!(value > 0))
	throw ScannerConfigurationException(name + " must be positive");
    }
  }

  InstitutionalThresholdTable::InstitutionalThresholdTable(const std::map<CapTier, InstitutionalThreshold>& thresholds)
    : mThresholds(thresholds)
  {
    for (CapTier tier : { CapTier::Large, CapTier::Mid, CapTier::Small })
      {
	auto it = mThresholds.find(tier);
	if (it == mThresholds.end())
	  throw ScannerConfigurationException("Institutional threshold table has no entry for tier " +
					      screening::toString(tier));

	if (it->second.minInstitutionalPct < 0 || it->second.minFreeFloatPct < 0)
	  throw ScannerConfigurationException("Institutional thresholds for tier " +
					      screening::toString(tier) + " must not be negative");
      }
  }

  const InstitutionalThreshold& InstitutionalThresholdTable::getThreshold(CapTier tier) const
  {
    auto it = mThresholds.find(tier);
    if (it == mThresholds.end())
      throw ScannerConfigurationException("No institutional thresholds for tier " + screening::toString(tier));
    return it->second;
  }

  ScannerConfiguration::ScannerConfiguration(const ScannerParameters& parameters,
					     const InstitutionalThresholdTable& tierThresholds)
    : mParameters(parameters),
      mTierThresholds(tierThresholds)
  {
    validateParameters(mParameters);
  }

  void applyParameter(ScannerParameters& parameters,
		      const std::string& name,
		      const std::string& value)
  {
    std::string key = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
    const auto& setters = parameterSetters();

    auto it = setters.find(key);
    if (it == setters.end())
      throw ScannerConfigurationException("Unknown scanner parameter " + name);

    it->second(parameters, key, value);
  }

  void validateParameters(const ScannerParameters& p)
  {
    requirePositive(p.spread.rollingWindow, "ROLLING_WINDOW");
    requirePositive(p.spread.maxAbsSpread, "MAX_ABS_SPREAD");

    if (p.fundamental.minFScore > 9)
      throw ScannerConfigurationException("MIN_F_SCORE must be between 0 and 9");

    requirePositive(p.technical.maShort, "MA_SHORT");
    if (!(p.technical.maShort < p.technical.maMid && p.technical.maMid < p.technical.maLong))
      throw ScannerConfigurationException("Moving averages must satisfy MA_SHORT < MA_MID < MA_LONG");

    requirePositive(p.technical.maLongTrendSessions, "MA_LONG_TREND_SESSIONS");
    requirePositive(p.technical.adxPeriod, "ADX_PERIOD");
    requirePositive(p.technical.rsLookbackWeeks, "RS_LOOKBACK_WEEKS");
    if (p.technical.rsSlopeWeeks < 2)
      throw ScannerConfigurationException("RS_SLOPE_WEEKS must be at least 2");
    requirePositive(p.technical.vcpSegmentSessions, "VCP_SEGMENT_SESSIONS");

    requirePositive(p.execution.volAvgDays, "VOL_AVG_DAYS");
    requirePositive(p.execution.marketOpenMinutes, "MARKET_OPEN_MINUTES");
    requirePositive(p.execution.volProrateFactor, "VOL_PRORATE_FACTOR");
    requirePositive(p.execution.atrPeriod, "ATR_PERIOD");
    requirePositive(p.execution.atrStopMultiplier, "ATR_STOP_MULTIPLIER");
  }

  ScannerParameters ScannerConfigurationFileReader::readParametersFile(const std::string& fileName)
  {
    requireFile(fileName, "Scanner parameters file");

    ScannerParameters parameters;
    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> csvConfigFile(fileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column, "Parameter", "Value");

	std::string name, value;
	while (csvConfigFile.read_row(name, value))
	  {
	    if (name.empty())
	      continue;
	    applyParameter(parameters, name, value);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ScannerConfigurationException("Cannot read scanner parameters file " + fileName + ": " + e.what());
      }

    validateParameters(parameters);
    return parameters;
  }

  InstitutionalThresholdTable
  ScannerConfigurationFileReader::readTierThresholdsFile(const std::string& fileName)
  {
    requireFile(fileName, "Tier thresholds file");

    std::map<CapTier, InstitutionalThreshold> thresholds;
    try
      {
	io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> tiersCsv(fileName.c_str());
	tiersCsv.read_header(io::ignore_extra_column, "Tier", "MinInstitutionalPct", "MinFreeFloatPct");

	std::string tierString, institutionalString, floatString;
	while (tiersCsv.read_row(tierString, institutionalString, floatString))
	  {
	    std::optional<CapTier> tier = screening::parseCapTier(tierString);
	    if (!tier)
	      throw ScannerConfigurationException("Unknown cap tier '" + tierString + "' in " + fileName);

	    InstitutionalThreshold threshold;
	    threshold.minInstitutionalPct = tryCast<Num>("MinInstitutionalPct", institutionalString);
	    threshold.minFreeFloatPct = tryCast<Num>("MinFreeFloatPct", floatString);

	    if (!thresholds.emplace(*tier, threshold).second)
	      throw ScannerConfigurationException("Duplicate cap tier '" + tierString + "' in " + fileName);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ScannerConfigurationException("Cannot read tier thresholds file " + fileName + ": " + e.what());
      }

    return InstitutionalThresholdTable(thresholds);
  }

  ScannerConfiguration
  ScannerConfigurationFileReader::readConfiguration(const std::optional<std::string>& parametersFile,
						    const std::string& tierThresholdsFile)
  {
    ScannerParameters parameters;
    if (parametersFile && !parametersFile->empty())
      parameters = readParametersFile(*parametersFile);

    return ScannerConfiguration(parameters, readTierThresholdsFile(tierThresholdsFile));
  }

} // namespace swingscanner
