// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "input/BatchLoader.h"
#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "TimeSeriesCsvReader.h"
#include "csv.h"

namespace swingscanner::input
{
  using screening::FundamentalsPeriod;
  using screening::FundamentalsSnapshot;
  using screening::Instrument;
  using screening::OHLCSeries;

  namespace
  {
    std::optional<Num> parseOptional(const std::string& fileName,
				     unsigned int lineNo,
				     const std::string& column,
				     const std::string& text)
    {
      std::string trimmed = boost::algorithm::trim_copy(text);
      if (trimmed.empty())
	return std::nullopt;

      try
	{
	  return boost::lexical_cast<Num>(trimmed);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) + ": invalid " +
				     column + " value '" + text + "'");
	}
    }

    void requireFile(const std::string& fileName, const std::string& description)
    {
      if (!boost::filesystem::exists(fileName))
	throw BatchLoaderException(description + " " + fileName + " does not exist");
    }

    std::string resolvePath(const std::string& dataPath, const std::string& universeFile)
    {
      boost::filesystem::path path(dataPath);
      if (path.is_absolute())
	return path.string();

      return (boost::filesystem::path(universeFile).parent_path() / path).string();
    }
  }

  BatchLoader::BatchLoader(std::ostream& log)
    : mLog(log)
  {}

  std::vector<UniverseRow> BatchLoader::readUniverse(const std::string& fileName)
  {
    requireFile(fileName, "Universe file");

    std::vector<UniverseRow> rows;
    try
      {
	io::CSVReader<7, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> universeCsv(fileName.c_str());
	universeCsv.read_header(io::ignore_extra_column, "Ticker", "Sector", "CapTier", "InstitutionalPct",
				"FreeFloatPct", "PromoterPledgePct", "DataPath");

	std::string ticker, sector, capTier, institutional, freeFloat, pledge, dataPath;
	while (universeCsv.read_row(ticker, sector, capTier, institutional, freeFloat, pledge, dataPath))
	  {
	    const unsigned int lineNo = universeCsv.get_file_line();
	    if (ticker.empty())
	      throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) + ": empty ticker");
	    if (dataPath.empty())
	      throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) + ": no data path for " + ticker);

	    UniverseRow row;
	    row.ticker = ticker;
	    row.sector = sector;
	    row.capTier = screening::parseCapTier(capTier);
	    row.institutional.institutionalOwnershipPct = parseOptional(fileName, lineNo, "InstitutionalPct", institutional);
	    row.institutional.freeFloatPct = parseOptional(fileName, lineNo, "FreeFloatPct", freeFloat);
	    row.promoterPledgePct = parseOptional(fileName, lineNo, "PromoterPledgePct", pledge);
	    row.dataPath = resolvePath(dataPath, fileName);
	    rows.push_back(std::move(row));
	  }
      }
    catch (const io::error::base& e)
      {
	throw BatchLoaderException("Cannot read universe file " + fileName + ": " + e.what());
      }

    return rows;
  }

  std::map<std::string, FundamentalsSnapshot> BatchLoader::readFundamentals(const std::string& fileName)
  {
    requireFile(fileName, "Fundamentals file");

    std::map<std::string, FundamentalsSnapshot> fundamentals;
    std::map<std::string, std::pair<bool, bool>> seen;

    try
      {
	io::CSVReader<11, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> fundamentalsCsv(fileName.c_str());
	fundamentalsCsv.read_header(io::ignore_extra_column, "Ticker", "Period", "NetIncome", "CFO", "TotalAssets",
				    "CurrentAssets", "CurrentLiabilities", "LongTermDebt", "SharesOutstanding",
				    "Revenue", "GrossProfit");

	std::string ticker, period, netIncome, cfo, totalAssets, currentAssets, currentLiabilities;
	std::string longTermDebt, shares, revenue, grossProfit;

	while (fundamentalsCsv.read_row(ticker, period, netIncome, cfo, totalAssets, currentAssets,
					currentLiabilities, longTermDebt, shares, revenue, grossProfit))
	  {
	    const unsigned int lineNo = fundamentalsCsv.get_file_line();
	    if (ticker.empty())
	      throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) + ": empty ticker");

	    std::string periodKey = boost::algorithm::to_upper_copy(period);
	    bool isCurrent = (periodKey == "CURRENT");
	    if (!isCurrent && periodKey != "PRIOR")
	      throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) +
					 ": period must be Current or Prior, got '" + period + "'");

	    auto& flags = seen[ticker];
	    bool& already = isCurrent ? flags.first : flags.second;
	    if (already)
	      throw BatchLoaderException(fileName + ": line " + std::to_string(lineNo) + ": duplicate " +
					 period + " period for " + ticker);
	    already = true;

	    FundamentalsSnapshot& snapshot = fundamentals[ticker];
	    FundamentalsPeriod& target = isCurrent ? snapshot.current : snapshot.prior;
	    target.netIncome = parseOptional(fileName, lineNo, "NetIncome", netIncome);
	    target.cashFlowFromOperations = parseOptional(fileName, lineNo, "CFO", cfo);
	    target.totalAssets = parseOptional(fileName, lineNo, "TotalAssets", totalAssets);
	    target.currentAssets = parseOptional(fileName, lineNo, "CurrentAssets", currentAssets);
	    target.currentLiabilities = parseOptional(fileName, lineNo, "CurrentLiabilities", currentLiabilities);
	    target.longTermDebt = parseOptional(fileName, lineNo, "LongTermDebt", longTermDebt);
	    target.sharesOutstanding = parseOptional(fileName, lineNo, "SharesOutstanding", shares);
	    target.revenue = parseOptional(fileName, lineNo, "Revenue", revenue);
	    target.grossProfit = parseOptional(fileName, lineNo, "GrossProfit", grossProfit);
	  }
      }
    catch (const io::error::base& e)
      {
	throw BatchLoaderException("Cannot read fundamentals file " + fileName + ": " + e.what());
      }

    return fundamentals;
  }

  OHLCSeries BatchLoader::readPriceSeries(const std::string& fileName)
  {
    swing_timeseries::OHLCVCsvReader<Num> reader(fileName);
    reader.readFile();
    return *reader.getTimeSeries();
  }

  OHLCSeries BatchLoader::readSeriesOrEmpty(const std::string& ticker, const std::string& fileName) const
  {
    try
      {
	return readPriceSeries(fileName);
      }
    catch (const std::exception& e)
      {
	mLog << "Warning: cannot read price data for " << ticker << " from " << fileName << ": " << e.what() << "\n";
      }

    return OHLCSeries();
  }

  boost::posix_time::ptime BatchLoader::parseAsOf(const std::string& text)
  {
    std::string trimmed = boost::algorithm::trim_copy(text);
    try
      {
	if (trimmed.find('T') != std::string::npos)
	  return boost::posix_time::from_iso_string(trimmed);

	// HH:MM is accepted as well as HH:MM:SS
	if (std::count(trimmed.begin(), trimmed.end(), ':') == 1)
	  trimmed += ":00";
	return boost::posix_time::time_from_string(trimmed);
      }
    catch (const std::exception& e)
      {
	throw BatchLoaderException("Invalid as-of time '" + text + "': " + e.what());
      }
  }

  screening::InstrumentBatch BatchLoader::load(const BatchLoaderOptions& options) const
  {
    std::vector<UniverseRow> universe = readUniverse(options.universeFile);

    std::map<std::string, FundamentalsSnapshot> fundamentals;
    if (options.fundamentalsFile)
      fundamentals = readFundamentals(*options.fundamentalsFile);

    for (const auto& entry : fundamentals)
      {
	bool inUniverse = std::any_of(universe.begin(), universe.end(),
				      [&entry](const UniverseRow& row) { return row.ticker == entry.first; });
	if (!inUniverse)
	  mLog << "Warning: fundamentals for " << entry.first << " ignored, ticker not in universe\n";
      }

    std::vector<Instrument> instruments;
    instruments.reserve(universe.size());

    for (const auto& row : universe)
      {
	FundamentalsSnapshot snapshot;
	auto it = fundamentals.find(row.ticker);
	if (it != fundamentals.end())
	  snapshot = it->second;
	snapshot.promoterPledgePct = row.promoterPledgePct;

	instruments.emplace_back(row.ticker,
				 readSeriesOrEmpty(row.ticker, row.dataPath),
				 row.sector,
				 row.capTier,
				 snapshot,
				 row.institutional);
      }

    std::shared_ptr<const OHLCSeries> benchmark;
    if (options.benchmarkFile)
      {
	try
	  {
	    benchmark = std::make_shared<const OHLCSeries>(readPriceSeries(*options.benchmarkFile));
	  }
	catch (const std::exception& e)
	  {
	    throw BatchLoaderException("Cannot read benchmark file " + *options.benchmarkFile + ": " + e.what());
	  }
      }

    mLog << "Loaded " << instruments.size() << " instruments from " << options.universeFile << "\n";

    try
      {
	return screening::InstrumentBatch(std::move(instruments), benchmark, options.asOf);
      }
    catch (const std::invalid_argument& e)
      {
	throw BatchLoaderException(options.universeFile + ": " + e.what());
      }
  }

} // namespace swingscanner::input
