// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "watchlist/Watchlist.h"
#include <algorithm>
#include <fstream>
#include <map>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "reporting/CsvFormat.h"

namespace swingscanner::watchlist
{
  using reporting::quoteCsvField;
  using reporting::formatDecimal;
  using reporting::formatOptional;

  namespace
  {
    const std::string kDailyPrefix = "watchlist_daily_";
    const std::string kCsvSuffix = ".csv";

    void writeEntry(std::ostream& out, const WatchlistEntry& entry)
    {
      out << quoteCsvField(entry.ticker) << ","
	  << quoteCsvField(entry.sector) << ","
	  << entry.capTier << ","
	  << formatDecimal(entry.close) << ","
	  << formatOptional(entry.institutionalPct) << ","
	  << quoteCsvField(entry.reason);
    }

    Num parseNumber(const std::string& fileName, const std::string& column, const std::string& text)
    {
      try
	{
	  return boost::lexical_cast<Num>(boost::algorithm::trim_copy(text));
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw WatchlistException(fileName + ": invalid " + column + " value '" + text + "'");
	}
    }
  }

  std::vector<WatchlistEntry> buildWatchlistEntries(const screening::ScanResult& result,
						    const screening::InstrumentBatch& batch)
  {
    std::vector<WatchlistEntry> entries;

    for (const auto& candidate : result.candidates)
      {
	if (candidate.status != screening::CandidateStatus::CoilingSpring)
	  continue;

	const screening::Instrument& instrument = batch.getInstrument(candidate.ticker);

	WatchlistEntry entry;
	entry.ticker = candidate.ticker;
	entry.sector = instrument.getSector();
	entry.capTier = screening::toString(instrument.getEffectiveCapTier());
	if (!instrument.getSeries().isEmpty())
	  entry.close = instrument.getSeries().getLastEntry().getCloseValue();
	entry.institutionalPct = instrument.getInstitutional().institutionalOwnershipPct;
	if (result.trail.contains(candidate.ticker, screening::gate_names::TECHNICALS))
	  entry.reason = result.trail.getResult(candidate.ticker, screening::gate_names::TECHNICALS).getReason();

	entries.push_back(std::move(entry));
      }

    return entries;
  }

  DailyWatchlistWriter::DailyWatchlistWriter(const std::string& directory)
    : mDirectory(directory)
  {}

  std::string DailyWatchlistWriter::fileNameFor(const boost::gregorian::date& scanDate)
  {
    return kDailyPrefix + boost::gregorian::to_iso_string(scanDate) + kCsvSuffix;
  }

  std::optional<boost::gregorian::date> DailyWatchlistWriter::dateFromFileName(const std::string& fileName)
  {
    std::string name = boost::filesystem::path(fileName).filename().string();
    if (!boost::algorithm::starts_with(name, kDailyPrefix) || !boost::algorithm::ends_with(name, kCsvSuffix))
      return std::nullopt;

    std::string stamp = name.substr(kDailyPrefix.size(), name.size() - kDailyPrefix.size() - kCsvSuffix.size());
    if (stamp.size() != 8 || !std::all_of(stamp.begin(), stamp.end(), [](char c) { return c >= '0' && c <= '9'; }))
      return std::nullopt;

    try
      {
	return boost::gregorian::from_undelimited_string(stamp);
      }
    catch (const std::out_of_range&)
      {
	// digits that do not form a calendar date
	return std::nullopt;
      }
  }

  std::string DailyWatchlistWriter::write(const std::vector<WatchlistEntry>& entries,
					  const boost::gregorian::date& scanDate) const
  {
    boost::filesystem::path path = boost::filesystem::path(mDirectory) / fileNameFor(scanDate);

    std::ofstream out(path.string());
    if (!out.is_open())
      throw WatchlistException("Cannot open watchlist file " + path.string() + " for writing");

    out << "Ticker,Sector,CapTier,Close,InstitutionalPct,Reason\n";
    for (const auto& entry : entries)
      {
	writeEntry(out, entry);
	out << "\n";
      }

    if (!out)
      throw WatchlistException("Error writing watchlist file " + path.string());

    return path.string();
  }

  std::vector<WatchlistEntry> DailyWatchlistWriter::read(const std::string& fileName)
  {
    std::vector<WatchlistEntry> entries;
    try
      {
	io::CSVReader<6, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> watchlistCsv(fileName.c_str());
	watchlistCsv.read_header(io::ignore_extra_column, "Ticker", "Sector", "CapTier", "Close",
				 "InstitutionalPct", "Reason");

	std::string ticker, sector, capTier, close, institutional, reason;
	while (watchlistCsv.read_row(ticker, sector, capTier, close, institutional, reason))
	  {
	    WatchlistEntry entry;
	    entry.ticker = ticker;
	    entry.sector = sector;
	    entry.capTier = capTier;
	    entry.close = parseNumber(fileName, "Close", close);
	    if (!institutional.empty())
	      entry.institutionalPct = parseNumber(fileName, "InstitutionalPct", institutional);
	    entry.reason = reason;
	    entries.push_back(std::move(entry));
	  }
      }
    catch (const io::error::base& e)
      {
	throw WatchlistException("Cannot read watchlist file " + fileName + ": " + e.what());
      }

    return entries;
  }

  WatchlistAggregator::WatchlistAggregator(const std::string& directory,
					   std::ostream& log,
					   unsigned int lookbackDays,
					   unsigned int minOccurrences)
    : mDirectory(directory),
      mLog(log),
      mLookbackDays(lookbackDays),
      mMinOccurrences(minOccurrences)
  {
    if (mLookbackDays == 0)
      throw WatchlistException("Watchlist lookback must cover at least one day");
  }

  std::vector<WatchlistEntry> WatchlistAggregator::aggregate(const boost::gregorian::date& referenceDate) const
  {
    if (!boost::filesystem::is_directory(mDirectory))
      throw WatchlistException("Watchlist directory " + mDirectory + " does not exist");

    // lookbackDays calendar days ending on the reference date
    const boost::gregorian::date cutoff = referenceDate - boost::gregorian::days(mLookbackDays - 1);

    // Oldest first so that later files overwrite the carried entry
    std::map<boost::gregorian::date, std::string> dailyFiles;
    for (boost::filesystem::directory_iterator it(mDirectory), end; it != end; ++it)
      {
	if (!boost::filesystem::is_regular_file(it->path()))
	  continue;

	std::optional<boost::gregorian::date> fileDate = DailyWatchlistWriter::dateFromFileName(it->path().string());
	if (fileDate && *fileDate >= cutoff && *fileDate <= referenceDate)
	  dailyFiles.emplace(*fileDate, it->path().string());
      }

    if (dailyFiles.empty())
      {
	mLog << "Warning: no daily watchlists in " << mDirectory << " for the "
	     << mLookbackDays << " days ending " << boost::gregorian::to_simple_string(referenceDate) << "\n";
	return {};
      }

    mLog << "Aggregating " << dailyFiles.size() << " daily watchlists\n";

    std::map<std::string, WatchlistEntry> latest;
    std::map<std::string, unsigned int> counts;

    for (const auto& dailyFile : dailyFiles)
      {
	std::vector<WatchlistEntry> entries;
	try
	  {
	    entries = DailyWatchlistWriter::read(dailyFile.second);
	  }
	catch (const WatchlistException& e)
	  {
	    mLog << "Warning: skipping " << dailyFile.second << ": " << e.what() << "\n";
	    continue;
	  }

	for (auto& entry : entries)
	  {
	    ++counts[entry.ticker];
	    latest[entry.ticker] = std::move(entry);
	  }
      }

    std::vector<WatchlistEntry> digest;
    for (const auto& count : counts)
      {
	if (count.second < mMinOccurrences)
	  continue;

	WatchlistEntry entry = latest[count.first];
	entry.daysOnWatchlist = count.second;
	digest.push_back(std::move(entry));
      }

    std::sort(digest.begin(), digest.end(),
	      [](const WatchlistEntry& lhs, const WatchlistEntry& rhs) {
		if (lhs.daysOnWatchlist != rhs.daysOnWatchlist)
		  return lhs.daysOnWatchlist > rhs.daysOnWatchlist;
		return lhs.ticker < rhs.ticker;
	      });

    mLog << "Found " << digest.size() << " instruments on at least " << mMinOccurrences << " daily watchlists\n";
    return digest;
  }

  std::string WatchlistAggregator::writeDigest(const std::vector<WatchlistEntry>& digest,
					       const std::string& fileName) const
  {
    boost::filesystem::path path = boost::filesystem::path(mDirectory) / fileName;

    std::ofstream out(path.string());
    if (!out.is_open())
      throw WatchlistException("Cannot open digest file " + path.string() + " for writing");

    out << "Ticker,Sector,CapTier,Close,InstitutionalPct,Reason,DaysOnWatchlist\n";
    for (const auto& entry : digest)
      {
	writeEntry(out, entry);
	out << "," << entry.daysOnWatchlist << "\n";
      }

    if (!out)
      throw WatchlistException("Error writing digest file " + path.string());

    return path.string();
  }

} // namespace swingscanner::watchlist
