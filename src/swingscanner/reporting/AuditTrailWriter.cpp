// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "reporting/AuditTrailWriter.h"
#include <fstream>
#include <sstream>
#include "reporting/CsvFormat.h"

namespace swingscanner::reporting
{
  namespace
  {
    // Rows for one instrument follow pipeline order
    const std::vector<std::string> kGateOrder{ screening::gate_names::SPREAD,
					       screening::gate_names::FUNDAMENTALS,
					       screening::gate_names::INSTITUTIONAL,
					       screening::gate_names::TECHNICALS,
					       screening::gate_names::EXECUTION };

    template <class Map, class Formatter>
    std::string joinPairs(const Map& values, Formatter format)
    {
      std::ostringstream oss;
      bool first = true;
      for (const auto& entry : values)
	{
	  if (!first)
	    oss << ";";
	  oss << entry.first << "=" << format(entry.second);
	  first = false;
	}
      return oss.str();
    }

    template <class Writer>
    void writeFile(const std::string& fileName, Writer writer)
    {
      std::ofstream out(fileName);
      if (!out.is_open())
	throw AuditTrailWriterException("Cannot open " + fileName + " for writing");

      writer(out);

      if (!out)
	throw AuditTrailWriterException("Error writing " + fileName);
    }
  }

  void AuditTrailWriter::writeTrail(std::ostream& out, const screening::RationaleTrail& trail)
  {
    out << "Ticker,Gate,Passed,Outcome,Reason,Metrics,Labels\n";

    for (const auto& instrument : trail.getEntries())
      for (const auto& gateName : kGateOrder)
	{
	  auto gate = instrument.second.find(gateName);
	  if (gate == instrument.second.end())
	    continue;

	  const screening::GateResult& result = gate->second;
	  out << quoteCsvField(instrument.first) << ","
	      << gateName << ","
	      << (result.passed() ? "true" : "false") << ","
	      << screening::toString(result.getOutcome()) << ","
	      << quoteCsvField(result.getReason()) << ","
	      << quoteCsvField(joinPairs(result.getMetrics(), [](double v) { return formatExact(v); })) << ","
	      << quoteCsvField(joinPairs(result.getLabels(), [](const std::string& v) { return v; })) << "\n";
	}
  }

  void AuditTrailWriter::writeCandidates(std::ostream& out, const std::vector<screening::Candidate>& candidates)
  {
    out << "Ticker,Status,Entry,Stop,Target,HoldingPeriod,RiskReward\n";

    for (const auto& candidate : candidates)
      {
	out << quoteCsvField(candidate.ticker) << "," << screening::toString(candidate.status) << ",";
	if (candidate.tradeMetadata)
	  {
	    const screening::TradeMetadata& trade = *candidate.tradeMetadata;
	    out << formatDecimal(trade.entry) << ","
		<< formatDecimal(trade.stop) << ","
		<< formatDecimal(trade.target) << ","
		<< quoteCsvField(trade.holdingPeriod) << ","
		<< trade.riskRewardLabel;
	  }
	else
	  out << ",,,,";
	out << "\n";
      }
  }

  void AuditTrailWriter::writeTrailFile(const std::string& fileName, const screening::RationaleTrail& trail)
  {
    writeFile(fileName, [&trail](std::ostream& out) { writeTrail(out, trail); });
  }

  void AuditTrailWriter::writeCandidatesFile(const std::string& fileName,
					     const std::vector<screening::Candidate>& candidates)
  {
    writeFile(fileName, [&candidates](std::ostream& out) { writeCandidates(out, candidates); });
  }

} // namespace swingscanner::reporting
