#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include "ParallelExecutors.h"
#include "ScannerConfiguration.h"
#include "input/BatchLoader.h"
#include "reporting/AuditTrailWriter.h"
#include "reporting/ScanReporter.h"
#include "screening/ScreeningPipeline.h"
#include "watchlist/Watchlist.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace swingscanner;

void printUsage(const po::options_description& desc) {
    std::cout << "SwingScanner - multi-gate equity swing screen\n\n";
    std::cout << "Usage: swingscanner [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # End-of-day scan\n";
    std::cout << "  swingscanner --universe universe.csv --fundamentals fundamentals.csv \\\n"
              << "               --benchmark NIFTY50.csv --tier-thresholds tiers.csv --output-dir logs\n\n";
    std::cout << "  # Intraday scan at 11:30\n";
    std::cout << "  swingscanner --universe universe.csv --tier-thresholds tiers.csv \\\n"
              << "               --benchmark NIFTY50.csv --as-of \"2024-06-14 11:30\"\n\n";
    std::cout << "  # Weekly watchlist digest\n";
    std::cout << "  swingscanner --aggregate-watchlists logs --reference-date 20240614\n";
}

// Scan date: the as-of date if given, else the most recent bar in the batch.
boost::gregorian::date scanDateFor(const screening::InstrumentBatch& batch) {
    if (batch.getAsOf()) {
        return batch.getAsOf()->date();
    }

    boost::gregorian::date latest;
    for (const auto& ticker : batch.getTickers()) {
        const screening::OHLCSeries& series = batch.getInstrument(ticker).getSeries();
        if (!series.isEmpty() && (latest.is_not_a_date() || latest < series.getLastDate())) {
            latest = series.getLastDate();
        }
    }

    return latest.is_not_a_date() ? boost::gregorian::day_clock::local_day() : latest;
}

std::unique_ptr<concurrency::IParallelExecutor> makeExecutor(unsigned int threads) {
    if (threads == 1) {
        return std::make_unique<concurrency::SingleThreadExecutor>();
    }
    return std::make_unique<concurrency::ThreadPoolExecutor>(threads);
}

int aggregateWatchlists(const std::string& directory, const po::variables_map& vm) {
    boost::gregorian::date referenceDate = boost::gregorian::day_clock::local_day();
    if (vm.count("reference-date")) {
        referenceDate = boost::gregorian::from_undelimited_string(vm["reference-date"].as<std::string>());
    }

    watchlist::WatchlistAggregator aggregator(directory, std::cout);
    std::vector<watchlist::WatchlistEntry> digest = aggregator.aggregate(referenceDate);
    std::string digestFile = aggregator.writeDigest(digest);

    std::cout << "Weekly digest written to " << digestFile << std::endl;
    for (const auto& entry : digest) {
        std::cout << "  " << entry.ticker << " (" << entry.daysOnWatchlist << " days) "
                  << entry.sector << " - " << entry.reason << std::endl;
    }
    return 0;
}

int runScan(const po::variables_map& vm) {
    if (!vm.count("universe")) {
        std::cerr << "Error: --universe is required for a scan" << std::endl;
        return 1;
    }
    if (!vm.count("tier-thresholds")) {
        std::cerr << "Error: --tier-thresholds is required for a scan" << std::endl;
        return 1;
    }

    std::optional<std::string> configFile;
    if (vm.count("config")) {
        configFile = vm["config"].as<std::string>();
    }

    ScannerConfiguration config =
        ScannerConfigurationFileReader::readConfiguration(configFile, vm["tier-thresholds"].as<std::string>());

    input::BatchLoaderOptions loadOptions;
    loadOptions.universeFile = vm["universe"].as<std::string>();
    if (vm.count("fundamentals")) {
        loadOptions.fundamentalsFile = vm["fundamentals"].as<std::string>();
    }
    if (vm.count("benchmark")) {
        loadOptions.benchmarkFile = vm["benchmark"].as<std::string>();
    }
    if (vm.count("as-of")) {
        loadOptions.asOf = input::BatchLoader::parseAsOf(vm["as-of"].as<std::string>());
    }

    input::BatchLoader loader(std::cout);
    screening::InstrumentBatch batch = loader.load(loadOptions);

    std::unique_ptr<concurrency::IParallelExecutor> executor = makeExecutor(vm["threads"].as<unsigned int>());
    std::cout << "Scanning " << batch.size() << " instruments with "
              << executor->getNumThreads() << " thread(s)" << std::endl;

    screening::ScreeningPipeline pipeline(config, *executor, std::cout);
    screening::ScanResult result = pipeline.run(batch);

    boost::gregorian::date scanDate = scanDateFor(batch);
    reporting::ScanReporter reporter;
    reporter.writeSummary(std::cout, result, batch, scanDate);

    if (vm.count("output-dir")) {
        fs::path outputDir(vm["output-dir"].as<std::string>());
        fs::create_directories(outputDir);

        std::string stamp = boost::gregorian::to_iso_string(scanDate);
        fs::path trailFile = outputDir / ("rationale_" + stamp + ".csv");
        fs::path candidatesFile = outputDir / ("candidates_" + stamp + ".csv");

        reporting::AuditTrailWriter::writeTrailFile(trailFile.string(), result.trail);
        reporting::AuditTrailWriter::writeCandidatesFile(candidatesFile.string(), result.candidates);

        watchlist::DailyWatchlistWriter watchlistWriter(outputDir.string());
        std::string watchlistFile =
            watchlistWriter.write(watchlist::buildWatchlistEntries(result, batch), scanDate);

        std::cout << "Rationale trail written to " << trailFile.string() << std::endl;
        std::cout << "Candidates written to " << candidatesFile.string() << std::endl;
        std::cout << "Daily watchlist written to " << watchlistFile << std::endl;
    }

    return 0;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("universe,u", po::value<std::string>(), "Universe CSV (Ticker,Sector,CapTier,InstitutionalPct,FreeFloatPct,PromoterPledgePct,DataPath)")
            ("fundamentals,f", po::value<std::string>(), "Fundamentals CSV with Current and Prior periods")
            ("benchmark,b", po::value<std::string>(), "Benchmark OHLCV CSV used for relative strength")
            ("config,c", po::value<std::string>(), "Scanner parameters CSV (Parameter,Value)")
            ("tier-thresholds,t", po::value<std::string>(), "Institutional thresholds CSV (Tier,MinInstitutionalPct,MinFreeFloatPct)")
            ("as-of", po::value<std::string>(), "As-of time of the last bar, e.g. \"2024-06-14 11:30\" (default: end of day)")
            ("output-dir,o", po::value<std::string>(), "Directory for rationale, candidate and watchlist files")
            ("threads", po::value<unsigned int>()->default_value(0), "Worker threads (0 = hardware concurrency, 1 = single threaded)")
            ("aggregate-watchlists", po::value<std::string>(), "Build the weekly digest from the daily watchlists in this directory")
            ("reference-date", po::value<std::string>(), "Reference date YYYYMMDD for the weekly digest (default: today)");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (vm.count("aggregate-watchlists")) {
            return aggregateWatchlists(vm["aggregate-watchlists"].as<std::string>(), vm);
        }

        return runScan(vm);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
