// REVGUARD Simulator - Main Entry Point
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// revguard-sim runs a guarantee scenario script against an in-process pool,
// collateral token and venue engines. Time is simulated; the script moves it
// with `advance`. With -persist the final pool and engine state is written to
// the ledger store under the data directory.

#include "revguard/guarantee/params.h"
#include "revguard/sim/scenario.h"
#include "revguard/store/ledger_store.h"
#include "revguard/util/config.h"
#include "revguard/util/logging.h"
#include "revguard/util/time.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace revguard {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "REVGUARD Simulator";

// ============================================================================
// Default Configuration Values
// ============================================================================

namespace defaults {
    constexpr const char* DATADIR = ".revguard";
    constexpr const char* LOG_FILENAME = "sim.log";
    constexpr const char* LEDGER_DIRNAME = "ledger";
    constexpr const char* ADMIN_LABEL = "admin";
    constexpr const char* LOG_LEVEL = "info";
}

// ============================================================================
// Simulator Configuration
// ============================================================================

struct SimConfig {
    // === Input ===
    std::string scriptPath;  // empty or "-" reads stdin
    std::string configFile;
    std::string dataDir{defaults::DATADIR};

    // === Scenario ===
    std::string adminLabel{defaults::ADMIN_LABEL};
    int64_t startTime{0};  // 0 seeds mock time from the wall clock
    guarantee::ProtocolParams params;

    // === Persistence ===
    bool persist{false};

    // === Logging ===
    util::LogLevel logLevel{util::LogLevel::Info};
    std::vector<std::string> logCategories;  // empty logs every category
    bool printToConsole{true};
    bool logToFile{false};
    std::string logFile;
};

void PrintUsage() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: revguard-sim [options] [script]\n\n"
              << "Options:\n"
              << "  -conf=<file>          Configuration file (default: <datadir>/"
              << util::DEFAULT_CONFIG_FILENAME << ")\n"
              << "  -datadir=<dir>        Data directory (default: " << defaults::DATADIR << ")\n"
              << "  -script=<file>        Scenario script; '-' reads stdin\n"
              << "  -admin=<label>        Admin account of every engine (default: "
              << defaults::ADMIN_LABEL << ")\n"
              << "  -starttime=<unix>     Initial simulated time\n"
              << "  -persist              Save final state to <datadir>/"
              << defaults::LEDGER_DIRNAME << "\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error, fatal, off\n"
              << "  -debug=<categories>   Comma-separated: pool, engine, asset, vault, store,\n"
              << "                        config, sim (default: all)\n"
              << "  -printtoconsole=<0|1> Log to console (default: 1)\n"
              << "  -logfile=<file>       Also log to file (default: <datadir>/"
              << defaults::LOG_FILENAME << " when set without a value)\n"
              << "  -protocol.periodlength=<seconds>\n"
              << "  -protocol.protocolfeebps=<bps>\n"
              << "  -protocol.treasury=<hex or label>\n"
              << "  -help, -version\n";
}

/// First argument that is not an option
std::string FindPositional(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-" || (!arg.empty() && arg[0] != '-')) {
            return arg;
        }
    }
    return "";
}

/// Load file and command-line settings; returns false if the program should exit
bool LoadConfig(int argc, char* argv[], SimConfig& config, int& exitCode) {
    auto fail = [&exitCode](const std::string& message) {
        std::cerr << "Error: " << message << std::endl;
        exitCode = 1;
        return false;
    };

    util::Settings args;
    auto result = args.LoadArgs(argc, argv);
    if (!result.ok) {
        return fail(result.ToString());
    }
    if (args.GetBool("help", false) || args.GetBool("h", false)) {
        PrintUsage();
        exitCode = 0;
        return false;
    }
    if (args.GetBool("version", false)) {
        std::cout << CLIENT_NAME << " v" << VERSION << std::endl;
        exitCode = 0;
        return false;
    }

    config.dataDir = args.GetString("datadir", config.dataDir);

    // File settings first, then the command line again so it takes precedence
    util::Settings settings;
    auto confPath = args.Get("conf");
    std::filesystem::path path = confPath
        ? std::filesystem::path(*confPath)
        : std::filesystem::path(config.dataDir) / util::DEFAULT_CONFIG_FILENAME;
    if (confPath || std::filesystem::exists(path)) {
        result = settings.LoadFile(path.string());
        if (!result.ok) {
            return fail(result.ToString());
        }
        config.configFile = path.string();
    }
    result = settings.LoadArgs(argc, argv);
    if (!result.ok) {
        return fail(result.ToString());
    }

    result = guarantee::LoadProtocolParams(settings, config.params);
    if (!result.ok) {
        return fail(result.ToString());
    }

    config.scriptPath = settings.GetString("script", FindPositional(argc, argv));
    config.adminLabel = settings.GetString("admin", config.adminLabel);
    config.persist = settings.GetBool("persist", false);
    config.printToConsole = settings.GetBool("printtoconsole", true);

    if (settings.Has("starttime")) {
        auto startTime = settings.GetInt("starttime");
        if (!startTime || *startTime < 0) {
            return fail("-starttime must be a non-negative unix time (" +
                        settings.Origin("starttime") + ")");
        }
        config.startTime = *startTime;
    }

    std::string levelName = settings.GetString("loglevel", defaults::LOG_LEVEL);
    auto level = util::ParseLogLevel(levelName);
    if (!level) {
        return fail("unknown log level '" + levelName + "'");
    }
    config.logLevel = *level;

    std::istringstream categories(settings.GetString("debug", ""));
    for (std::string category; std::getline(categories, category, ',');) {
        if (category.empty()) {
            continue;
        }
        if (!util::IsKnownCategory(category)) {
            return fail("unknown log category '" + category + "'");
        }
        config.logCategories.push_back(category);
    }

    if (auto logFile = settings.Get("logfile")) {
        config.logToFile = true;
        config.logFile = (*logFile == "true" || logFile->empty())
            ? (std::filesystem::path(config.dataDir) / defaults::LOG_FILENAME).string()
            : *logFile;
    }
    return true;
}

void SetupLogging(const SimConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(config.logLevel);
    logger.SetCategories(config.logCategories);

    // Script output owns stdout
    if (config.printToConsole) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(config.logLevel, true));
    }

    if (config.logToFile) {
        std::filesystem::path logPath(config.logFile);
        if (logPath.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(logPath.parent_path(), ec);
        }
        auto fileSink = std::make_shared<util::FileSink>(config.logFile);
        if (!fileSink->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << config.logFile << std::endl;
        } else {
            logger.AddSink(fileSink);
        }
    }
}

/// Write the final pool and engine state to the ledger store
bool PersistState(const SimConfig& config, sim::Scenario& scenario) {
    std::filesystem::path ledgerPath =
        std::filesystem::path(config.dataDir) / defaults::LEDGER_DIRNAME;
    auto [status, store] = store::LedgerStore::Open(ledgerPath);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Failed to open ledger store at "
                                            << ledgerPath.string() << ": " << status.ToString();
        return false;
    }

    status = store->SavePool(scenario.Pool().ExportState());
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "Failed to save pool: " << status.ToString();
        return false;
    }
    for (VenueId id : scenario.Venues()) {
        status = store->SaveEngine(scenario.Engine(id).ExportState());
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::STORE) << "Failed to save engine " << id << ": "
                                                << status.ToString();
            return false;
        }
    }
    LOG_INFO(util::LogCategory::STORE) << "Saved pool and " << scenario.Venues().size()
                                       << " engine(s) to " << ledgerPath.string();
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    SimConfig config;
    int exitCode = 0;
    if (!LoadConfig(argc, argv, config, exitCode)) {
        return exitCode;
    }

    SetupLogging(config);

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting";
    if (!config.configFile.empty()) {
        LOG_INFO(util::LogCategory::CONFIG) << "Loaded " << config.configFile;
    }
    LOG_INFO(util::LogCategory::CONFIG) << "Period length " << config.params.periodLength
                                        << "s, protocol fee " << config.params.protocolFeeBps
                                        << " bps";

    if (config.startTime > 0) {
        util::SetMockTime(config.startTime);
    }
    util::EnableMockTime();

    sim::Scenario scenario(config.params, config.adminLabel, std::cout);
    sim::ScriptResult result;
    if (config.scriptPath.empty() || config.scriptPath == "-") {
        result = scenario.Run(std::cin);
    } else {
        std::ifstream file(config.scriptPath);
        if (!file) {
            LOG_ERROR(util::LogCategory::SIM) << "Cannot open script " << config.scriptPath;
            util::Logger::Instance().Shutdown();
            return 1;
        }
        result = scenario.Run(file);
    }

    if (result.success) {
        LOG_INFO(util::LogCategory::SIM) << "Executed " << result.commands << " command(s)";
    } else {
        std::cerr << "line " << result.failedLine << ": " << result.error << std::endl;
        exitCode = 1;
    }

    if (config.persist && !PersistState(config, scenario)) {
        exitCode = 1;
    }

    util::DisableMockTime();
    util::Logger::Instance().Shutdown();
    return exitCode;
}

} // namespace revguard

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return revguard::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
