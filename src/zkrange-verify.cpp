// ZKRANGE Verify - Command Line Interface
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// The zkrange-verify tool verifies range proof files against a parameter
// file and queries the verification ledger.

#include <zkrange/ledger/ledger.h>
#include <zkrange/rangeproof/codec.h>
#include <zkrange/rangeproof/identity.h>
#include <zkrange/rangeproof/verifier.h>
#include <zkrange/util/config.h>
#include <zkrange/util/logging.h>
#include <zkrange/util/time.h>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace zkrange {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZKRANGE Verify";

/// Process exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_REJECTED = 1,
    EXIT_USAGE = 2,
};

// ============================================================================
// Help
// ============================================================================

void PrintVersion() {
    std::cout << CLIENT_NAME << " version " << VERSION << "\n";
}

void PrintHelp() {
    PrintVersion();
    std::cout << "\nUsage:\n";
    std::cout << "  zkrange-verify [options] verify <params-file> <proof-file> <min> <max> <subject>\n";
    std::cout << "  zkrange-verify [options] status <identity-hex>\n";
    std::cout << "  zkrange-verify [options] latest <subject>\n";
    std::cout << "  zkrange-verify [options] identity <proof-file>\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -datadir=<dir>          Data directory (default: ~/.zkrange)\n";
    std::cout << "  -conf=<file>            Configuration file (default: <datadir>/zkrange.conf)\n";
    std::cout << "  -ledger=<backend>       Ledger backend: leveldb or memory\n";
    std::cout << "  -ledgerdir=<dir>        Ledger directory (default: <datadir>/ledger)\n";
    std::cout << "  -rangebits=<n>          Range bit width, power of two in 2..256 (default: 64)\n";
    std::cout << "  -syncwrites=<0|1>       Sync ledger writes (default: 1)\n";
    std::cout << "  -loglevel=<level>       trace, debug, info, warn, error, off (default: info)\n";
    std::cout << "  -printtoconsole         Log to the console\n";
    std::cout << "  -logfile=<file>         Log to a file\n";
    std::cout << "  -help                   Show this help\n";
    std::cout << "  -version                Show version\n";
    std::cout << "\n<min> and <max> are decimal or 0x-prefixed hex.\n";
    std::cout << "Exit status: 0 accepted or found, 1 rejected or not found, 2 usage error.\n";
}

// ============================================================================
// Argument Helpers
// ============================================================================

/// Parse a decimal or 0x-prefixed hex bound
std::optional<crypto::BigScalar> ParseBound(const std::string& text) {
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return crypto::BigScalar::FromHex(text);
    }
    return crypto::BigScalar::FromDecimal(text);
}

int UsageError(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    std::cerr << "Use 'zkrange-verify -help' for usage information.\n";
    return EXIT_USAGE;
}

/// Open the ledger described by the configuration
std::unique_ptr<ledger::DatabaseLedgerStore> OpenLedger(const util::ConfigManager& config,
                                                        std::string& error) {
    auto options = ledger::LoadLedgerOptions(config, &error);
    if (!options) {
        return nullptr;
    }

    auto [status, store] = ledger::OpenLedgerStore(*options);
    if (!status.ok()) {
        error = "cannot open ledger at " + options->path.string() + ": " + status.ToString();
        return nullptr;
    }
    return std::move(store);
}

// ============================================================================
// Commands
// ============================================================================

int CommandVerify(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() != 6) {
        return UsageError("verify takes <params-file> <proof-file> <min> <max> <subject>");
    }

    std::string error;
    auto options = rangeproof::LoadVerifierOptions(config, &error);
    if (!options) {
        return UsageError(error);
    }

    auto params = rangeproof::LoadParametersFile(args[1]);
    if (!params) {
        return UsageError("cannot read parameters from " + args[1]);
    }

    auto proof = rangeproof::LoadProofFile(args[2]);
    if (!proof) {
        return UsageError("cannot read proof from " + args[2]);
    }

    auto rangeMin = ParseBound(args[3]);
    auto rangeMax = ParseBound(args[4]);
    if (!rangeMin || !rangeMax) {
        return UsageError("invalid range bound");
    }

    auto store = OpenLedger(config, error);
    if (!store) {
        return UsageError(error);
    }

    rangeproof::RangeProofVerifier verifier(*store, *options);
    rangeproof::RangeClaim range{*rangeMin, *rangeMax};
    rangeproof::Subject subject(args[5]);

    rangeproof::VerificationResult result = verifier.Verify(*params, *proof, range, subject);

    std::cout << result.ToString() << "\n";
    if (!result.IsAccepted()) {
        std::cout << "class: "
                  << rangeproof::ErrorClassToString(rangeproof::ClassifyError(result.error))
                  << "\n";
        return EXIT_REJECTED;
    }

    std::cout << "time: " << util::FormatISO8601(result.timestamp) << "\n";
    return EXIT_OK;
}

int CommandStatus(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return UsageError("status takes <identity-hex>");
    }

    rangeproof::ProofIdentity identity;
    try {
        identity = rangeproof::ProofIdentity::FromHex(args[1]);
    } catch (const std::invalid_argument& e) {
        return UsageError(std::string("invalid identity: ") + e.what());
    }

    std::string error;
    auto store = OpenLedger(config, error);
    if (!store) {
        return UsageError(error);
    }

    if (store->IsRecorded(identity)) {
        std::cout << "verified\n";
        return EXIT_OK;
    }
    std::cout << "not verified\n";
    return EXIT_REJECTED;
}

int CommandLatest(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return UsageError("latest takes <subject>");
    }

    rangeproof::Subject subject(args[1]);
    if (subject.IsEmpty()) {
        return UsageError("subject is empty");
    }

    std::string error;
    auto store = OpenLedger(config, error);
    if (!store) {
        return UsageError(error);
    }

    auto latest = store->GetLatest(subject);
    if (!latest) {
        std::cout << "none\n";
        return EXIT_REJECTED;
    }
    std::cout << latest->ToHex() << "\n";
    return EXIT_OK;
}

int CommandIdentity(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return UsageError("identity takes <proof-file>");
    }

    auto proof = rangeproof::LoadProofFile(args[1]);
    if (!proof) {
        return UsageError("cannot read proof from " + args[1]);
    }

    std::cout << rangeproof::ComputeProofIdentity(*proof).ToHex() << "\n";
    return EXIT_OK;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigParseResult parsed = util::InitConfig(argc, argv);
    if (!parsed.success) {
        return UsageError(parsed.ToString());
    }

    util::ConfigManager& config = util::GetConfig();

    if (config.GetBool("help", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return EXIT_OK;
    }

    util::SetupLogging(config.GetString(util::ConfigKeys::LOGLEVEL, "info"),
                       config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false),
                       config.GetPath(util::ConfigKeys::LOGFILE));

    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    for (const auto& key : util::GetKnownConfigKeys()) {
        config.AllowKey(key);
    }
    config.AllowKey("help");
    config.AllowKey("version");
    for (const auto& problem : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << problem;
    }

    const std::vector<std::string>& args = config.GetPositionalArgs();
    if (args.empty()) {
        return UsageError("no command specified");
    }

    const std::string& command = args[0];
    int rc;
    if (command == "verify") {
        rc = CommandVerify(config, args);
    } else if (command == "status") {
        rc = CommandStatus(config, args);
    } else if (command == "latest") {
        rc = CommandLatest(config, args);
    } else if (command == "identity") {
        rc = CommandIdentity(args);
    } else if (command == "help") {
        PrintHelp();
        rc = EXIT_OK;
    } else {
        rc = UsageError("unknown command '" + command + "'");
    }

    util::Logger::Instance().Flush();
    return rc;
}

} // namespace cli
} // namespace zkrange

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return zkrange::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return zkrange::cli::EXIT_USAGE;
    }
}
