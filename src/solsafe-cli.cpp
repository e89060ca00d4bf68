// SOLSAFE Command-Line Tool
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Reporter and juror tooling for the SOLSAFE dispute protocol.
// Supports:
// - Committing to a set of evidence files (Merkle root and proofs)
// - Building and checking evidence bundles
// - Committing to a vote and keeping the secret until the reveal
// - Preparing and confirming the reveal
// - Listing and discarding stored vote secrets

#include <solsafe/core/errors.h>
#include <solsafe/core/hex.h>
#include <solsafe/core/json.h>
#include <solsafe/crypto/sha256.h>
#include <solsafe/db/database.h>
#include <solsafe/evidence/bundle.h>
#include <solsafe/evidence/merkle.h>
#include <solsafe/juror/juror.h>
#include <solsafe/store/commitment_store.h>
#include <solsafe/util/config.h>
#include <solsafe/util/logging.h>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace solsafe;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* VOTE_DB_DIR = "votes";

/// Exit code when a stored vote secret fails its integrity check
constexpr int EXIT_INTEGRITY = 2;

// ============================================================================
// Argument Helpers
// ============================================================================

/// Parse a positive decimal case id
bool ParseCaseIdArg(const std::string& str, CaseId& out) {
    if (str.empty()) {
        std::cerr << "Error: missing case id\n";
        return false;
    }
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
    if (ec != std::errc() || ptr != str.data() + str.size() || out == 0) {
        std::cerr << "Error: invalid case id '" << str << "'\n";
        return false;
    }
    return true;
}

/// Read a whole file as bytes
bool ReadFileBytes(const std::string& path, Bytes& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: cannot open " << path << "\n";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        std::cerr << "Error: cannot read " << path << "\n";
        return false;
    }
    return true;
}

bool ReadFileText(const std::string& path, std::string& out) {
    Bytes bytes;
    if (!ReadFileBytes(path, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

/// Print a JSON document on stdout, or write it to path when given
bool EmitJSON(const JSONValue& doc, const std::string& path = "") {
    std::string text = doc.ToJSON(true);
    if (path.empty()) {
        std::cout << text << "\n";
        return true;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write " << path << "\n";
        return false;
    }
    out << text << "\n";
    return out.good();
}

JSONValue DigestArray(const std::vector<Hash256>& digests) {
    JSONValue::Array arr;
    for (const Hash256& d : digests) {
        arr.emplace_back(d.ToHex());
    }
    return JSONValue(std::move(arr));
}

// ============================================================================
// Setup
// ============================================================================

/// Apply loglevel, logfile, printtoconsole and debug
bool ConfigureLogging(const util::ConfigManager& config) {
    util::LoggingOptions options;

    bool ok = true;
    options.level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"), &ok);
    if (!ok) {
        std::cerr << "Error: unknown log level '"
                  << config.GetString(util::ConfigKeys::LOGLEVEL, "") << "'\n";
        return false;
    }

    options.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    options.consoleStderrOnly = true;
    options.logFile = config.GetPath(util::ConfigKeys::LOGFILE);

    std::string debug = config.GetString(util::ConfigKeys::DEBUG, "");
    std::istringstream categories(debug);
    std::string category;
    while (std::getline(categories, category, ',')) {
        if (!category.empty() && category != "1" && category != "all") {
            options.categories.push_back(category);
        }
    }
    if (!debug.empty() && config.TryGetString(util::ConfigKeys::LOGLEVEL) == std::nullopt) {
        options.level = util::LogLevel::Debug;
    }

    util::Logger::Instance().Configure(options);
    return true;
}

/// Open the vote secret store under <datadir>/votes
std::unique_ptr<store::CommitmentStore> OpenStore(const util::ConfigManager& config) {
    std::string backendName = config.GetString(util::ConfigKeys::BACKEND, "leveldb");
    auto backend = db::ParseBackend(backendName);
    if (!backend) {
        std::cerr << "Error: unknown backend '" << backendName << "' (use leveldb or memory)\n";
        return nullptr;
    }

    fs::path path = fs::path(config.GetDataDir()) / VOTE_DB_DIR;
    db::Options options;
    auto [status, database] = db::OpenDatabase(path, options, *backend);
    if (!status.ok()) {
        std::cerr << "Error: cannot open vote store at " << path.string() << ": "
                  << status.ToString() << "\n";
        return nullptr;
    }

    return std::make_unique<store::CommitmentStore>(std::move(database),
                                                    store::StoreOptions::FromConfig(config));
}

// ============================================================================
// Evidence Commands
// ============================================================================

int CommandMerkle(const std::vector<std::string>& files) {
    if (files.empty()) {
        std::cerr << "Usage: solsafe-cli merkle <file>...\n";
        return 1;
    }

    std::vector<Bytes> items(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        if (!ReadFileBytes(files[i], items[i])) return 1;
    }

    evidence::MerkleCommitment commitment = evidence::BuildMerkleCommitment(items);

    JSONValue::Array proofs;
    for (size_t i = 0; i < files.size(); ++i) {
        JSONValue::Object proof;
        proof["file"] = JSONValue(files[i]);
        proof["index"] = JSONValue(commitment.proofs[i].index);
        proof["leaf"] = JSONValue(commitment.leaves[i].ToHex());
        proof["siblings"] = DigestArray(commitment.proofs[i].siblings);
        proofs.emplace_back(std::move(proof));
    }

    JSONValue::Object doc;
    doc["root"] = JSONValue(commitment.root.ToHex());
    doc["proofs"] = JSONValue(std::move(proofs));
    return EmitJSON(JSONValue(std::move(doc))) ? 0 : 1;
}

int CommandBundle(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: solsafe-cli bundle <case-id> <file>... [-reporter=..] "
                     "[-subject=..] [-description=..] [-locatorbase=..] [-out=..]\n";
        return 1;
    }

    evidence::BundleHeader header;
    if (!ParseCaseIdArg(args[0], header.caseId)) return 1;
    header.reporter = config.GetString("reporter", "");
    header.subject = config.GetString("subject", "");
    header.description = config.GetString("description", "");
    header.createdAt = GetTime();

    std::string locatorBase = config.GetString("locatorbase", "");
    std::string mediaType = config.GetString("mediatype", "application/octet-stream");

    std::vector<evidence::EvidenceItem> items;
    for (size_t i = 1; i < args.size(); ++i) {
        evidence::EvidenceItem item;
        if (!ReadFileBytes(args[i], item.content)) return 1;

        std::string name = fs::path(args[i]).filename().string();
        item.descriptor.name = name;
        item.descriptor.mediaType = mediaType;
        if (locatorBase.empty()) {
            item.descriptor.locator = std::string(evidence::ZKPROOF_LOCATOR_PREFIX) +
                                      SHA256Hash(item.content).ToHex();
        } else {
            item.descriptor.locator = locatorBase + "/" + name;
        }
        items.push_back(std::move(item));
    }

    evidence::EvidenceBundle bundle = evidence::EvidenceBundle::Build(header, items);
    std::string out = config.GetPath("out");
    if (!EmitJSON(bundle.ToJSONValue(), out)) return 1;
    if (!out.empty()) {
        std::cout << "Root: " << bundle.Root().ToHex() << "\n";
        std::cout << "Document digest: " << bundle.DocumentDigest().ToHex() << "\n";
    }
    return 0;
}

int CommandVerify(const util::ConfigManager& config, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "Usage: solsafe-cli verify <bundle.json> <index> <file> [-root=<hex>]\n";
        return 1;
    }

    std::string text;
    if (!ReadFileText(args[0], text)) return 1;
    evidence::EvidenceBundle bundle = evidence::EvidenceBundle::FromJSON(text);

    uint64_t index = 0;
    auto [ptr, ec] = std::from_chars(args[1].data(), args[1].data() + args[1].size(), index);
    if (ec != std::errc() || ptr != args[1].data() + args[1].size()) {
        std::cerr << "Error: invalid index '" << args[1] << "'\n";
        return 1;
    }

    Bytes content;
    if (!ReadFileBytes(args[2], content)) return 1;

    bool ok = false;
    if (auto root = config.TryGetString("root")) {
        ok = bundle.VerifyItem(index, content, Hash256::FromHex(*root));
    } else {
        ok = bundle.VerifyItem(index, content);
    }

    std::cout << (ok ? "valid" : "INVALID") << "\n";
    return ok ? 0 : 1;
}

// ============================================================================
// Vote Commands
// ============================================================================

int CommandCommit(const util::ConfigManager& config, store::CommitmentStore& store,
                  const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: solsafe-cli commit <case-id> <yes|no> [-salt=<hex>] [-overwrite]\n";
        return 1;
    }

    CaseId caseId = 0;
    if (!ParseCaseIdArg(args[0], caseId)) return 1;
    auto choice = util::ConfigManager::ParseBool(args[1]);
    if (!choice) {
        std::cerr << "Error: vote must be yes or no, got '" << args[1] << "'\n";
        return 1;
    }

    std::optional<Bytes> salt;
    if (auto saltHex = config.TryGetString("salt")) {
        salt = HexToBytes(*saltHex, vote::SALT_SIZE);
    }

    juror::Juror session(store);
    juror::PublicVote pub = session.Commit(caseId, *choice, salt, config.GetBool("overwrite", false));
    return EmitJSON(pub.ToJSONValue()) ? 0 : 1;
}

int CommandReveal(store::CommitmentStore& store, const std::vector<std::string>& args) {
    CaseId caseId = 0;
    if (args.size() != 1 || !ParseCaseIdArg(args[0], caseId)) {
        std::cerr << "Usage: solsafe-cli reveal <case-id>\n";
        return 1;
    }

    juror::Juror session(store);
    auto payload = session.PrepareReveal(caseId);
    if (!payload) {
        std::cerr << "No vote commitment stored for case " << caseId << "\n";
        return 1;
    }
    return EmitJSON(payload->ToJSONValue()) ? 0 : 1;
}

int CommandConfirm(store::CommitmentStore& store, const std::vector<std::string>& args) {
    CaseId caseId = 0;
    if (args.size() != 1 || !ParseCaseIdArg(args[0], caseId)) {
        std::cerr << "Usage: solsafe-cli confirm <case-id>\n";
        return 1;
    }

    juror::Juror session(store);
    session.ConfirmReveal(caseId);
    std::cout << "Vote secret for case " << caseId << " removed\n";
    return 0;
}

int CommandShow(store::CommitmentStore& store, const std::vector<std::string>& args) {
    CaseId caseId = 0;
    if (args.size() != 1 || !ParseCaseIdArg(args[0], caseId)) {
        std::cerr << "Usage: solsafe-cli show <case-id>\n";
        return 1;
    }

    auto vc = store.Load(caseId);
    if (!vc) {
        std::cerr << "No vote commitment stored for case " << caseId << "\n";
        return 1;
    }

    // Public half only
    juror::PublicVote pub{caseId, vc->GetCommitment(), vc->GetNullifier()};
    return EmitJSON(pub.ToJSONValue()) ? 0 : 1;
}

int CommandList(store::CommitmentStore& store) {
    for (CaseId caseId : store.ListCases()) {
        std::cout << caseId << "\n";
    }
    return 0;
}

int CommandForget(store::CommitmentStore& store, const std::vector<std::string>& args) {
    CaseId caseId = 0;
    if (args.size() != 1 || !ParseCaseIdArg(args[0], caseId)) {
        std::cerr << "Usage: solsafe-cli forget <case-id>\n";
        return 1;
    }

    if (!store.Contains(caseId)) {
        std::cerr << "No vote commitment stored for case " << caseId << "\n";
        return 1;
    }
    store.Remove(caseId);
    std::cout << "Vote secret for case " << caseId << " discarded; the vote can no longer be revealed\n";
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "SOLSAFE CLI v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: solsafe-cli [options] <command> [args]\n";
    std::cout << "\n";
    std::cout << "Evidence commands:\n";
    std::cout << "  merkle <file>...                 Merkle root and proofs for files\n";
    std::cout << "  bundle <case-id> <file>...       Build an evidence bundle\n";
    std::cout << "  verify <bundle> <index> <file>   Check a file against a bundle\n";
    std::cout << "\n";
    std::cout << "Juror commands:\n";
    std::cout << "  commit <case-id> <yes|no>        Commit to a vote, keep the secret\n";
    std::cout << "  reveal <case-id>                 Print the reveal payload\n";
    std::cout << "  confirm <case-id>                Drop the secret after revealing\n";
    std::cout << "  show <case-id>                   Print the stored commitment\n";
    std::cout << "  list                             List cases with a stored secret\n";
    std::cout << "  forget <case-id>                 Discard a secret without revealing\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -datadir=<dir>        Data directory (default: ~/.solsafe)\n";
    std::cout << "  -conf=<file>          Config file (default: <datadir>/solsafe.conf)\n";
    std::cout << "  -backend=<name>       Vote store backend: leveldb or memory\n";
    std::cout << "  -loglevel=<level>     trace, debug, info, warn, error\n";
    std::cout << "  -logfile=<file>       Also log to a file\n";
    std::cout << "  -noprinttoconsole     Do not log to the console\n";
    std::cout << "  -reporter=<addr>      bundle: reporter address\n";
    std::cout << "  -subject=<addr>       bundle: reported address\n";
    std::cout << "  -description=<text>   bundle: case description\n";
    std::cout << "  -locatorbase=<url>    bundle: storage URL prefix for the files\n";
    std::cout << "  -out=<file>           bundle: write the bundle to a file\n";
    std::cout << "  -root=<hex>           verify: check against an on-chain root\n";
    std::cout << "  -salt=<hex>           commit: use this 32-byte salt\n";
    std::cout << "  -overwrite            commit: replace an unrevealed commitment\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  solsafe-cli bundle 42 shot.png tx.csv -locatorbase=ipfs://bafy... -out=case42.json\n";
    std::cout << "  solsafe-cli verify case42.json 1 tx.csv\n";
    std::cout << "  solsafe-cli commit 42 yes\n";
    std::cout << "  solsafe-cli reveal 42\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "SOLSAFE CLI v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SOLSAFE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Main
// ============================================================================

int Dispatch(const util::ConfigManager& config, const std::string& command,
             const std::vector<std::string>& args) {
    if (command == "merkle") {
        return CommandMerkle(args);
    } else if (command == "bundle") {
        return CommandBundle(config, args);
    } else if (command == "verify") {
        return CommandVerify(config, args);
    } else if (command == "help") {
        PrintUsage();
        return 0;
    }

    const bool isVoteCommand = command == "commit" || command == "reveal" ||
                               command == "confirm" || command == "show" ||
                               command == "list" || command == "forget";
    if (!isVoteCommand) {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'solsafe-cli help' for usage.\n";
        return 1;
    }

    auto store = OpenStore(config);
    if (!store) {
        return 1;
    }

    if (command == "commit") {
        return CommandCommit(config, *store, args);
    } else if (command == "reveal") {
        return CommandReveal(*store, args);
    } else if (command == "confirm") {
        return CommandConfirm(*store, args);
    } else if (command == "show") {
        return CommandShow(*store, args);
    } else if (command == "list") {
        return CommandList(*store);
    }
    return CommandForget(*store, args);
}

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> positional;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv, &positional);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    if (config.HasKey("version") || config.HasKey("v")) {
        PrintVersion();
        return 0;
    }
    if (config.HasKey("help") || config.HasKey("h") || positional.empty()) {
        PrintUsage();
        return positional.empty() && !config.HasKey("help") && !config.HasKey("h") ? 1 : 0;
    }

    parsed = config.LoadConfigFile();
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }

    if (!ConfigureLogging(config)) {
        return 1;
    }

    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());
    LOG_DEBUG(util::LogCategory::CLI) << "Running '" << command << "' with " << args.size()
                                      << " argument(s)";

    int rc = 1;
    try {
        rc = Dispatch(config, command, args);
    } catch (const IntegrityError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "The stored vote secret is damaged; the vote may not be revealable.\n";
        rc = EXIT_INTEGRITY;
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::CLI) << command << " failed: " << e.what();
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    util::Logger::Instance().Shutdown();
    return rc;
}
