// SOLSAFE - Configuration
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// INI-style configuration for the solsafe tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs; a bare key means key=1, a bare nokey means key=0
// - Section headers: [section]; keys below it are addressed as section.key
// - Values can be quoted: key="value with spaces"
// - Environment variable expansion: ${VAR_NAME}
//
// Priority (highest first): command line, config file, built-in defaults.
// A lower-priority source never replaces a value set by a higher one, so
// sources may be loaded in any order.

#ifndef SOLSAFE_UTIL_CONFIG_H
#define SOLSAFE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace solsafe {
namespace util {

/// Default data directory name under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".solsafe";

/// Config file looked up inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "solsafe.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

enum class ConfigSource {
    Default = 0,
    File = 1,
    CommandLine = 2,
    Override = 3,
};

struct ConfigEntry {
    std::string value;
    ConfigSource source{ConfigSource::Default};
    std::string origin;   // file path, "<command-line>", ...
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text; sourceName appears in error messages
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse -key=value, -key and -nokey options. Arguments that do not
    /// start with '-' are appended to positional, in order.
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

    /// Load <datadir>/solsafe.conf, or the file named by "conf", if present.
    /// A missing default file is not an error; a missing explicit one is.
    ConfigParseResult LoadConfigFile();

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Integer value; nullopt if missing or not a whole decimal number
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    /// Boolean value (1/0, true/false, yes/no, on/off); nullopt if missing
    /// or unrecognized
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// String value with ~ expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    /// Where a key's value came from
    std::optional<ConfigSource> GetSource(const std::string& key) const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically; overrides every other source
    void Set(const std::string& key, const std::string& value);

    /// Set a built-in default
    void SetDefault(const std::string& key, const std::string& value);

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    /// Resolved data directory ("datadir" or ~/.solsafe)
    std::string GetDataDir() const;

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

    /// key=value lines for every entry, sorted by key
    std::string Dump() const;

private:
    bool Store(const std::string& key, const std::string& value, ConfigSource source,
               const std::string& origin, int line);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* BACKEND = "backend";             // leveldb | memory
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";                 // category filter, comma separated
    constexpr const char* STORE_PURGECORRUPT = "store.purgecorrupt";
    constexpr const char* STORE_SYNC = "store.sync";
}

} // namespace util
} // namespace solsafe

#endif // SOLSAFE_UTIL_CONFIG_H
