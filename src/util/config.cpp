// SOLSAFE - Configuration Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/util/config.h"
#include "solsafe/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace solsafe {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) return "OK";
    std::string out;
    if (!errorFile.empty()) {
        out += errorFile;
        if (errorLine > 0) out += ":" + std::to_string(errorLine);
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    const char quote = str.front();
    if ((quote != '"' && quote != '\'') || str.back() != quote) {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    if (quote == '\'') {
        return inner;
    }

    // Double quotes understand \n \t \\ and \"
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[i + 1];
            if (next == 'n') { out += '\n'; ++i; continue; }
            if (next == 't') { out += '\t'; ++i; continue; }
            if (next == '\\' || next == '"') { out += next; ++i; continue; }
        }
        out += inner[i];
    }
    return out;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.length() > 1 && path[1] != '/')) {
        return path;
    }

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }

    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

// ============================================================================
// Storage
// ============================================================================

bool ConfigManager::Store(const std::string& key, const std::string& value,
                          ConfigSource source, const std::string& origin, int line) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.source > source) {
        return false;
    }
    entries_[key] = ConfigEntry{value, source, origin, line};
    return true;
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    Store(key, value, ConfigSource::Override, "<set>", 0);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    Store(key, value, ConfigSource::Default, "<default>", 0);
}

void ConfigManager::Clear() {
    entries_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        if (trimmed.back() != ']') {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, trimmed.length() - 2));
        if (!currentSection.empty() && !IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }

    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag: "key" or "nokey"
        key = trimmed;
        value = "1";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0) {
            key = key.substr(2);
            value = "0";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }

    std::string fullKey = currentSection.empty() ? key : currentSection + "." + key;
    Store(fullKey, value, ConfigSource::File, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            LOG_WARN(LogCategory::CONFIG) << result.ToString();
            return result;
        }
    }

    LOG_DEBUG(LogCategory::CONFIG) << "Parsed " << lineNum << " lines from " << sourceName;
    return result;
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  std::vector<std::string>* positional) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-' || arg == "-") {
            if (positional) positional->push_back(arg);
            continue;
        }

        // Accept both -key and --key
        arg = arg.substr(arg.compare(0, 2, "--") == 0 ? 2 : 1);

        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0) {
            key = arg.substr(2);
            value = "0";
        } else {
            key = arg;
            value = "1";
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: '" + std::string(argv[i]) + "'",
                                            "<command-line>");
        }
        Store(key, value, ConfigSource::CommandLine, "<command-line>", 0);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    if (auto explicitPath = TryGetString(ConfigKeys::CONF)) {
        return ParseFile(*explicitPath);
    }

    std::string path = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    std::ifstream probe(path);
    if (!probe.is_open()) {
        return ConfigParseResult::Success();
    }
    probe.close();
    return ParseFile(path);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos, 10);
        if (pos != str->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandTilde(GetString(key, defaultValue));
}

std::optional<ConfigSource> ConfigManager::GetSource(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.source;
}

std::string ConfigManager::GetDataDir() const {
    std::string dir = GetPath(ConfigKeys::DATADIR);
    return dir.empty() ? GetDefaultDataDir() : dir;
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [key, entry] : entries_) {
        oss << key << "=" << entry.value << "\n";
    }
    return oss.str();
}

} // namespace util
} // namespace solsafe
