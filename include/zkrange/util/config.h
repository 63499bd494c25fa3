// ZKRANGE - Configuration File Parser
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Parses INI-style configuration files and command-line options.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Bare keys are boolean flags; "nokey" negates
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME
// - "include <path>" pulls in another file

#ifndef ZKRANGE_UTIL_CONFIG_H
#define ZKRANGE_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkrange {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name
constexpr const char* DEFAULT_DATADIR_NAME = ".zkrange";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "zkrange.conf";

/// System-wide config file
constexpr const char* SYSTEM_CONFIG_PATH = "/etc/zkrange/zkrange.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line options
 * 2. File named by -conf, or the data directory config file
 * 3. User config file (~/.zkrange/zkrange.conf)
 * 4. System config file (/etc/zkrange/zkrange.conf)
 * 5. Built-in defaults
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @param overwrite If false, keys already set from a non-default source are kept
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @param overwrite If false, keys already set from a non-default source are kept
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /**
     * Parse command-line arguments.
     *
     * Options take the form -key=value, --key=value, -flag or -noflag. Any
     * other argument is collected as a positional argument, in order.
     * Options always overwrite.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    /**
     * Load the system, user and data directory configuration files.
     * Files that do not exist are skipped. A file named by the conf key must exist.
     *
     * @param dataDir Data directory path (or empty for default)
     * @return Combined parse result
     */
    ConfigParseResult LoadAllConfigs(const std::string& dataDir = "");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Get string value with default
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (nullopt if missing or not a whole decimal integer)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    /// Get integer value with default
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    /// Get boolean value with default
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get path value (with ~ and environment expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Positional (non-option) command-line arguments
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register an allowed key (for validation)
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Validate configuration (missing required keys, unknown keys)
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Get data directory
    std::string GetDataDir() const;

    /// Set data directory
    void SetDataDir(const std::string& dir);

    /// Get default data directory path
    static std::string GetDefaultDataDir();

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

private:
    /// Internal key for section:key combination
    std::string MakeKey(const std::string& key, const std::string& section) const;

    /// Parse a stream of lines
    ConfigParseResult ParseLines(std::istream& in, const std::string& source, bool overwrite);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, bool overwrite, ConfigParseResult& result);

    /// Store an entry, honoring overwrite
    void StoreEntry(ConfigEntry entry, bool overwrite);

    /// Parse the file if it exists; missing files are not an error
    ConfigParseResult ParseFileIfExists(const std::string& path, bool overwrite);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Check a key for invalid characters
    static bool IsValidKey(const std::string& key, char& bad);

    // Configuration data
    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;

    // Validation
    std::set<std::string> allowedKeys_;

    // State
    std::string dataDir_;
    int includeDepth_{0};
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Get global configuration manager
ConfigManager& GetConfig();

/// Initialize global configuration from command line and config files
ConfigParseResult InitConfig(int argc, char* argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";

    // Ledger
    constexpr const char* LEDGER = "ledger";            // leveldb | memory
    constexpr const char* LEDGERDIR = "ledgerdir";
    constexpr const char* SYNCWRITES = "syncwrites";

    // Verification
    constexpr const char* RANGEBITS = "rangebits";

    // Logging
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
}

/// All recognised keys, for AllowKey registration
std::vector<std::string> GetKnownConfigKeys();

} // namespace util
} // namespace zkrange

#endif // ZKRANGE_UTIL_CONFIG_H
