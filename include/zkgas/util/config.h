// ZKGAS - Configuration File Parser
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Parses INI-style configuration for the paymaster engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef ZKGAS_UTIL_CONFIG_H
#define ZKGAS_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zkgas {
namespace util {

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "zkgas.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // Where this was defined
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value configuration grouped by section. Later definitions of a
 * key overwrite earlier ones.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (nullopt if missing or not a whole number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get unsigned integer value (nullopt if missing, negative or invalid)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    /// Get boolean value (nullopt if missing or not a boolean word)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Get all section names
    std::vector<std::string> GetSections() const;

    /// Get all keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    void Clear();

    size_t Size() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace zkgas

#endif // ZKGAS_UTIL_CONFIG_H
