#pragma once

/**
 * @file config_parser.hpp
 * @brief Line-oriented `key: value` configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * size: 512
 * noise.octaves: 4
 * include: shared.conf
 * ```
 *
 * Later entries override earlier ones for simple lookups, so an include
 * placed at the top of a file acts as a set of defaults.
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terraforge {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    // Lenient access: fall back to defaultVal on empty or unparsable text
    [[nodiscard]] bool asBool(bool defaultVal = false) const;
    [[nodiscard]] float asFloat(float defaultVal = 0.0f) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    // Strict access: nullopt unless the whole text parses
    [[nodiscard]] std::optional<bool> tryBool() const;
    [[nodiscard]] std::optional<double> tryDouble() const;
    [[nodiscard]] std::optional<long long> tryInteger() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry / ConfigDocument
// ============================================================================

struct ConfigEntry {
    std::string key;
    ConfigValue value;
    int line = 0;  ///< 1-based line in the file the entry came from
};

class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    /// Last entry with this key, or nullptr
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;
    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] float getFloat(std::string_view key, float defaultVal = 0.0f) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser
// ============================================================================

/**
 * @brief Parser for terrain configuration files
 *
 * `include:` directives are resolved relative to the including file unless
 * an IncludeResolver is set. Includes nest up to kMaxIncludeDepth; deeper
 * (usually cyclic) includes are skipped with a warning.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    static constexpr int kMaxIncludeDepth = 8;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /// Parse a file; nullopt if it cannot be opened
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /// Parse text; basePath is prepended to relative include paths
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    [[nodiscard]] std::optional<ConfigDocument> parseFileAtDepth(const std::string& path, int depth) const;
    [[nodiscard]] ConfigDocument parseStringAtDepth(std::string_view content,
                                                    const std::string& basePath, int depth) const;
    void parseLine(std::string_view line, int lineNum, ConfigDocument& doc,
                   const std::string& basePath, int depth) const;

    IncludeResolver includeResolver_;
};

}  // namespace terraforge
