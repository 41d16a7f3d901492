#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tectogen {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief Text value of a config entry with typed conversions
 *
 * Conversions never throw; unparseable text yields the supplied default.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    [[nodiscard]] std::string_view asString() const { return text_; }

    [[nodiscard]] bool asBool(bool defaultVal = false) const;
    [[nodiscard]] float asFloat(float defaultVal = 0.0f) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;
    [[nodiscard]] uint64_t asUInt64(uint64_t defaultVal = 0) const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional suffix
// ============================================================================

/**
 * @brief A configuration entry
 *
 * Represents entries like:
 *   key: value
 *   key:suffix: value
 */
struct ConfigEntry {
    std::string key;              // Primary key (e.g., "rivers", "elevation")
    std::string suffix;           // Optional suffix (e.g., "octaves")
    ConfigValue value;

    [[nodiscard]] bool hasSuffix() const { return !suffix.empty(); }
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief A parsed configuration document
 *
 * Entries are kept in file order. Lookups return the last matching entry,
 * so later lines (and later includes) override earlier ones.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (entries without a suffix only)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    // Lookup by key and suffix
    [[nodiscard]] const ConfigEntry* get(std::string_view key, std::string_view suffix) const;

    [[nodiscard]] bool has(std::string_view key) const { return get(key) != nullptr; }

    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] float getFloat(std::string_view key, float defaultVal = 0.0f) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // Suffixed variants (key:suffix: value)
    [[nodiscard]] float getFloat(std::string_view key, std::string_view suffix, float defaultVal) const;
    [[nodiscard]] int getInt(std::string_view key, std::string_view suffix, int defaultVal) const;

    [[nodiscard]] std::vector<const ConfigEntry*> getAll(std::string_view key) const;

    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for simple configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * seed: 123456789
 * rivers: 12
 * river:source_threshold: 0.6
 * include: tuning.conf
 * ```
 *
 * Includes are resolved relative to the including file unless an include
 * resolver is installed. A missing include is skipped.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a configuration file
     * @return Parsed document, or nullopt if the file cannot be opened
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param basePath Directory prefix for relative includes
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    void parseLine(std::string_view line, ConfigDocument& doc, const std::string& basePath) const;

    IncludeResolver includeResolver_;
};

}  // namespace tectogen
