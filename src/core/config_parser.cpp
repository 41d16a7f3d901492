#include "tectogen/core/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tectogen {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" ||
        text_ == "on" || text_ == "t" || text_ == "y") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" ||
        text_ == "off" || text_ == "f" || text_ == "n") {
        return false;
    }
    return defaultVal;
}

float ConfigValue::asFloat(float defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    float val = std::strtof(text_.c_str(), &end);
    if (end == text_.c_str()) return defaultVal;
    return val;
}

int ConfigValue::asInt(int defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<int>(val);
}

uint64_t ConfigValue::asUInt64(uint64_t defaultVal) const {
    if (text_.empty() || text_.front() == '-') return defaultVal;

    char* end;
    unsigned long long val = std::strtoull(text_.c_str(), &end, 0);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<uint64_t>(val);
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    return get(key, "");
}

const ConfigEntry* ConfigDocument::get(std::string_view key, std::string_view suffix) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key && it->suffix == suffix) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

float ConfigDocument::getFloat(std::string_view key, float defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asFloat(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

float ConfigDocument::getFloat(std::string_view key, std::string_view suffix, float defaultVal) const {
    if (auto* entry = get(key, suffix)) {
        return entry->value.asFloat(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, std::string_view suffix, int defaultVal) const {
    if (auto* entry = get(key, suffix)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

std::vector<const ConfigEntry*> ConfigDocument::getAll(std::string_view key) const {
    std::vector<const ConfigEntry*> result;
    for (const auto& entry : entries_) {
        if (entry.key == key) {
            result.push_back(&entry);
        }
    }
    return result;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseString(buffer.str(), basePath);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    std::string_view remaining = content;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }

        // Windows line endings
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        parseLine(line, doc, basePath);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, ConfigDocument& doc,
                             const std::string& basePath) const {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return;
    }

    ConfigEntry entry;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // Bare key with no value
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));

    auto rest = line.substr(colonPos + 1);
    auto secondColon = rest.find(':');
    if (secondColon != std::string_view::npos) {
        entry.suffix = std::string(trim(rest.substr(0, secondColon)));
        rest = rest.substr(secondColon + 1);
    }
    rest = trim(rest);

    if (entry.key == "include" && entry.suffix.empty()) {
        std::string includePath(rest);
        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto includedDoc = parseFile(resolvedPath)) {
            for (const auto& included : *includedDoc) {
                doc.addEntry(included);
            }
        }
        return;
    }

    if (!rest.empty()) {
        entry.value = ConfigValue(rest);
    }
    doc.addEntry(std::move(entry));
}

}  // namespace tectogen
