#include "terraforge/core/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace terraforge {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

std::optional<bool> ConfigValue::tryBool() const {
    if (text_ == "true" || text_ == "yes" || text_ == "1" || text_ == "on") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" || text_ == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<double> ConfigValue::tryDouble() const {
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    double val = std::strtod(text_.c_str(), &end);
    if (end != text_.c_str() + text_.size()) return std::nullopt;
    return val;
}

std::optional<long long> ConfigValue::tryInteger() const {
    if (text_.empty()) return std::nullopt;

    char* end = nullptr;
    long long val;
    if (text_.size() > 2 && text_[0] == '0' && (text_[1] == 'x' || text_[1] == 'X')) {
        val = std::strtoll(text_.c_str(), &end, 16);
    } else {
        val = std::strtoll(text_.c_str(), &end, 10);
    }
    if (end != text_.c_str() + text_.size()) return std::nullopt;
    return val;
}

bool ConfigValue::asBool(bool defaultVal) const {
    return tryBool().value_or(defaultVal);
}

float ConfigValue::asFloat(float defaultVal) const {
    if (auto v = tryDouble()) return static_cast<float>(*v);
    return defaultVal;
}

int ConfigValue::asInt(int defaultVal) const {
    if (auto v = tryInteger()) return static_cast<int>(*v);
    return defaultVal;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Later entries override earlier ones
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
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

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFileAtDepth(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseStringAtDepth(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFileAtDepth(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Relative includes resolve against the including file's directory
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseStringAtDepth(buffer.str(), basePath, depth);
}

ConfigDocument ConfigParser::parseStringAtDepth(std::string_view content,
                                                const std::string& basePath, int depth) const {
    ConfigDocument doc;
    std::string_view remaining = content;
    int lineNum = 0;

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

        parseLine(line, ++lineNum, doc, basePath, depth);
    }

    return doc;
}

void ConfigParser::parseLine(std::string_view line, int lineNum, ConfigDocument& doc,
                             const std::string& basePath, int depth) const {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
        return;
    }

    auto colonPos = line.find(':');
    ConfigEntry entry;
    entry.line = lineNum;

    if (colonPos == std::string_view::npos) {
        // Bare key, no value
        entry.key = std::string(line);
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    auto rest = trim(line.substr(colonPos + 1));

    if (entry.key == "include") {
        if (depth >= kMaxIncludeDepth) {
            std::cerr << "[ConfigParser] WARNING: include depth exceeded at line "
                      << lineNum << ", skipping '" << rest << "'\n";
            return;
        }

        std::string includePath(rest);
        std::string resolvedPath;
        if (includeResolver_) {
            resolvedPath = includeResolver_(includePath);
        } else if (!includePath.empty() && includePath[0] == '/') {
            resolvedPath = includePath;
        } else {
            resolvedPath = basePath + includePath;
        }

        if (auto included = parseFileAtDepth(resolvedPath, depth + 1)) {
            for (const auto& e : *included) {
                doc.addEntry(e);
            }
        } else {
            std::cerr << "[ConfigParser] WARNING: cannot open include '"
                      << resolvedPath << "' (line " << lineNum << ")\n";
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace terraforge
