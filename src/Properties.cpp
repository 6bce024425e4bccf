/**
 * @file Properties.cpp
 * @brief Property set loading and comparison
 */

#include "stagehand/Properties.hpp"
#include "stagehand/Errors.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace stagehand {

Properties::Properties(std::initializer_list<Entry> entries) {
    for (const auto& [key, value] : entries) {
        set(key, value);
    }
}

void Properties::set(const std::string& key, std::string value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
}

const std::string& Properties::at(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw KeyError(key, key);
    }
    return entries_[it->second].second;
}

std::optional<std::string> Properties::get(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].second;
}

bool Properties::contains(const std::string& key) const {
    return index_.count(key) > 0;
}

std::set<std::string> Properties::key_set() const {
    std::set<std::string> keys;
    for (const auto& entry : index_) keys.insert(entry.first);
    return keys;
}

void Properties::merge(const Properties& other) {
    for (const auto& [key, value] : other.entries_) {
        set(key, value);
    }
}

nlohmann::json Properties::to_json() const {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& [key, value] : entries_) {
        obj[key] = value;
    }
    return obj;
}

Properties Properties::from_json(const nlohmann::json& object) {
    Properties props;
    if (!object.is_object()) return props;
    for (auto it = object.begin(); it != object.end(); ++it) {
        // Non-string scalars keep their JSON text ("8080", "true")
        props.set(it.key(), it.value().is_string() ? it.value().get<std::string>()
                                                   : it.value().dump());
    }
    return props;
}

bool Properties::operator==(const Properties& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, value] : entries_) {
        auto v = other.get(key);
        if (!v || *v != value) return false;
    }
    return true;
}

// ============================================================================
// Line-based properties
// ============================================================================

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '\\' || i + 1 >= s.size()) {
            out += c;
            continue;
        }
        char next = s[++i];
        switch (next) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                if (i + 4 >= s.size()) {
                    throw StagingError("Malformed \\uxxxx encoding in: " + s);
                }
                unsigned int cp = 0;
                for (size_t k = 1; k <= 4; ++k) {
                    char h = s[i + k];
                    cp <<= 4;
                    if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
                    else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
                    else throw StagingError("Malformed \\uxxxx encoding in: " + s);
                }
                append_utf8(out, cp);
                i += 4;
                break;
            }
            default: out += next; break;
        }
    }
    return out;
}

bool continues(const std::string& line) {
    size_t slashes = 0;
    for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) ++slashes;
    return slashes % 2 == 1;
}

void parse_logical_line(const std::string& line, Properties& props) {
    size_t len = line.size();
    size_t key_end = 0;
    bool escaped = false;
    for (; key_end < len; ++key_end) {
        char c = line[key_end];
        if (escaped) { escaped = false; continue; }
        if (c == '\\') { escaped = true; continue; }
        if (c == '=' || c == ':' || is_blank(c)) break;
    }

    size_t value_start = key_end;
    while (value_start < len && is_blank(line[value_start])) ++value_start;
    if (value_start < len && (line[value_start] == '=' || line[value_start] == ':')) {
        ++value_start;
        while (value_start < len && is_blank(line[value_start])) ++value_start;
    }

    props.set(unescape(line.substr(0, key_end)), unescape(line.substr(value_start)));
}

} // anonymous namespace

Properties parse_properties(std::istream& in) {
    Properties props;
    std::string raw;
    std::string logical;
    bool continuing = false;

    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        size_t start = 0;
        while (start < raw.size() && is_blank(raw[start])) ++start;
        std::string line = raw.substr(start);

        if (!continuing) {
            if (line.empty() || line[0] == '#' || line[0] == '!') continue;
        }

        if (continues(line)) {
            logical += line.substr(0, line.size() - 1);
            continuing = true;
            continue;
        }

        logical += line;
        continuing = false;
        parse_logical_line(logical, props);
        logical.clear();
    }

    if (continuing && !logical.empty()) {
        parse_logical_line(logical, props);
    }
    return props;
}

// ============================================================================
// XML properties
// ============================================================================

Properties parse_xml_properties(std::istream& in) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    tinyxml2::XMLDocument doc;
    if (doc.Parse(text.c_str(), text.size()) != tinyxml2::XML_SUCCESS) {
        std::string details = doc.ErrorStr() ? doc.ErrorStr() : "unknown error";
        throw StagingError("Invalid XML properties: " + details);
    }

    const tinyxml2::XMLElement* root = doc.FirstChildElement("properties");
    if (root == nullptr) {
        throw StagingError("Invalid XML properties: missing <properties> root element");
    }

    Properties props;
    for (const tinyxml2::XMLElement* entry = root->FirstChildElement("entry");
         entry != nullptr;
         entry = entry->NextSiblingElement("entry")) {
        const char* key = entry->Attribute("key");
        if (key == nullptr) {
            throw StagingError("Invalid XML properties: <entry> without key attribute at line " +
                               std::to_string(entry->GetLineNum()));
        }
        const char* value = entry->GetText();
        props.set(key, value != nullptr ? value : "");
    }
    return props;
}

Properties load_properties_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(file.string());
    }
    return parse_properties(in);
}

// ============================================================================
// Structure check
// ============================================================================

StructureReport check_structure(const std::vector<Properties>& sets) {
    StructureReport report;
    std::vector<std::set<std::string>> key_sets;
    key_sets.reserve(sets.size());
    for (const auto& props : sets) {
        key_sets.push_back(props.key_set());
        report.keys.insert(key_sets.back().begin(), key_sets.back().end());
    }

    for (size_t i = 0; i < key_sets.size(); ++i) {
        for (size_t j = i + 1; j < key_sets.size(); ++j) {
            std::set_symmetric_difference(
                key_sets[i].begin(), key_sets[i].end(),
                key_sets[j].begin(), key_sets[j].end(),
                std::inserter(report.difference, report.difference.end()));
        }
    }
    return report;
}

} // namespace stagehand
