#include "stagehand/Util.hpp"
#include "stagehand/Errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <system_error>
#if defined(_WIN32)
  #include <windows.h>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace fs = std::filesystem;

namespace stagehand {

void deep_merge(nlohmann::json& a, const nlohmann::json& b) {
    if (b.is_null()) {
        return;
    }
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

const nlohmann::json& get_by_dot(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* cur = &obj;
    std::string token;
    std::istringstream iss(path);
    while (std::getline(iss, token, '.')) {
        if (!cur->is_object()) {
            throw KeyError(path, token);
        }
        auto it = cur->find(token);
        if (it == cur->end()) {
            throw KeyError(path, token);
        }
        cur = &(*it);
    }
    return *cur;
}

bool exists_by_dot(const nlohmann::json& obj, const std::string& path) {
    try {
        (void)get_by_dot(obj, path);
        return true;
    } catch (const KeyError&) {
        return false;
    }
}

void set_by_dot(nlohmann::json& obj, const std::string& path, const nlohmann::json& value) {
    nlohmann::json* cur = &obj;
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!cur->is_object()) {
            *cur = nlohmann::json::object();
        }
        if (!cur->contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = nlohmann::json::object();
        }
        cur = &(*cur)[p];
    }
    if (!cur->is_object()) {
        *cur = nlohmann::json::object();
    }
    (*cur)[parts.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        tok = trim(tok);
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::map<std::string, nlohmann::json> parse_overrides(const std::string& s) {
    std::map<std::string, nlohmann::json> out;
    if (s.empty()) return out;
    // split on commas that are not inside braces/brackets/quotes
    int depth = 0;
    bool in_str = false;
    char str_ch = '\0';
    std::string buf;
    auto flush = [&](){
        std::string pair = buf;
        buf.clear();
        auto pos = pair.find(':');
        if (pos == std::string::npos) return;
        std::string k = trim(pair.substr(0, pos));
        std::string v = trim(pair.substr(pos + 1));
        if (k.empty()) return;
        out[k] = parse_json_or_string(v);
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_str) {
            buf += c;
            if (c == str_ch && (i == 0 || s[i-1] != '\\')) in_str = false;
            continue;
        }
        if (c == '"' || c == '\'') { in_str = true; str_ch = c; buf += c; continue; }
        if (c == '{' || c == '[') { depth++; buf += c; continue; }
        if (c == '}' || c == ']') { depth--; buf += c; continue; }
        if (c == ',' && depth == 0) { flush(); continue; }
        buf += c;
    }
    if (!buf.empty()) flush();
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPTCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
#endif
    return envs;
}

nlohmann::json parse_json_or_string(const std::string& raw) {
    try {
        nlohmann::json j = nlohmann::json::parse(raw);
        if (j.is_number() && j.dump() != trim(raw)) {
            return nlohmann::json(raw);
        }
        return j;
    } catch (const nlohmann::json::parse_error&) {
        return nlohmann::json(raw);
    }
}

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string read_text(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(file.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> read_lines(const fs::path& file) {
    const std::string text = read_text(file);
    std::vector<std::string> lines;
    std::string line;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(line);
            line.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            continue;
        }
        line += c;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

void write_text(const fs::path& file, const std::string& text) {
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            throw StagingError("Failed to create directory " + file.parent_path().string() +
                               ": " + ec.message());
        }
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) throw StagingError("Failed to open for write: " + file.string());
    out << text;
    if (!out) throw StagingError("Failed to write: " + file.string());
}

std::vector<fs::path> list_files_recursive(const fs::path& root) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        if (it->is_regular_file()) {
            files.push_back(fs::relative(it->path(), root));
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> copy_tree(const fs::path& from, const fs::path& to) {
    std::vector<fs::path> copied;
    for (const auto& rel : list_files_recursive(from)) {
        fs::path dest = to / rel;
        fs::create_directories(dest.parent_path());
        fs::copy_file(from / rel, dest, fs::copy_options::overwrite_existing);
        copied.push_back(dest);
    }
    return copied;
}

} // namespace stagehand
