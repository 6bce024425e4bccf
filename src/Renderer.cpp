#include "stagehand/Renderer.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace fs = std::filesystem;

namespace stagehand {

namespace {

bool is_id_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_id_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

} // anonymous namespace

std::string VelocityRenderer::render(const std::string& text,
                                     const Properties& context,
                                     const std::string& origin) const {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;

    auto unresolved = [&](const std::string& reference, bool quiet, const std::string& literal) {
        if (quiet) return;
        if (strict_) throw RenderError(origin, reference);
        out += literal;
    };

    while (i < n) {
        char c = text[i];
        if (c == '\\' && i + 1 < n && text[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        }
        if (c != '$') {
            out += c;
            ++i;
            continue;
        }

        size_t j = i + 1;
        bool quiet = j < n && text[j] == '!';
        if (quiet) ++j;

        // ${key} / $!{key}
        if (j < n && text[j] == '{') {
            size_t close = text.find('}', j + 1);
            if (close == std::string::npos) {
                out += text.substr(i);
                break;
            }
            std::string key = trim(text.substr(j + 1, close - j - 1));
            auto value = context.get(key);
            if (value) {
                out += *value;
            } else {
                unresolved(key, quiet, text.substr(i, close + 1 - i));
            }
            i = close + 1;
            continue;
        }

        // $key / $!key
        if (j < n && is_id_start(text[j])) {
            size_t end = j;
            while (end < n && is_id_char(text[end])) ++end;
            std::vector<size_t> segment_ends{end};
            while (end + 1 < n && text[end] == '.' && is_id_start(text[end + 1])) {
                end += 1;
                while (end < n && is_id_char(text[end])) ++end;
                segment_ends.push_back(end);
            }

            bool resolved = false;
            for (auto it = segment_ends.rbegin(); it != segment_ends.rend(); ++it) {
                auto value = context.get(text.substr(j, *it - j));
                if (value) {
                    out += *value;
                    i = *it;
                    resolved = true;
                    break;
                }
            }
            if (!resolved) {
                unresolved(text.substr(j, end - j), quiet, text.substr(i, end - i));
                i = end;
            }
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

std::vector<fs::path> VelocityRenderer::render_directory(const Properties& context,
                                                         const fs::path& source_dir,
                                                         const fs::path& dest_dir) {
    std::vector<fs::path> written;
    for (const auto& rel : list_files_recursive(source_dir)) {
        const fs::path source = source_dir / rel;
        const fs::path dest = dest_dir / rel;
        write_text(dest, render(read_text(source), context, source.string()));
        written.push_back(dest);
    }
    spdlog::info("Rendered {} template(s) into {}", written.size(), dest_dir.string());
    return written;
}

} // namespace stagehand
