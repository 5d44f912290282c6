/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#include "md/md_path.h"

namespace rbxmd::md {
namespace {
constexpr std::string_view kOpen = "[\"";
constexpr std::string_view kClose = "\"]";

// Position of the closing "] for a bracket token opened at `start`, honouring
// backslash escapes. npos when the token is unterminated.
std::size_t find_bracket_close(std::string_view path, std::size_t start) {
    std::size_t i = start + kOpen.size();
    while (i < path.size()) {
        const char c = path[i];
        if (c == '\\' && i + 1 < path.size()) {
            i += 2;
            continue;
        }
        if (c == '"' && i + 1 < path.size() && path[i + 1] == ']') {
            return i;
        }
        i++;
    }
    return std::string_view::npos;
}

std::string unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            out.push_back(s[++i]);
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}
}  // namespace

bool needs_quoting(std::string_view name) {
    for (char c : name) {
        if (c == ' ' || c == '.' || c == '[' || c == ']' || c == '"' || c == '\\') {
            return true;
        }
    }
    return false;
}

std::string encode_segment(std::string_view name) {
    if (!needs_quoting(name)) {
        return std::string(name);
    }
    std::string out(kOpen);
    for (char c : name) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.append(kClose);
    return out;
}

std::string join(std::string_view parent_path, std::string_view segment_text, std::string_view raw_name) {
    std::string out(parent_path);
    if (!parent_path.empty() && !needs_quoting(raw_name)) {
        out.push_back('.');
    }
    out.append(segment_text);
    return out;
}

std::vector<std::string> split(std::string_view path) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < path.size()) {
        if (path.substr(pos, kOpen.size()) == kOpen) {
            const std::size_t close = find_bracket_close(path, pos);
            if (close != std::string_view::npos) {
                const std::size_t body = pos + kOpen.size();
                out.push_back(unescape(path.substr(body, close - body)));
                pos = close + kClose.size();
                if (pos < path.size() && path[pos] == '.') {
                    pos++;
                }
                continue;
            }
        }

        // Plain token: ends at an unescaped '.' or at a terminated bracket
        // opener. An unterminated [" is kept as ordinary text.
        std::string token;
        while (pos < path.size()) {
            const char c = path[pos];
            if (c == '\\' && pos + 1 < path.size()) {
                token.push_back(path[pos + 1]);
                pos += 2;
                continue;
            }
            if (c == '.') {
                pos++;
                break;
            }
            if (!token.empty() && path.substr(pos, kOpen.size()) == kOpen
                && find_bracket_close(path, pos) != std::string_view::npos) {
                break;
            }
            token.push_back(c);
            pos++;
        }
        out.push_back(std::move(token));
    }
    return out;
}

std::string make_path(const std::vector<std::string>& names) {
    std::string path;
    for (const auto& name : names) {
        path = join(path, encode_segment(name), name);
    }
    return path;
}

std::string leaf_name(std::string_view path) {
    auto segments = split(path);
    if (segments.empty()) {
        return {};
    }
    return std::move(segments.back());
}

std::string first_segment(std::string_view path) {
    auto segments = split(path);
    if (segments.empty()) {
        return {};
    }
    return std::move(segments.front());
}

}  // namespace rbxmd::md
