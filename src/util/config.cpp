// REVGUARD - Settings Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace revguard {
namespace util {

namespace {

const char* const COMMAND_LINE = "<command-line>";

std::string Strip(const std::string& text) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(text.begin(), text.end(), notSpace);
    auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string StripQuotes(const std::string& text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
        text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

/// Letters, digits, '_' and '-', in dot-separated non-empty parts
bool IsValidKey(const std::string& key) {
    if (key.empty() || key.front() == '.' || key.back() == '.' ||
        key.find("..") != std::string::npos) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

} // namespace

std::string ConfigResult::ToString() const {
    if (origin.empty()) {
        return error;
    }
    return error + " (" + origin + ")";
}

ConfigResult Settings::Store(const std::string& key, const std::string& text,
                             const std::string& origin) {
    if (!IsValidKey(key)) {
        return ConfigResult::Fail("invalid key '" + key + "'", origin);
    }
    values_[key] = Value{text, origin};
    return ConfigResult::Ok();
}

ConfigResult Settings::LoadString(const std::string& text, const std::string& source) {
    std::istringstream in(text);
    std::string section;
    std::string raw;
    int lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string origin = source + ":" + std::to_string(lineNo);
        std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return ConfigResult::Fail("unterminated section header", origin);
            }
            section = Strip(line.substr(1, line.size() - 2));
            if (!section.empty() && !IsValidKey(section)) {
                return ConfigResult::Fail("invalid section '" + section + "'", origin);
            }
            continue;
        }

        size_t eq = line.find('=');
        std::string key = Strip(line.substr(0, eq));
        std::string value = eq == std::string::npos ? "true"
                                                    : StripQuotes(Strip(line.substr(eq + 1)));
        if (!section.empty()) {
            key = section + "." + key;
        }
        ConfigResult stored = Store(key, value, origin);
        if (!stored.ok) {
            return stored;
        }
    }
    return ConfigResult::Ok();
}

ConfigResult Settings::LoadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return ConfigResult::Fail("cannot open config file", path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return LoadString(contents.str(), path);
}

ConfigResult Settings::LoadArgs(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        size_t start = arg.find_first_not_of('-');
        if (start == 0 || start == std::string::npos) {
            continue;  // positional, or a lone "-" meaning stdin
        }
        arg.erase(0, start);

        size_t eq = arg.find('=');
        std::string value = eq == std::string::npos ? "true" : arg.substr(eq + 1);
        ConfigResult stored = Store(arg.substr(0, eq), value, COMMAND_LINE);
        if (!stored.ok) {
            return stored;
        }
    }
    return ConfigResult::Ok();
}

void Settings::Set(const std::string& key, const std::string& value) {
    values_[key] = Value{value, "<set>"};
}

std::optional<std::string> Settings::Get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second.text;
}

std::string Settings::GetString(const std::string& key, const std::string& fallback) const {
    return Get(key).value_or(fallback);
}

std::optional<int64_t> Settings::GetInt(const std::string& key) const {
    auto text = Get(key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text->c_str(), &end, 10);
    if (errno == ERANGE || end != text->c_str() + text->size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

bool Settings::GetBool(const std::string& key, bool fallback) const {
    auto text = Get(key);
    if (!text) {
        return fallback;
    }
    std::string lower(*text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    return fallback;
}

std::string Settings::Origin(const std::string& key) const {
    auto it = values_.find(key);
    return it == values_.end() ? "" : it->second.origin;
}

} // namespace util
} // namespace revguard
