// REVGUARD - Settings
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Flat key/value settings read from an INI-style file and from -key=value
// options. Keys under a [section] header and dotted options share one
// namespace: "[protocol] treasury=x" and "-protocol.treasury=x" both set
// "protocol.treasury". Later sources overwrite earlier ones.
//
// File syntax: '#' or ';' comments, key=value, a bare key means "true",
// values may be wrapped in single or double quotes.

#ifndef REVGUARD_UTIL_CONFIG_H
#define REVGUARD_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace revguard {
namespace util {

/// Looked up inside the data directory when -conf is not given
constexpr const char* DEFAULT_CONFIG_FILENAME = "revguard.conf";

/// Outcome of loading or validating settings
struct ConfigResult {
    bool ok{true};
    std::string error;
    std::string origin;  // "file:line", "<command-line>" or empty

    static ConfigResult Ok() { return ConfigResult{}; }

    static ConfigResult Fail(const std::string& error, const std::string& origin = "") {
        return ConfigResult{false, error, origin};
    }

    /// "error (origin)"
    std::string ToString() const;
};

class Settings {
public:
    ConfigResult LoadFile(const std::string& path);

    ConfigResult LoadString(const std::string& text, const std::string& source = "<string>");

    /// Options start with one or more dashes; other arguments are skipped
    ConfigResult LoadArgs(int argc, char* argv[]);

    void Set(const std::string& key, const std::string& value);

    bool Has(const std::string& key) const { return values_.count(key) > 0; }

    std::optional<std::string> Get(const std::string& key) const;

    std::string GetString(const std::string& key, const std::string& fallback) const;

    /// nullopt when missing or not a whole decimal number
    std::optional<int64_t> GetInt(const std::string& key) const;

    /// true/false, yes/no, on/off, 1/0; `fallback` when missing or unrecognized
    bool GetBool(const std::string& key, bool fallback) const;

    /// Where a key was last set; empty if it never was
    std::string Origin(const std::string& key) const;

    size_t Size() const { return values_.size(); }

private:
    struct Value {
        std::string text;
        std::string origin;
    };

    ConfigResult Store(const std::string& key, const std::string& text,
                       const std::string& origin);

    std::map<std::string, Value> values_;
};

} // namespace util
} // namespace revguard

#endif // REVGUARD_UTIL_CONFIG_H
