// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace core {

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------
namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_bundle(std::string_view body, std::string_view short_flags) {
    if (body.size() < 2 || short_flags.empty()) return false;
    for (char c : body) {
        if (short_flags.find(c) == std::string_view::npos) return false;
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

Result<void> Config::parse_args(int argc, const char* const argv[],
                                std::string_view short_flags) {
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};

        if (options_done || arg.size() < 2 || arg.front() != '-') {
            positionals_.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const bool single_dash = !arg.starts_with("--");
        std::string_view body = arg.substr(single_dash ? 1 : 2);

        auto eq_pos = body.find('=');
        if (eq_pos != std::string_view::npos) {
            std::string_view key = trim(body.substr(0, eq_pos));
            if (key.empty()) {
                return Error(ErrorCode::CONFIG_ERROR,
                             "malformed option '" + std::string{arg} + "'");
            }
            cli_values_[std::string{key}] =
                std::string{trim(body.substr(eq_pos + 1))};
        } else if (single_dash && is_bundle(body, short_flags)) {
            for (char c : body) {
                cli_values_[std::string(1, c)] = "1";
            }
        } else {
            cli_values_[std::string{body}] = "1";
        }
    }
    return make_ok();
}

Result<void> Config::parse_file(const std::filesystem::path& path,
                                std::string_view active_section) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return Error(ErrorCode::CONFIG_MISSING,
                     "unable to open config file '" + path.string() + "'");
    }

    std::string section;
    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv{line};
        if (auto hash = sv.find('#'); hash != std::string_view::npos) {
            sv = sv.substr(0, hash);
        }
        sv = trim(sv);
        if (sv.empty()) continue;

        if (sv.front() == '[' && sv.back() == ']') {
            section = std::string{trim(sv.substr(1, sv.size() - 2))};
            continue;
        }
        if (!section.empty() && section != active_section) continue;

        auto eq_pos = sv.find('=');
        std::string_view key = trim(sv.substr(0, eq_pos));
        std::string_view val = eq_pos == std::string_view::npos
                                   ? std::string_view{"1"}
                                   : trim(sv.substr(eq_pos + 1));
        if (key.empty()) {
            return Error(ErrorCode::CONFIG_ERROR,
                         "empty key on line " + std::to_string(line_num) +
                         " of '" + path.string() + "'");
        }

        file_values_[std::string{key}] = std::string{val};
    }
    return make_ok();
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    file_values_[std::string{key}] = std::move(value);
}

std::vector<std::string> Config::cli_keys() const {
    std::vector<std::string> keys;
    keys.reserve(cli_values_.size());
    for (const auto& [key, value] : cli_values_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::optional<std::string> Config::get(std::string_view key) const {
    std::string k{key};
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

Result<int64_t> Config::get_int(std::string_view key,
                                int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    int64_t result = 0;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "cannot parse '" + s + "' as integer for -" +
                     std::string{key});
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value() || val->empty()) return default_val;
    const std::string& v = *val;
    if (iequals(v, "1") || iequals(v, "true") ||
        iequals(v, "yes") || iequals(v, "on")) {
        return true;
    }
    if (iequals(v, "0") || iequals(v, "false") ||
        iequals(v, "no") || iequals(v, "off")) {
        return false;
    }
    return default_val;
}

bool Config::has(std::string_view key) const {
    return get(key).has_value();
}

// ---------------------------------------------------------------------------
// Config -- convenience accessors
// ---------------------------------------------------------------------------

std::string Config::network() const {
    return get_bool(CONF_TESTNET) ? "test" : "main";
}

std::filesystem::path Config::data_dir() const {
    auto custom = get(CONF_DATADIR);
    if (custom.has_value() && !custom->empty()) {
        return std::filesystem::path{*custom};
    }
    return default_data_dir();
}

std::filesystem::path Config::default_data_dir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::filesystem::path{".bitcoin"};
    }
    return std::filesystem::path{home} / ".bitcoin";
}

} // namespace core
