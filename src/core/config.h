#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF             = "conf";
inline constexpr const char* CONF_DATADIR          = "datadir";
inline constexpr const char* CONF_TESTNET          = "testnet";
inline constexpr const char* CONF_RPCCONNECT       = "rpcconnect";
inline constexpr const char* CONF_RPCPORT          = "rpcport";
inline constexpr const char* CONF_RPCUSER          = "rpcuser";
inline constexpr const char* CONF_RPCPASSWORD      = "rpcpassword";
inline constexpr const char* CONF_RPCCOOKIEFILE    = "rpccookiefile";
inline constexpr const char* CONF_RPCWALLET        = "rpcwallet";
inline constexpr const char* CONF_RPCCLIENTTIMEOUT = "rpcclienttimeout";
inline constexpr const char* CONF_DEBUGLOGFILE     = "debuglogfile";

// ---------------------------------------------------------------------------
// Config  --  layered key/value configuration
//
// Priority order: command-line args  >  config file  >  caller defaults
// (the default_val of each getter). Positional arguments are kept apart
// from options and returned in order by positionals().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments (argv[0] is skipped).
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   -abc                       (bundled flags, when every character
    ///                               is one of @p short_flags)
    ///   --                         (everything after is positional)
    /// Anything not starting with '-' is a positional argument.
    Result<void> parse_args(int argc, const char* const argv[],
                            std::string_view short_flags = {});

    /// Parse a bitcoin.conf style file.
    ///   key=value    # comment
    ///   [main] / [test] / [regtest]
    /// Keys inside a section only apply when the section equals
    /// @p active_section; keys before any section header always apply.
    /// A missing file yields CONFIG_MISSING; a line with no key yields
    /// CONFIG_ERROR naming the line.
    Result<void> parse_file(const std::filesystem::path& path,
                            std::string_view active_section);

    // -- setters / getters --------------------------------------------------

    /// Set a key at config-file priority, replacing earlier file values.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Integer value, @p default_val when absent, CONFIG_ERROR when the
    /// value is not a whole decimal integer.
    [[nodiscard]] Result<int64_t> get_int(std::string_view key,
                                          int64_t default_val) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive); an unknown
    /// spelling falls back to @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positionals() const {
        return positionals_;
    }

    /// Keys given on the command line, sorted.
    [[nodiscard]] std::vector<std::string> cli_keys() const;

    // -- convenience accessors ----------------------------------------------

    /// "test" when -testnet is set, "main" otherwise. Names the config file
    /// section that applies.
    [[nodiscard]] std::string network() const;

    /// The "datadir" key if set, otherwise default_data_dir(). This is the
    /// base directory; the network subdirectory is added by callers that
    /// need it (the cookie file lives there).
    [[nodiscard]] std::filesystem::path data_dir() const;

    /// $HOME/.bitcoin, or ".bitcoin" when HOME is unset.
    [[nodiscard]] static std::filesystem::path default_data_dir();

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap = std::unordered_map<std::string, std::string>;

    ValueMap cli_values_;
    ValueMap file_values_;
    std::vector<std::string> positionals_;
};

} // namespace core
