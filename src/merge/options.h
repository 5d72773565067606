#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_OPTIONS_H
#define TXCOMBINE_MERGE_OPTIONS_H

#include "core/config.h"
#include "core/error.h"
#include "merge/combiner.h"

#include <optional>
#include <string>

namespace merge {

/// Single-letter flags that may be bundled, as in "-vtn".
inline constexpr const char* SHORT_FLAGS = "vtnoh";

/// What the command line asks for, once the config is loaded.
struct CommandLine {
    /// -h / -help: print usage and exit; nothing else is checked.
    bool           help = false;
    /// -v: DEBUG logging instead of WARN.
    bool           verbose = false;
    bool           testnet = false;
    CombineOptions combine;
    std::string    txid1;
    std::string    txid2;
    std::optional<std::string> debug_log_file;
};

/// Parses @p argv into @p config, rejects options the tool does not know,
/// then layers in the config file for the selected network: the explicit
/// -conf file, or <datadir>/bitcoin.conf when it exists.
[[nodiscard]] core::Result<void> load_config(core::Config& config, int argc,
                                             const char* const argv[]);

/// Resolves the loaded config into a CommandLine. Anything other than
/// exactly two positionals is CONFIG_ERROR unless help was requested.
[[nodiscard]] core::Result<CommandLine> command_line_from_config(
    const core::Config& config);

} // namespace merge

#endif // TXCOMBINE_MERGE_OPTIONS_H
