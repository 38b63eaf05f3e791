#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sluice::cli {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of one sluice-cli command.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct GetCmd {
    std::string column;
    std::string key;
};

struct PutCmd {
    std::string column;
    std::string key;
    std::string value;
};

struct DelCmd {
    std::string column;
    std::string key;
};

struct CountCmd {
    std::string column;
    std::string prefix;
};

// SCAN / RSCAN / KEYS: every entry (or key) with an optional prefix.
struct ScanCmd {
    std::string column;
    std::string prefix;
    bool        reverse = false;
    bool        keys_only = false;
};

// FROM / RFROM: entries starting at `key`.
struct FromCmd {
    std::string column;
    std::string key;
    bool        reverse = false;
};

struct StatsCmd {
    std::optional<std::string> column;
    std::string property = "rocksdb.stats";
};

struct FilesCmd {
    std::optional<std::string> column;
};

// WATCH col key CMD...: register a watch on `key`, run CMD in the same
// process, then report whether the key was written meanwhile.  CMD is kept as
// words and has already been validated by the parser.
struct WatchCmd {
    std::string column;
    std::string key;
    std::vector<std::string> then;
};

using Command = std::variant<GetCmd, PutCmd, DelCmd, CountCmd, ScanCmd, FromCmd,
                             StatsCmd, FilesCmd, WatchCmd>;

struct ParseError {
    std::string message;
};

// Parse the command words following the options, e.g. {"PUT", "users", "k", "v"}.
// The verb is case-insensitive.  PUT joins every word after the key into the
// value with single spaces.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ParseError> parse_command(const std::vector<std::string>& words);

// Same, splitting one line on spaces first.
[[nodiscard]] std::variant<Command, ParseError> parse_command(std::string_view line);

} // namespace sluice::cli
