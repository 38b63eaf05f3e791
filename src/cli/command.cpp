#include "cli/command.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sluice::cli {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    while (!line.empty()) {
        const auto start = line.find_first_not_of(' ');
        if (start == std::string_view::npos) {
            break;
        }
        line.remove_prefix(start);
        const auto end = line.find(' ');
        words.emplace_back(line.substr(0, end));
        if (end == std::string_view::npos) {
            break;
        }
        line.remove_prefix(end);
    }
    return words;
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ParseError> parse_command(const std::vector<std::string>& words) {
    if (words.empty()) {
        return ParseError{"empty command"};
    }

    const auto verb = upper(words[0]);
    const auto argc = words.size() - 1;
    auto arg = [&](std::size_t i) -> const std::string& { return words[i + 1]; };

    // ── GET col key / DEL col key ────────────────────────────────────────────
    if (verb == "GET" || verb == "DEL") {
        if (argc != 2) {
            return ParseError{verb + " requires: column key"};
        }
        if (verb == "GET") {
            return GetCmd{arg(0), arg(1)};
        }
        return DelCmd{arg(0), arg(1)};
    }

    // ── WATCH col key CMD... ─────────────────────────────────────────────────
    if (verb == "WATCH") {
        if (argc < 3) {
            return ParseError{"WATCH requires: column key command"};
        }
        std::vector<std::string> then(words.begin() + 3, words.end());
        if (upper(then[0]) == "WATCH") {
            return ParseError{"WATCH cannot wrap another WATCH"};
        }
        auto inner = parse_command(then);
        if (auto* err = std::get_if<ParseError>(&inner)) {
            return ParseError{"WATCH " + err->message};
        }
        return WatchCmd{arg(0), arg(1), std::move(then)};
    }

    // ── PUT col key value... ─────────────────────────────────────────────────
    //
    // The value is every remaining word; it may contain spaces.
    if (verb == "PUT") {
        if (argc < 3) {
            return ParseError{"PUT requires: column key value"};
        }
        std::string value = arg(2);
        for (std::size_t i = 3; i < argc; ++i) {
            value += ' ';
            value += arg(i);
        }
        return PutCmd{arg(0), arg(1), std::move(value)};
    }

    // ── COUNT / SCAN / RSCAN / KEYS col [prefix] ─────────────────────────────
    if (verb == "COUNT" || verb == "SCAN" || verb == "RSCAN" || verb == "KEYS") {
        if (argc < 1 || argc > 2) {
            return ParseError{verb + " requires: column [prefix]"};
        }
        std::string prefix = argc == 2 ? arg(1) : std::string{};
        if (verb == "COUNT") {
            return CountCmd{arg(0), std::move(prefix)};
        }
        return ScanCmd{
            .column    = arg(0),
            .prefix    = std::move(prefix),
            .reverse   = verb == "RSCAN",
            .keys_only = verb == "KEYS",
        };
    }

    // ── FROM / RFROM col key ─────────────────────────────────────────────────
    if (verb == "FROM" || verb == "RFROM") {
        if (argc != 2) {
            return ParseError{verb + " requires: column key"};
        }
        return FromCmd{arg(0), arg(1), verb == "RFROM"};
    }

    // ── STATS [col] [property] ───────────────────────────────────────────────
    if (verb == "STATS") {
        if (argc > 2) {
            return ParseError{"STATS takes at most: column property"};
        }
        StatsCmd cmd;
        if (argc >= 1) {
            cmd.column = arg(0);
        }
        if (argc == 2) {
            cmd.property = arg(1);
        }
        return cmd;
    }

    // ── FILES [col] ──────────────────────────────────────────────────────────
    if (verb == "FILES") {
        if (argc > 1) {
            return ParseError{"FILES takes at most one argument"};
        }
        FilesCmd cmd;
        if (argc == 1) {
            cmd.column = arg(0);
        }
        return cmd;
    }

    return ParseError{"unknown command: " + words[0]};
}

std::variant<Command, ParseError> parse_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return parse_command(split_words(line));
}

} // namespace sluice::cli
