#include "cli/command.hpp"
#include "cli/runner.hpp"
#include "common/db_config.hpp"
#include "common/logger.hpp"
#include "storage/database.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;

using sluice::storage::Database;

namespace {

asio::awaitable<void> run(Database& db, sluice::cli::Command cmd, int& rc) {
    rc = co_await sluice::cli::execute(db, std::move(cmd), std::cout);
    std::cout.flush();
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("sluice-cli options");
    desc.add_options()
        ("help,h", "Show this help")
        ("column,c", po::value<std::vector<std::string>>()->composing(),
            "Column to open (repeatable)")
        ("command", po::value<std::vector<std::string>>(),
            "GET|PUT|DEL|COUNT|SCAN|RSCAN|FROM|RFROM|KEYS|STATS|FILES ...,\n"
            "or WATCH col key <command>");
    sluice::add_options(desc);

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return vm.count("help") ? 0 : 1;
    }

    sluice::DbConfig cfg;
    try {
        cfg = sluice::config_from(vm);
    } catch (const std::exception& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 1;
    }

    sluice::init_default_logger(sluice::parse_log_level(cfg.log_level));

    auto parsed = sluice::cli::parse_command(vm["command"].as<std::vector<std::string>>());
    if (auto* err = std::get_if<sluice::cli::ParseError>(&parsed)) {
        fprintf(stderr, "ERROR %s\n", err->message.c_str());
        return 1;
    }

    std::vector<std::string> columns;
    if (vm.count("column")) {
        columns = vm["column"].as<std::vector<std::string>>();
    }

    int rc = 1;
    try {
        asio::io_context ioc;
        auto db = Database::open(cfg, sluice::storage::describe(columns));

        asio::co_spawn(ioc,
                       run(*db, std::get<sluice::cli::Command>(std::move(parsed)), rc),
                       asio::detached);
        ioc.run();
        db->close();
    } catch (const std::exception& ex) {
        spdlog::error("sluice-cli: {}", ex.what());
        return 1;
    }

    return rc;
}
