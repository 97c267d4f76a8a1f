// Tumo Markets CLI
//
// Drives an in-process MarginEngine from the command line, a script file, or
// an interactive prompt. Every emitted event is printed as one JSON line.

#include "tumo/engine.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace tumo;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string script_path;
    std::string deployer = "0x1";
    bool verbose = false;
    bool interactive = true;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Event Printer
//------------------------------------------------------------------------------

class JsonPrinter : public IEventSink {
public:
    void on_event(const Event& event) override {
        std::cout << to_json(event).dump() << "\n";
    }
};

//------------------------------------------------------------------------------
// Session
//------------------------------------------------------------------------------

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

class Session {
public:
    Session(const Address& deployer, const EngineConfig& config)
        : deployer_(deployer), engine_(deployer, config, &printer_) {}

    // Returns false on "quit"
    bool execute(const std::vector<std::string>& parts);

    // Engine calls that returned an error status
    int failures() const { return failures_; }

private:
    Address deployer_;
    JsonPrinter printer_;
    MarginEngine engine_;
    int failures_ = 0;

    Capability cap(Role role) const {
        auto found = engine_.capability_of(deployer_, role);
        if (!found) {
            throw UsageError(std::string("deployer no longer holds the ") + to_string(role) + " capability");
        }
        return *found;
    }

    void print_status(int32_t status) {
        if (status != errors::OK) ++failures_;
        json out = {{"status", errors::to_string(status)}, {"code", status}};
        std::cout << out.dump() << "\n";
    }
};

namespace {

uint64_t now_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

void require_args(const std::vector<std::string>& parts, size_t n, const char* usage) {
    if (parts.size() < n) {
        throw UsageError(std::string("Usage: ") + usage);
    }
}

uint64_t parse_u64(const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError("Invalid number: " + s);
    }
    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        throw UsageError("Number out of range: " + s);
    }
}

Address parse_address(const std::string& s) {
    auto addr = address::from_hex(s);
    if (!addr) {
        throw UsageError("Invalid address: " + s);
    }
    return *addr;
}

uint32_t parse_market_id(const std::string& s) {
    uint64_t id = parse_u64(s);
    if (id > UINT32_MAX) {
        throw UsageError("Market id out of range: " + s);
    }
    return static_cast<uint32_t>(id);
}

Currency parse_asset(const std::string& s) {
    return Currency(parse_address(s));
}

Direction parse_direction(const std::string& s) {
    if (s == "long" || s == "1") return Direction::LONG;
    if (s == "short" || s == "2") return Direction::SHORT;
    // Other byte values pass through so the engine reports InvalidDirection
    uint64_t code = parse_u64(s);
    if (code > UINT8_MAX) {
        throw UsageError("Direction out of range: " + s);
    }
    return static_cast<Direction>(code);
}

bool parse_bool(const std::string& s) {
    if (s == "true" || s == "1" || s == "on") return true;
    if (s == "false" || s == "0" || s == "off") return false;
    throw UsageError("Invalid boolean: " + s);
}

uint8_t parse_leverage(const std::string& s) {
    uint64_t v = parse_u64(s);
    if (v > UINT8_MAX) {
        throw UsageError("Leverage out of range: " + s);
    }
    return static_cast<uint8_t>(v);
}

// Optional trailing timestamp argument
uint64_t timestamp_arg(const std::vector<std::string>& parts, size_t index) {
    return (parts.size() > index) ? parse_u64(parts[index]) : now_ms();
}

json position_json(const Position& p) {
    return {
        {"owner", address::to_hex(p.owner)},
        {"size", p.size},
        {"collateral_amount", p.collateral_amount},
        {"entry_price", p.entry_price},
        {"direction", to_string(p.direction)},
        {"open_timestamp", p.open_timestamp}
    };
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

void print_help() {
    std::cout << "Commands:\n"
              << "  pool <asset>                                   Create a liquidity pool\n"
              << "  feed <feed_id>                                 Create a price feed\n"
              << "  market <id> <asset> <feed_id> [leverage]       Create a market\n"
              << "  add_liquidity <asset> <amount>\n"
              << "  remove_liquidity <asset> <amount>\n"
              << "  price <feed_id> <price> [ts]                   Update a feed\n"
              << "  get_price <feed_id>\n"
              << "  open <market> <account> <long|short> <size> <collateral> [ts]\n"
              << "  close <market> <account> [ts]\n"
              << "  liquidate <market> <liquidator> <owner> [ts]\n"
              << "  pause <market> <true|false>\n"
              << "  leverage <market> <n>\n"
              << "  position <market> <account>\n"
              << "  positions <market>\n"
              << "  balance <asset>\n"
              << "  stats\n"
              << "  help\n"
              << "  quit\n";
}

} // namespace

bool Session::execute(const std::vector<std::string>& parts) {
    if (parts.empty()) return true;

    std::string cmd = parts[0];
    for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (cmd == "quit" || cmd == "exit") {
        return false;
    } else if (cmd == "help") {
        print_help();
    } else if (cmd == "pool") {
        require_args(parts, 2, "pool <asset>");
        print_status(engine_.create_liquidity_pool(cap(Role::ADMIN), deployer_, parse_asset(parts[1])));
    } else if (cmd == "feed") {
        require_args(parts, 2, "feed <feed_id>");
        print_status(engine_.create_price_feed(cap(Role::ORACLE_OPERATOR), deployer_, parse_u64(parts[1])));
    } else if (cmd == "market") {
        require_args(parts, 4, "market <id> <asset> <feed_id> [leverage]");
        MarketParams params{
            .market_id = parse_market_id(parts[1]),
            .asset = parse_asset(parts[2]),
            .feed_id = parse_u64(parts[3]),
            .leverage = (parts.size() > 4) ? parse_leverage(parts[4]) : uint8_t{0}
        };
        print_status(engine_.create_market(cap(Role::ADMIN), deployer_, params));
    } else if (cmd == "add_liquidity") {
        require_args(parts, 3, "add_liquidity <asset> <amount>");
        Coin coin{parse_asset(parts[1]), parse_u64(parts[2])};
        print_status(engine_.add_liquidity(cap(Role::LIQUIDITY_PROVIDER), deployer_, coin));
    } else if (cmd == "remove_liquidity") {
        require_args(parts, 3, "remove_liquidity <asset> <amount>");
        auto result = engine_.remove_liquidity(cap(Role::LIQUIDITY_PROVIDER), deployer_,
                                               parse_asset(parts[1]), parse_u64(parts[2]));
        print_status(result.status);
    } else if (cmd == "price") {
        require_args(parts, 3, "price <feed_id> <price> [ts]");
        print_status(engine_.update_price(cap(Role::ORACLE_OPERATOR), deployer_,
                                          parse_u64(parts[1]), parse_u64(parts[2]),
                                          timestamp_arg(parts, 3)));
    } else if (cmd == "get_price") {
        require_args(parts, 2, "get_price <feed_id>");
        auto data = engine_.get_price(parse_u64(parts[1]));
        if (!data) {
            print_status(errors::FEED_NOT_FOUND);
        } else {
            std::cout << json{{"price", data->price}, {"last_updated", data->last_updated}}.dump() << "\n";
        }
    } else if (cmd == "open") {
        require_args(parts, 6, "open <market> <account> <long|short> <size> <collateral> [ts]");
        uint32_t market_id = parse_market_id(parts[1]);
        // Collateral is paid in the market's settlement asset; an unknown
        // market is left for the engine to reject
        auto market = engine_.get_market(market_id);
        Coin collateral{market ? market->asset : Currency{}, parse_u64(parts[5])};
        auto result = engine_.open_position(market_id, parse_address(parts[2]), parse_u64(parts[4]),
                                            parse_direction(parts[3]), collateral,
                                            timestamp_arg(parts, 6));
        print_status(result.status);
    } else if (cmd == "close") {
        require_args(parts, 3, "close <market> <account> [ts]");
        auto result = engine_.close_position(parse_market_id(parts[1]),
                                             parse_address(parts[2]), timestamp_arg(parts, 3));
        print_status(result.status);
    } else if (cmd == "liquidate") {
        require_args(parts, 4, "liquidate <market> <liquidator> <owner> [ts]");
        auto result = engine_.liquidate(parse_market_id(parts[1]),
                                        parse_address(parts[2]), parse_address(parts[3]),
                                        timestamp_arg(parts, 4));
        print_status(result.status);
    } else if (cmd == "pause") {
        require_args(parts, 3, "pause <market> <true|false>");
        print_status(engine_.set_paused(cap(Role::ADMIN), deployer_,
                                        parse_market_id(parts[1]),
                                        parse_bool(parts[2])));
    } else if (cmd == "leverage") {
        require_args(parts, 3, "leverage <market> <n>");
        print_status(engine_.edit_market_leverage(cap(Role::ADMIN), deployer_,
                                                  parse_market_id(parts[1]),
                                                  parse_leverage(parts[2])));
    } else if (cmd == "position") {
        require_args(parts, 3, "position <market> <account>");
        auto position = engine_.get_position(parse_market_id(parts[1]),
                                             parse_address(parts[2]));
        if (!position) {
            print_status(errors::POSITION_NOT_FOUND);
        } else {
            std::cout << position_json(*position).dump() << "\n";
        }
    } else if (cmd == "positions") {
        require_args(parts, 2, "positions <market>");
        json out = json::array();
        for (const auto& p : engine_.get_positions(parse_market_id(parts[1]))) {
            out.push_back(position_json(p));
        }
        std::cout << out.dump() << "\n";
    } else if (cmd == "balance") {
        require_args(parts, 2, "balance <asset>");
        Currency asset = parse_asset(parts[1]);
        auto balance = engine_.pool_balance(asset);
        if (!balance) {
            print_status(errors::POOL_NOT_FOUND);
        } else {
            std::cout << json{{"balance", *balance},
                              {"locked_collateral", engine_.locked_collateral(asset).value_or(0)}}.dump()
                      << "\n";
        }
    } else if (cmd == "stats") {
        auto s = engine_.get_stats();
        std::cout << json{
            {"pools", s.total_pools},
            {"feeds", s.total_feeds},
            {"markets", s.total_markets},
            {"open_positions", s.open_positions},
            {"positions_opened", s.positions_opened},
            {"positions_merged", s.positions_merged},
            {"positions_closed", s.positions_closed},
            {"positions_liquidated", s.positions_liquidated}
        }.dump() << "\n";
    } else {
        throw UsageError("Unknown command: " + cmd + ". Type 'help' for commands.");
    }

    return true;
}

//------------------------------------------------------------------------------
// Runners
//------------------------------------------------------------------------------

// Runs lines until EOF or quit. Returns the number of failed lines.
int run_lines(Session& session, std::istream& in, bool prompt) {
    int failures = 0;
    std::string line;

    if (prompt) std::cout << "> " << std::flush;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.resize(hash);

        try {
            if (!session.execute(split(line))) break;
        } catch (const UsageError& e) {
            std::cerr << e.what() << "\n";
            ++failures;
        }
        if (prompt) std::cout << "> " << std::flush;
    }
    return failures;
}

void print_usage(const char* prog) {
    std::cout << "Tumo Markets CLI\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <path>    Engine config (.toml or .json)\n"
              << "  -d, --deployer <addr>  Address holding every capability (default: 0x1)\n"
              << "  -f, --file <path>      Run commands from a script file\n"
              << "  -i, --interactive      Interactive mode (default if no command)\n"
              << "  -v, --verbose          Debug logging\n"
              << "  -h, --help             Show this help message\n\n";
    print_help();
    std::cout << "\nExamples:\n"
              << "  " << prog << " -f scenario.txt\n"
              << "  " << prog << " -c engine.toml -i\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-d" || arg == "--deployer") {
            if (i + 1 >= argc) {
                std::cerr << "Missing deployer address\n";
                std::exit(1);
            }
            options.deployer = argv[++i];
        } else if (arg == "-f" || arg == "--file") {
            if (i + 1 >= argc) {
                std::cerr << "Missing script path\n";
                std::exit(1);
            }
            options.script_path = argv[++i];
            options.interactive = false;
        } else if (arg == "-i" || arg == "--interactive") {
            options.interactive = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-') {
            // Command and its arguments
            options.interactive = false;
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    EngineConfig config;
    try {
        if (!options.config_path.empty()) {
            config = EngineConfig::from_file(options.config_path);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (options.verbose) {
        config.set_log_level("debug");
    }

    auto deployer = address::from_hex(options.deployer);
    if (!deployer) {
        std::cerr << "Invalid deployer address: " << options.deployer << "\n";
        return 1;
    }

    // The engine applies config.general.log_level and rejects unknown names
    std::unique_ptr<Session> session;
    try {
        session = std::make_unique<Session>(*deployer, config);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    int failures = 0;

    if (!options.script_path.empty()) {
        std::ifstream script(options.script_path);
        if (!script.is_open()) {
            std::cerr << "Cannot open script: " << options.script_path << "\n";
            return 1;
        }
        failures += run_lines(*session, script, false);
    }

    if (!options.command_args.empty()) {
        try {
            session->execute(options.command_args);
        } catch (const UsageError& e) {
            std::cerr << e.what() << "\n";
            ++failures;
        }
    } else if (options.interactive) {
        failures += run_lines(*session, std::cin, true);
    }

    failures += session->failures();
    return failures == 0 ? 0 : 1;
}
