#ifndef NATSBOX_H
#define NATSBOX_H 1

#include "types.h"
#include "Command.h"
#include "Connection/Connection.h"
#include "json_conversion.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <boost/program_options.hpp>


inline std::atomic<bool> shutdown_signal;

inline void signal_handler(int s) {
    if (s == SIGINT || s == SIGTERM) {
        shutdown_signal.store(true);
    }
}

inline std::string string_from_env(const std::string& v, const std::string& d) {
    const char* val = std::getenv(v.c_str());
    if (val == nullptr || *val == '\0') {
        return d;
    }
    return val;
}


namespace po = boost::program_options;

// single dash long options ("-creds file"), no abbreviations
inline const int cli_style =
    (po::command_line_style::unix_style & ~po::command_line_style::allow_guessing)
    | po::command_line_style::allow_long_disguise;


// "-t" alone, or "-t=true" / "-t=false"
inline po::typed_value<bool>* bool_flag() {
    return po::value<bool>()->default_value(false)->implicit_value(true);
}


// flags come first: the first argument that is not a flag ends them, and so does "--"
// returns (end of the flags, start of the positional arguments) as argv indexes
//  e.g. `nats-pub -s host subj -x` => (3, 3): "-x" is a payload, not an unknown flag
inline std::pair<int, int>
flag_args_end(int argc, const char* const argv[], const po::options_description& desc) {
    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "--") {
            return { i, i + 1 };
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }

        auto name = arg.substr(arg[1] == '-' ? 2 : 1);
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            ++i;
            continue;
        }

        // a flag requiring a value consumes the next argument; the boolean flags only
        // take one in the "-t=false" form
        auto d = desc.find_nothrow(name, false);
        if (d != nullptr && d->semantic()->min_tokens() > 0) {
            ++i;
        }
        ++i;
    }

    i = std::min(i, argc);
    return { i, i };
}


// a small framework around the four modes of the tool: it owns the CLI options and the
// connection, and knows how to connect and dispatch to the Command functions
//
// the connection is injected so that tests can run the whole client against a fake
struct natsbox_client {
    const enum exe_t exe;

    // available to the client program to make changes before parse_cli is called
    po::options_description options_desc;
    po::variables_map options_vm;

    // positional arguments: subject, and for everything but Sub, the payload
    std::vector<std::string> args;

    std::shared_ptr<Connection::AbstractConnection> connection;

    // where request replies are printed
    std::ostream& output;

    natsbox_client(enum exe_t _exe,
        std::shared_ptr<Connection::AbstractConnection> _connection,
        std::ostream& _output = std::cout)
        :   exe(_exe),
            options_desc("Options"),
            connection(std::move(_connection)),
            output(_output)
    {
        FLAGS_logtostderr = 1;
        // plain lines by default; -t turns the prefix (with timestamps) back on
        FLAGS_log_prefix = false;
        google::InstallFailureSignalHandler();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        this->options_desc.add_options()
            ("s", po::value<std::string>()->default_value(
                string_from_env("NATS_URL", "connect.ngs.global")), "The NATS System")
            ("creds", po::value<std::string>()->default_value(
                string_from_env("NATS_CREDS", "")), "User Credentials File")
            ("q", po::value<std::string>()->default_value("NATS-RPLY-22"), "Queue Group Name")
            ("t", bool_flag(), "Display timestamps")
            ("h", bool_flag(), "Show help message")
            ("v", bool_flag(), "Show version")
            ("glog-verbosity", po::value<int>()->default_value(0), "")
        ;
    }

    void usage(std::ostream& out) const {
        out << usage_str(this->exe) << "\n" << this->options_desc << std::flush;
    }

    // returns an exit code when the program should stop here (help, version, usage error)
    // and std::nullopt when run() should be called
    std::optional<int>
    parse_cli(int argc, const char* const argv[], std::ostream& out = std::cerr) {
        auto [flags_end, positional_begin] = flag_args_end(argc, argv, this->options_desc);

        try {
            po::parsed_options opt = po::command_line_parser(flags_end, argv)
                .options(this->options_desc)
                .style(cli_style)
                .run()
            ;
            po::store(opt, this->options_vm);
            po::notify(this->options_vm);
        } catch (po::error& e) {
            out << e.what() << "\n";
            this->usage(out);
            return 1;
        }

        if (this->options_vm["h"].as<bool>()) {
            this->usage(out);
            return 0;
        }

        if (this->options_vm["v"].as<bool>()) {
            out << "nats-box v" << version << std::endl;
            return 0;
        }

        this->args.assign(argv + positional_begin, argv + argc);
        if (this->args.size() != exe_t_argc(this->exe)) {
            this->usage(out);
            return 1;
        }

        FLAGS_v = this->options_vm["glog-verbosity"].as<int>();

        return std::nullopt;
    }

    // NATS_URL wins over -s, even when -s was given explicitly
    std::string server() const {
        return string_from_env("NATS_URL", this->options_vm["s"].as<std::string>());
    }

    std::optional<std::string> creds() const {
        auto c = this->options_vm["creds"].as<std::string>();
        if (c.empty()) {
            return std::nullopt;
        }
        return c;
    }

    Connection::Config connect_config() const {
        Connection::Config c;
        c.name = tool_name(this->exe);
        c.servers = Connection::split_servers(this->server());
        c.creds = this->creds();

        auto total_wait_m =
            std::chrono::duration_cast<std::chrono::minutes>(c.reconnect.total_wait).count();

        c.on_disconnected = [total_wait_m]() {
            LOG(INFO) << "Disconnected: will attempt reconnects for " << total_wait_m << "m";
        };
        c.on_reconnected = [](const std::string& url) {
            LOG(INFO) << "Reconnected [" << url << "]";
        };
        // reconnects are exhausted; this runs on the library's thread while main is parked
        c.on_closed = [](const std::string& last_error) {
            LOG(ERROR) << "Exiting: " << last_error;
            google::FlushLogFiles(google::GLOG_INFO);
            std::_Exit(1);
        };

        return c;
    }

    // parse_cli must be called before run
    // returns the exit code: 0, or 1 after logging a connection error
    int run() {
        auto config = this->connect_config();
        VLOG(1) << "mode " << json(this->exe).dump() << ", connection config " << json(config).dump();

        try {
            this->connection->connect(config);
        } catch (const Connection::error& e) {
            LOG(ERROR) << e.what();
            return 1;
        }

        try {
            switch (this->exe) {
                case exe_t::Sub:
                    Command::subscribe(*this->connection, this->args[0]);
                break;
                case exe_t::Req:
                    this->output
                        << Command::request(*this->connection, this->args[0], this->args[1])
                        << std::endl;
                break;
                case exe_t::Rply:
                    Command::reply(*this->connection, this->args[0],
                        this->options_vm["q"].as<std::string>(), this->args[1]);
                break;
                case exe_t::Pub:
                    Command::publish(*this->connection, this->args[0], this->args[1]);
                break;
            }
        } catch (const Connection::error& e) {
            LOG(ERROR) << e.what();
            this->connection->close();
            return 1;
        }

        if (this->exe == exe_t::Sub || this->exe == exe_t::Rply) {
            if (this->options_vm["t"].as<bool>()) {
                FLAGS_log_prefix = true;
            }

            // messages are handled on the connection's threads; wait here to be told to stop
            while (true) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                if (shutdown_signal == true) {
                    VLOG(1) << "shutdown requested";
                    break;
                }
            }
        }

        this->connection->close();
        VLOG(2) << "exiting";
        return 0;
    }

    // trigger client shutdown just as if it were sent SIGINT/SIGTERM
    void shutdown() {
        shutdown_signal.store(true);
    }

    void exit(int code) {
        std::exit(code);
    }
};


#endif
