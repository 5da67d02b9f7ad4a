#ifndef TYPES_H
#define TYPES_H 1

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>

inline const std::string version = "0.3.0";

// the behavior of the tool, selected by the name it was invoked as
enum class exe_t { Pub, Sub, Req, Rply };

inline std::string exe_t_str(enum exe_t e) {
    switch (e) {
        case exe_t::Pub:
            return "Pub";
        case exe_t::Sub:
            return "Sub";
        case exe_t::Req:
            return "Req";
        case exe_t::Rply:
            return "Rply";
    }

    throw std::invalid_argument("exe_t_str implementation incomplete");
}

inline std::ostream& operator<<(std::ostream& os, const exe_t& e) {
    return os << exe_t_str(e);
}


// mode is taken from the last four characters of the lowercased executable name
//  nats-pub, nats-sub, nats-req, nats-rply (or anything ending in "rply")
// names shorter than 7 characters, or with no matching suffix, publish
inline enum exe_t exe_type(const std::string& argv0) {
    std::filesystem::path p = std::filesystem::path(argv0).lexically_normal();
    if (!p.has_filename()) {
        // "bin/nats-sub/" normalizes with a trailing separator
        p = p.parent_path();
    }

    std::string name = p.filename().string();
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (name.size() < 7) {
        return exe_t::Pub;
    }

    std::string suffix = name.substr(name.size() - 4);
    if (suffix == "-pub") {
        return exe_t::Pub;
    }
    if (suffix == "-sub") {
        return exe_t::Sub;
    }
    if (suffix == "-req") {
        return exe_t::Req;
    }
    if (suffix == "rply") {
        return exe_t::Rply;
    }

    return exe_t::Pub;
}

// connection name announced to the server
inline std::string tool_name(enum exe_t e) {
    switch (e) {
        case exe_t::Sub:
            return "NATS-SUB TOOL";
        case exe_t::Req:
            return "NATS-REQ TOOL";
        case exe_t::Rply:
            return "NATS-RPLY TOOL";
        default:
            return "NATS-PUB TOOL";
    }
}

inline std::string usage_str(enum exe_t e) {
    switch (e) {
        case exe_t::Sub:
            return "Usage: nats-sub [-s server] [-creds file] [-t] <subject>";
        case exe_t::Req:
            return "Usage: nats-req [-s server] [-creds file] [-t] <subject> <request>";
        case exe_t::Rply:
            return "Usage: nats-rply [-s server] [-creds file] [-t] [-q queue] <subject> <response>";
        default:
            return "Usage: nats-pub [-s server] [-creds file] [-t] <subject> <msg>";
    }
}

// number of positional arguments each mode requires
inline std::size_t exe_t_argc(enum exe_t e) {
    return e == exe_t::Sub ? 1 : 2;
}

#endif
