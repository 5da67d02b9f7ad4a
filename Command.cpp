
#include "Command.h"
#include "json_conversion.h"

#include <glog/logging.h>

#include <sstream>


namespace Command {

namespace {

// errors the server sends asynchronously (permission violations, ...) show up
// here once a flush has completed the round trip
void check_last_error(Connection::AbstractConnection& conn) {
    if (auto err = conn.last_error(); err.has_value()) {
        throw Connection::error(err.value());
    }
}

}


std::string received_str(const Connection::Message& msg, uintmax_t i) {
    std::ostringstream s;
    s << "[#" << i << "] Received on [" << msg.subject << "]: '" << msg.data << "'";
    return s.str();
}


void publish(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& payload) {

    conn.publish(subject, payload);
    conn.flush();
    check_last_error(conn);

    VLOG(1) << "published " << payload.size() << " bytes on [" << subject << "]";
}


void subscribe(Connection::AbstractConnection& conn, const std::string& subject) {
    // the handler is only ever invoked from one thread at a time, so the counter is unguarded
    conn.subscribe(subject, [i = uintmax_t{0}](const Connection::Message& msg) mutable {
        VLOG(2) << json(msg).dump();
        LOG(INFO) << received_str(msg, ++i);
    });

    conn.flush();
    check_last_error(conn);

    LOG(INFO) << "Listening on [" << subject << "]";
}


std::string request(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& payload,
    std::chrono::milliseconds timeout) {

    try {
        auto msg = conn.request(subject, payload, timeout);
        VLOG(1) << "reply received on [" << msg.subject << "]";
        return msg.data;
    } catch (const Connection::error& e) {
        // prefer what the server said over the generic request failure
        auto last = conn.last_error();
        throw Connection::error(last.value_or(e.what()) + " for request");
    }
}


void reply(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& queue, const std::string& payload) {

    conn.queue_subscribe(subject, queue,
        [&conn, payload, i = uintmax_t{0}](const Connection::Message& msg) mutable {
            VLOG(2) << json(msg).dump();
            LOG(INFO) << received_str(msg, ++i);
            if (msg.reply.empty()) {
                VLOG(1) << "no reply subject, nothing to respond to";
                return;
            }
            conn.respond(msg, payload);
        }
    );

    conn.flush();
    check_last_error(conn);

    LOG(INFO) << "Listening on [" << subject << " " << queue << "]";
}

};
