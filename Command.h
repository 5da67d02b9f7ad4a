#ifndef COMMAND_H
#define COMMAND_H 1

#include "Connection/Connection.h"

#include <chrono>
#include <cstdint>
#include <string>


/*
    The four things the tool can do once it is connected. Each one is a single call against
    Connection::AbstractConnection and lets Connection::error propagate to the caller, which
    decides what is fatal.

    subscribe and reply return as soon as the subscription is confirmed by the server; the
    messages are then handled on the connection's delivery thread.
*/

namespace Command {

inline const std::chrono::milliseconds request_timeout = std::chrono::seconds(2);

// log line for the i-th message received by a subscription (1-based)
std::string received_str(const Connection::Message& msg, uintmax_t i);

void publish(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& payload);

void subscribe(Connection::AbstractConnection& conn, const std::string& subject);

// returns the reply data; failures are rethrown as "<reason> for request"
std::string request(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& payload,
    std::chrono::milliseconds timeout = request_timeout);

// answer every request on subject with payload, as a member of the queue group
void reply(Connection::AbstractConnection& conn,
    const std::string& subject, const std::string& queue, const std::string& payload);

};


#endif
