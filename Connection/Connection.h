#ifndef CONNECTION_H
#define CONNECTION_H

#include "common.h"

#include <chrono>
#include <optional>
#include <string>


namespace Connection {

// everything the tool needs from a messaging client
// the NATS implementation is in Nats.h; tests substitute their own
class AbstractConnection {
    public:
    virtual ~AbstractConnection() = default;

    virtual void connect(const Config&) = 0;

    virtual void publish(const std::string& subject, const std::string& data) = 0;

    virtual void subscribe(const std::string& subject, message_handler handler) = 0;
    virtual void queue_subscribe(const std::string& subject, const std::string& queue,
        message_handler handler) = 0;

    // blocks until the single response arrives or the timeout expires
    virtual Message
    request(const std::string& subject, const std::string& data,
        std::chrono::milliseconds timeout) = 0;

    // publish data to the reply subject of msg; does nothing when msg carries none
    virtual void respond(const Message& msg, const std::string& data) = 0;

    // round trip to the server; everything published before has been processed
    virtual void flush() = 0;

    // most recent asynchronous error reported by the server, if any
    virtual std::optional<std::string> last_error() = 0;

    // intentional close; buffered output is flushed, subscriptions are not drained, and
    // Config::on_closed is not called
    virtual void close() = 0;
};

};


#endif
