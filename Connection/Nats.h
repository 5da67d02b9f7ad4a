#ifndef CONNECTIONNATS_H
#define CONNECTIONNATS_H

#include "common.h"
#include "Connection.h"

#include <nats/nats.h>

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>


namespace Connection {

// AbstractConnection on top of the NATS C client
class NatsConnection : public AbstractConnection {
    natsConnection* conn = nullptr;

    // subscriptions and the handlers they were given as closures; the handlers must
    // outlive the subscriptions, so both are released together in the destructor
    std::deque<natsSubscription*> subscriptions;
    std::deque<std::unique_ptr<message_handler>> handlers;
    std::mutex subscriptions_mtx;

    Config config;

    // close() waits for the library's callback threads before anything above is freed
    CloseTracker tracker;

    // natsConnectionHandler / natsMsgHandler trampolines
    static void disconnected_cb(natsConnection*, void* closure);
    static void reconnected_cb(natsConnection*, void* closure);
    static void closed_cb(natsConnection*, void* closure);
    static void message_cb(natsConnection*, natsSubscription*, natsMsg*, void* closure);
    static void complete_cb(void* closure);

    natsConnection* connected() const;
    void subscribe_helper(const std::string& subject, const std::optional<std::string>& queue,
        message_handler handler);

    public:
    static inline const std::chrono::milliseconds close_timeout = std::chrono::seconds(5);

    NatsConnection() = default;
    ~NatsConnection() override;

    NatsConnection(const NatsConnection&) = delete;
    NatsConnection& operator=(const NatsConnection&) = delete;

    void connect(const Config&) override;

    void publish(const std::string& subject, const std::string& data) override;

    void subscribe(const std::string& subject, message_handler handler) override;
    void queue_subscribe(const std::string& subject, const std::string& queue,
        message_handler handler) override;

    Message
    request(const std::string& subject, const std::string& data,
        std::chrono::milliseconds timeout) override;

    void respond(const Message& msg, const std::string& data) override;

    void flush() override;

    std::optional<std::string> last_error() override;

    void close() override;
};

};


#endif
