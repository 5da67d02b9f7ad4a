
#include "../Connection/Connection.h"

#include <glog/logging.h>

#include <algorithm>
#include <ctime>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>


// in-memory stand-in for a server connection
// records every call in `calls`, and fails the operation named in `fail_on`
struct FakeConnection : public Connection::AbstractConnection {
    std::deque<std::string> calls;

    std::optional<Connection::Config> config;

    std::deque<std::pair<std::string, std::string>> published;
    std::deque<std::pair<std::string, std::string>> responded;

    // subject => handler given to subscribe / queue_subscribe
    std::map<std::string, Connection::message_handler> handlers;
    std::optional<std::string> queue;

    std::optional<std::string> fail_on;
    std::optional<std::string> async_error;
    std::string reply_data = "pong";

    bool closed = false;

    void fail(const std::string& op) {
        this->calls.push_back(op);
        if (this->fail_on == op) {
            throw Connection::error(op + " failed");
        }
    }

    // hand msg to the handler subscribed on its subject, as the delivery thread would
    void deliver(const Connection::Message& msg) {
        this->handlers.at(msg.subject)(msg);
    }

    void connect(const Connection::Config& c) override {
        this->fail("connect");
        this->config = c;
    }

    void publish(const std::string& subject, const std::string& data) override {
        this->fail("publish");
        this->published.push_back({ subject, data });
    }

    void subscribe(const std::string& subject, Connection::message_handler handler) override {
        this->fail("subscribe");
        this->handlers[subject] = std::move(handler);
    }

    void queue_subscribe(const std::string& subject, const std::string& q,
        Connection::message_handler handler) override {
        this->fail("queue_subscribe");
        this->queue = q;
        this->handlers[subject] = std::move(handler);
    }

    Connection::Message
    request(const std::string& subject, const std::string& data,
        std::chrono::milliseconds timeout) override {
        this->fail("request");
        this->published.push_back({ subject, data });
        return { "_INBOX.reply", "", this->reply_data };
    }

    void respond(const Connection::Message& msg, const std::string& data) override {
        this->fail("respond");
        this->responded.push_back({ msg.reply, data });
    }

    void flush() override {
        this->fail("flush");
    }

    std::optional<std::string> last_error() override {
        this->calls.push_back("last_error");
        return this->async_error;
    }

    void close() override {
        this->calls.push_back("close");
        this->closed = true;
    }
};

inline std::string calls_str(const std::deque<std::string>& calls) {
    std::string ret;
    for (auto& c : calls) {
        ret += (ret.empty() ? "" : " ") + c;
    }
    return ret;
}

// run f and check that it throws Connection::error with the given text
template<typename F>
void check_throws(F f, const std::string& what) {
    bool threw = false;
    try {
        f();
    } catch (const Connection::error& e) {
        threw = true;
        CHECK_EQ(std::string(e.what()), what);
    }
    CHECK(threw) << "expected Connection::error: " << what;
}


// collects the text of everything logged while it is alive
struct LogCapture : public google::LogSink {
    std::mutex mtx;
    std::vector<std::string> lines;

    LogCapture() {
        google::AddLogSink(this);
    }

    ~LogCapture() override {
        google::RemoveLogSink(this);
    }

    void send(google::LogSeverity, const char*, const char*, int, const struct ::tm*,
        const char* message, size_t message_len) override {
        std::lock_guard L { this->mtx };
        this->lines.emplace_back(message, message_len);
    }

    bool has(const std::string& line) {
        std::lock_guard L { this->mtx };
        return std::find(this->lines.begin(), this->lines.end(), line) != this->lines.end();
    }
};
