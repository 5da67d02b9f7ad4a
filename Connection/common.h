#ifndef CONNECTIONCOMMON_H
#define CONNECTIONCOMMON_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


namespace Connection {

// every failure reported by a connection (connect, publish, flush, request, ...)
struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Message {
    std::string subject;

    // empty unless the sender expects a response
    std::string reply;

    // payload bytes, passed through unmodified
    std::string data;
};

// invoked on the client library's delivery thread, serially for a given subscription
using message_handler = std::function<void(const Message&)>;


// reconnect attempts are bounded so that all of them fit in total_wait
struct ReconnectPolicy {
    std::chrono::milliseconds total_wait = std::chrono::minutes(10);
    std::chrono::milliseconds reconnect_wait = std::chrono::seconds(1);

    int max_reconnects() const {
        return static_cast<int>(total_wait / reconnect_wait);
    }
};


struct Config {
    // connection name, visible to the server
    std::string name;

    std::vector<std::string> servers;

    // user credentials (JWT + seed) file
    std::optional<std::string> creds;

    ReconnectPolicy reconnect;

    // connection events; these are called from the client library's threads
    std::function<void()> on_disconnected;
    std::function<void(const std::string& url)> on_reconnected;
    // permanent closure after reconnects are exhausted, but never after close()
    std::function<void(const std::string& last_error)> on_closed;
};


// the client library calls back into a connection from its own threads (the closed callback,
// message handlers) after close() has returned; the connection waits on this before it frees
// anything those callbacks use
//
// one count per asynchronous subscription plus one for the connection itself
class CloseTracker {
    std::mutex mtx;
    std::condition_variable cv;
    bool closing = false;
    bool connection_open = false;
    int open_subscriptions = 0;

    public:
    void connection_opened();
    void subscription_opened();

    // false when close was already requested
    bool request_close();
    bool close_requested();

    // the library will not call into this subscription again
    void subscription_completed();

    // returns whether the closure was requested by close(); the caller runs its closed hook
    // before this, since the owner may be gone once it returns
    bool connection_closed();

    // false on timeout
    bool wait(std::chrono::milliseconds timeout);
};

// split a comma-separated list of server URLs, trimming blanks around each one
std::vector<std::string> split_servers(const std::string& urls);

};


#endif
