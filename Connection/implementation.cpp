
#include "common.h"

#include <glog/logging.h>

#include <sstream>
#include <string>
#include <vector>


namespace Connection {

std::vector<std::string> split_servers(const std::string& urls) {
    std::vector<std::string> ret;

    std::istringstream s(urls);
    std::string url;
    while (std::getline(s, url, ',')) {
        auto first = url.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = url.find_last_not_of(" \t");
        ret.push_back(url.substr(first, last - first + 1));
    }

    return ret;
}


void CloseTracker::connection_opened() {
    std::lock_guard L { this->mtx };
    this->connection_open = true;
}

void CloseTracker::subscription_opened() {
    std::lock_guard L { this->mtx };
    this->open_subscriptions++;
}

bool CloseTracker::request_close() {
    std::lock_guard L { this->mtx };
    if (this->closing) {
        return false;
    }
    this->closing = true;
    return true;
}

bool CloseTracker::close_requested() {
    std::lock_guard L { this->mtx };
    return this->closing;
}

void CloseTracker::subscription_completed() {
    std::lock_guard L { this->mtx };
    if (this->open_subscriptions > 0) {
        this->open_subscriptions--;
    }
    this->cv.notify_all();
}

bool CloseTracker::connection_closed() {
    std::lock_guard L { this->mtx };
    this->connection_open = false;
    this->cv.notify_all();
    return this->closing;
}

bool CloseTracker::wait(std::chrono::milliseconds timeout) {
    std::unique_lock L { this->mtx };
    bool done = this->cv.wait_for(L, timeout, [this]() {
        return !this->connection_open && this->open_subscriptions == 0;
    });

    if (!done) {
        VLOG(1) << "close timed out: connection " << (this->connection_open ? "open" : "closed")
            << ", " << this->open_subscriptions << " subscription(s) open";
    }
    return done;
}

};
