
#include "Nats.h"

#include <glog/logging.h>

#include <nats/nats.h>

#include <memory>
#include <string>
#include <vector>


namespace Connection {

namespace {

// turn a failed status into Connection::error, with the library's detailed text when
// it has something more to say than the status name
void check(natsStatus s) {
    if (s == NATS_OK) {
        return;
    }

    std::string msg = natsStatus_GetText(s);

    natsStatus last = NATS_OK;
    const char* detail = nats_GetLastError(&last);
    if (detail != nullptr && *detail != '\0' && last == s && msg != detail) {
        msg += std::string(": ") + detail;
    }

    throw error(msg);
}

std::string url_of(natsConnection* nc) {
    char buf[256] = {};
    if (natsConnection_GetConnectedUrl(nc, buf, sizeof(buf)) != NATS_OK) {
        return "";
    }
    return buf;
}

}


NatsConnection::~NatsConnection() {
    this->close();

    for (auto sub : this->subscriptions) {
        natsSubscription_Destroy(sub);
    }
    this->subscriptions.clear();
    this->handlers.clear();

    if (this->conn != nullptr) {
        natsConnection_Destroy(this->conn);
        this->conn = nullptr;
    }
}

natsConnection* NatsConnection::connected() const {
    if (this->conn == nullptr) {
        throw error("not connected");
    }
    return this->conn;
}


void NatsConnection::connect(const Config& c) {
    if (this->conn != nullptr) {
        throw error("already connected");
    }

    this->config = c;

    natsOptions* opts_raw = nullptr;
    check(natsOptions_Create(&opts_raw));
    std::unique_ptr<natsOptions, decltype(&natsOptions_Destroy)>
    opts(opts_raw, &natsOptions_Destroy);

    check(natsOptions_SetName(opts.get(), this->config.name.c_str()));

    if (!this->config.servers.empty()) {
        std::vector<const char*> servers;
        for (const auto& s : this->config.servers) {
            servers.push_back(s.c_str());
        }
        check(natsOptions_SetServers(opts.get(), servers.data(), static_cast<int>(servers.size())));
    }

    check(natsOptions_SetReconnectWait(opts.get(), this->config.reconnect.reconnect_wait.count()));
    check(natsOptions_SetMaxReconnect(opts.get(), this->config.reconnect.max_reconnects()));

    check(natsOptions_SetDisconnectedCB(opts.get(), &NatsConnection::disconnected_cb, this));
    check(natsOptions_SetReconnectedCB(opts.get(), &NatsConnection::reconnected_cb, this));
    check(natsOptions_SetClosedCB(opts.get(), &NatsConnection::closed_cb, this));

    if (this->config.creds.has_value()) {
        // chained credentials file: JWT and seed in the same file
        check(natsOptions_SetUserCredentialsFromFiles(opts.get(),
            this->config.creds.value().c_str(), nullptr));
    }

    VLOG(3) << "connecting as \"" << this->config.name << "\" to "
        << this->config.servers.size() << " server(s)";

    this->tracker.connection_opened();
    if (natsStatus st = natsConnection_Connect(&this->conn, opts.get()); st != NATS_OK) {
        this->tracker.connection_closed();
        check(st);
    }

    VLOG(2) << "connected to " << url_of(this->conn);
}


void NatsConnection::disconnected_cb(natsConnection*, void* closure) {
    auto self = static_cast<NatsConnection*>(closure);
    if (self->tracker.close_requested()) {
        return;
    }

    if (self->config.on_disconnected) {
        self->config.on_disconnected();
    }
}

void NatsConnection::reconnected_cb(natsConnection* nc, void* closure) {
    auto self = static_cast<NatsConnection*>(closure);
    if (self->config.on_reconnected) {
        self->config.on_reconnected(url_of(nc));
    }
}

void NatsConnection::closed_cb(natsConnection* nc, void* closure) {
    auto self = static_cast<NatsConnection*>(closure);

    if (self->tracker.close_requested()) {
        VLOG(2) << "connection closed";
    } else {
        const char* txt = nullptr;
        natsStatus s = natsConnection_GetLastError(nc, &txt);
        std::string last_error = (txt != nullptr && *txt != '\0') ? txt : natsStatus_GetText(s);

        if (self->config.on_closed) {
            self->config.on_closed(last_error);
        }
    }

    // self may be destroyed as soon as this returns
    self->tracker.connection_closed();
}

void NatsConnection::message_cb(natsConnection*, natsSubscription*, natsMsg* msg, void* closure) {
    auto handler = static_cast<message_handler*>(closure);

    Message m;
    m.subject = natsMsg_GetSubject(msg);
    if (const char* reply = natsMsg_GetReply(msg); reply != nullptr) {
        m.reply = reply;
    }
    if (const char* data = natsMsg_GetData(msg); data != nullptr) {
        m.data.assign(data, natsMsg_GetDataLength(msg));
    }
    natsMsg_Destroy(msg);

    try {
        (*handler)(m);
    } catch (const std::exception& e) {
        // there is nobody to propagate to on the delivery thread
        LOG(ERROR) << "message handler failed on [" << m.subject << "]: " << e.what();
    }
}


void NatsConnection::complete_cb(void* closure) {
    static_cast<NatsConnection*>(closure)->tracker.subscription_completed();
}


void NatsConnection::publish(const std::string& subject, const std::string& data) {
    check(natsConnection_Publish(connected(), subject.c_str(), data.data(),
        static_cast<int>(data.size())));
}

void NatsConnection::subscribe_helper(
    const std::string& subject,
    const std::optional<std::string>& queue,
    message_handler handler
)
{
    auto h = std::make_unique<message_handler>(std::move(handler));
    natsSubscription* sub = nullptr;

    if (queue.has_value()) {
        check(natsConnection_QueueSubscribe(&sub, connected(), subject.c_str(),
            queue.value().c_str(), &NatsConnection::message_cb, h.get()));
    } else {
        check(natsConnection_Subscribe(&sub, connected(), subject.c_str(),
            &NatsConnection::message_cb, h.get()));
    }

    {
        std::lock_guard L { this->subscriptions_mtx };
        this->subscriptions.push_back(sub);
        this->handlers.push_back(std::move(h));
    }

    this->tracker.subscription_opened();
    if (natsStatus st = natsSubscription_SetOnCompleteCB(sub, &NatsConnection::complete_cb, this);
        st != NATS_OK) {
        this->tracker.subscription_completed();
        check(st);
    }
}

void NatsConnection::subscribe(const std::string& subject, message_handler handler) {
    this->subscribe_helper(subject, std::nullopt, std::move(handler));
}

void NatsConnection::queue_subscribe(const std::string& subject, const std::string& queue,
    message_handler handler) {
    this->subscribe_helper(subject, queue, std::move(handler));
}

Message
NatsConnection::request(const std::string& subject, const std::string& data,
    std::chrono::milliseconds timeout) {
    natsMsg* reply_raw = nullptr;
    check(natsConnection_Request(&reply_raw, connected(), subject.c_str(), data.data(),
        static_cast<int>(data.size()), timeout.count()));
    std::unique_ptr<natsMsg, decltype(&natsMsg_Destroy)> reply(reply_raw, &natsMsg_Destroy);

    Message m;
    m.subject = natsMsg_GetSubject(reply.get());
    if (const char* d = natsMsg_GetData(reply.get()); d != nullptr) {
        m.data.assign(d, natsMsg_GetDataLength(reply.get()));
    }
    return m;
}

void NatsConnection::respond(const Message& msg, const std::string& data) {
    if (msg.reply.empty()) {
        VLOG(2) << "message on [" << msg.subject << "] has no reply subject";
        return;
    }

    this->publish(msg.reply, data);
}

void NatsConnection::flush() {
    check(natsConnection_Flush(connected()));
}

std::optional<std::string> NatsConnection::last_error() {
    const char* txt = nullptr;
    natsStatus s = natsConnection_GetLastError(connected(), &txt);
    if (s == NATS_OK) {
        return std::nullopt;
    }

    if (txt != nullptr && *txt != '\0') {
        return std::string(txt);
    }
    return std::string(natsStatus_GetText(s));
}

void NatsConnection::close() {
    if (!this->tracker.request_close()) {
        return;
    }

    if (this->conn != nullptr) {
        natsConnection_Close(this->conn);

        // the closed and completion callbacks run on the library's threads after Close returns
        if (!this->tracker.wait(close_timeout)) {
            LOG(WARNING) << "connection callbacks still pending " << close_timeout.count()
                << "ms after close";
        }
    }
}

};
