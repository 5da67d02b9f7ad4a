#include "../Connection/Nats.h"
#include "../Command.h"

#include "common.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>


using namespace std::chrono_literals;


void test_tracker_idle() {
    // nothing was ever opened
    Connection::CloseTracker t;
    CHECK(t.wait(0ms));
    CHECK(t.request_close());
    CHECK(!t.request_close());
    CHECK(t.wait(0ms));
}

void test_tracker_intentional_close() {
    Connection::CloseTracker t;
    t.connection_opened();
    t.subscription_opened();
    t.subscription_opened();

    CHECK(!t.close_requested());
    CHECK(t.request_close());
    CHECK(t.close_requested());

    // the library has not called back yet
    CHECK(!t.wait(10ms));

    std::atomic<bool> intentional = false;
    std::thread callbacks([&]() {
        std::this_thread::sleep_for(20ms);
        t.subscription_completed();
        t.subscription_completed();
        intentional = t.connection_closed();
    });

    CHECK(t.wait(5s));
    callbacks.join();
    CHECK(intentional);
}

void test_tracker_unrequested_close() {
    // reconnects exhausted: closed without close(), so the closed hook has to run
    Connection::CloseTracker t;
    t.connection_opened();
    t.subscription_opened();
    CHECK(!t.connection_closed());

    // the subscription is still pending
    CHECK(!t.wait(10ms));
    t.subscription_completed();
    CHECK(t.wait(0ms));

    // completions past zero are ignored
    t.subscription_completed();
    t.subscription_opened();
    CHECK(!t.wait(0ms));
}

void test_nats_unreachable() {
    std::atomic<bool> closed_hook = false;

    Connection::Config c;
    c.name = "natsbox test";
    c.servers = { "nats://127.0.0.1:1" };
    c.on_closed = [&](const std::string&) { closed_hook = true; };

    {
        Connection::NatsConnection conn;

        bool threw = false;
        try {
            conn.connect(c);
        } catch (const Connection::error& e) {
            threw = true;
            LOG(INFO) << "connect failed as expected: " << e.what();
        }
        CHECK(threw);

        check_throws([&]() { conn.publish("foo", "bar"); }, "not connected");
        check_throws([&]() { conn.flush(); }, "not connected");

        // nothing to wait for
        auto start = std::chrono::steady_clock::now();
        conn.close();
        conn.close();
        CHECK(std::chrono::steady_clock::now() - start < Connection::NatsConnection::close_timeout);
    }

    CHECK(!closed_hook);
}

// needs a server: NATSBOX_TEST_URL=nats://127.0.0.1:4222
void test_nats_server(const std::string& url) {
    std::atomic<bool> closed_hook = false;

    Connection::Config c;
    c.name = "natsbox test";
    c.servers = Connection::split_servers(url);
    c.on_closed = [&](const std::string&) { closed_hook = true; };

    auto conn = std::make_unique<Connection::NatsConnection>();
    conn->connect(c);

    Command::reply(*conn, "natsbox.test", "natsbox-test", "pong");
    Command::subscribe(*conn, "natsbox.>");
    CHECK_EQ(Command::request(*conn, "natsbox.test", "ping"), "pong");
    Command::publish(*conn, "natsbox.other", "hello");

    // close waits for the callbacks; destroying right after must be safe
    conn->close();
    conn.reset();

    CHECK(!closed_hook);
}


int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    test_tracker_idle();
    test_tracker_intentional_close();
    test_tracker_unrequested_close();
    test_nats_unreachable();

    if (const char* url = std::getenv("NATSBOX_TEST_URL"); url != nullptr && *url != '\0') {
        test_nats_server(url);
    } else {
        LOG(INFO) << "NATSBOX_TEST_URL not set, skipping the server test";
    }

    std::cout << "connection: ok\n";
}
