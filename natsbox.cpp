#include "natsbox.h"
#include "Connection/Nats.h"

int main (int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    natsbox_client client { exe_type(argv[0]), std::make_shared<Connection::NatsConnection>() };
    if (auto code = client.parse_cli(argc, argv); code.has_value()) {
        client.exit(code.value());
    }
    client.exit(client.run());
}
