
#include "json_conversion.h"


void to_json(json& j, const exe_t e) {
    j = exe_t_str(e);
}


namespace Connection {

void to_json(json& j, const ReconnectPolicy& p) {
    j = json();
    j["total_wait_ms"] = p.total_wait.count();
    j["reconnect_wait_ms"] = p.reconnect_wait.count();
    j["max_reconnects"] = p.max_reconnects();
}

void to_json(json& j, const Config& c) {
    j = json();
    j["name"] = c.name;
    j["servers"] = c.servers;
    j["creds"] = c.creds.has_value() ? json(c.creds.value()) : json(nullptr);
    j["reconnect"] = c.reconnect;
}

void to_json(json& j, const Message& m) {
    j = json();
    j["subject"] = m.subject;
    j["reply"] = m.reply;
    j["size"] = m.data.size();
}

};
