#ifndef JSON_CONVERSION_H
#define JSON_CONVERSION_H 1

#include <nlohmann/json.hpp>

#include "types.h"
#include "Connection/common.h"


using json = nlohmann::json;


// used for diagnostics (VLOG) only; nothing is read back from JSON

void to_json(json& j, const exe_t e);

namespace Connection {

    void to_json(json& j, const ReconnectPolicy& p);

    // event handlers are not represented
    void to_json(json& j, const Config& c);

    void to_json(json& j, const Message& m);

};


#endif
