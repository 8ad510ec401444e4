#pragma once

#include "gatekv/kv_store.hpp"
#include "gatekv/protocol.hpp"

#include <string>

namespace gatekv {

class CommandDispatcher {
public:
    // Applies one parsed command to the store and returns the wire response.
    // NoOp yields an empty string (nothing to send).
    static std::string execute(const Command& command, KvStore& store);
};

} // namespace gatekv
