#include "gatekv/command_dispatcher.hpp"

#include <type_traits>

namespace gatekv {

std::string CommandDispatcher::execute(const Command& command, KvStore& store) {
    return std::visit([&](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, Get>) {
            auto value = store.get(cmd.key);
            return value ? Protocol::format_value(*value) : Protocol::format_nil();

        } else if constexpr (std::is_same_v<T, Set>) {
            store.set(cmd.key, cmd.value);
            return Protocol::format_ok();

        } else if constexpr (std::is_same_v<T, Del>) {
            // deleting an absent key is still a success
            store.del(cmd.key);
            return Protocol::format_ok();

        } else {
            static_assert(std::is_same_v<T, NoOp>);
            return {};
        }
    }, command);
}

} // namespace gatekv
