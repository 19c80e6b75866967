#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/cfg/env.h>

#include <sengine/engine.hpp>

enum class Key { Coin, Push };

using Engine = sengine::ManagedEngine<Key>;

int main() {
    spdlog::cfg::load_env_levels();

    Engine turnstiles;
    turnstiles.default_handler("locked")([](Key k) -> sengine::Scalar {
        return k == Key::Coin ? "unlocked" : "locked";
    });
    turnstiles.state_handler("unlocked")([](Key k) -> sengine::Scalar {
        return k == Key::Push ? "locked" : "unlocked";
    });

    const std::vector<std::pair<sengine::Scalar, Key>> events{
        {"north", Key::Coin}, {"south", Key::Push}, {1, Key::Coin}, {"north", Key::Push}, {1, Key::Coin}};

    for (const auto& [gate, key] : events) {
        turnstiles.execute(gate, key);
        const auto st = turnstiles.state_of(gate);
        std::cout << sengine::to_string(gate) << ": " << (st.is_none() ? std::string("locked (not stored)") : sengine::to_string(st))
                  << "\n";
    }
    return 0;
}
