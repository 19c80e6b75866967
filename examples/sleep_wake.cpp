#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>

#include <sengine/core.hpp>

using Input = std::string;
using Dispatcher = sengine::Dispatcher<const Input&>;

int main() {
    spdlog::cfg::load_env_levels();

    Dispatcher d;
    d.state_handler("asleep")([&d](const Input& in) -> sengine::Scalar {
        std::cout << "in " << sengine::to_string(d.current_state()) << " got " << in << "\n";
        return in == "wake" ? "awake" : "asleep";
    });
    d.default_handler("awake")([&d](const Input& in) -> sengine::Scalar {
        std::cout << "in " << sengine::to_string(d.current_state()) << " got " << in << "\n";
        return in == "sleep" ? "asleep" : "awake";
    });

    sengine::Scalar state = sengine::none;
    for (const Input in : {"sleep", "snore", "wake", "sleep"}) {
        state = d.execute(state, in);
        std::cout << "-> " << sengine::to_string(state) << "\n";
    }

    try {
        d.execute("dreaming", "wake");
    } catch (const sengine::NoHandlerForState& e) {
        std::cout << e.what() << "\n";
    }
    return 0;
}
