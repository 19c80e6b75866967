#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/cfg/env.h>

#include <sengine/engine.hpp>
#include <sengine/resp.hpp>

using Engine = sengine::ManagedEngine<int>;

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    sengine::RespOptions options;
    if (const char* url = std::getenv("SENGINE_REDIS_URL")) {
        options.endpoint = sengine::Endpoint::parse(url);
    }
    const std::string uid = argc > 1 ? argv[1] : "counter";

    auto store = std::make_unique<sengine::RemoteStateStore>(std::make_unique<sengine::RespClient>(options));
    Engine counter(std::move(store));
    counter.default_handler(0)([](int step) -> sengine::Scalar { return step; });
    for (int n = 1; n < 5; ++n) {
        counter.state_handler(n)([n](int step) -> sengine::Scalar { return (n + step) % 5; });
    }

    try {
        counter.execute(uid, 1);
        std::cout << uid << " is now " << sengine::to_string(counter.state_of(uid)) << "\n";
    } catch (const sengine::StoreUnavailable& e) {
        std::cerr << "store unavailable at " << options.endpoint.address() << ": " << e.trace() << "\n";
        return 1;
    }
    return 0;
}
