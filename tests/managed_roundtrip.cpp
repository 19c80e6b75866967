#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>

#include <sengine/engine.hpp>

using sengine::Scalar;
using Engine = sengine::ManagedEngine<const std::string&>;

int main()
{
    auto owned = std::make_unique<sengine::LocalStateStore>();
    auto* local = owned.get();
    Engine engine(std::move(owned));
    std::vector<Scalar> started_from;

    engine.state_handler("asleep")([&](const std::string& in) -> Scalar {
        started_from.push_back(engine.current_state());
        return in == "wake" ? "awake" : "asleep";
    });
    engine.state_handler("awake", true)([&](const std::string& in) -> Scalar {
        started_from.push_back(engine.current_state());
        if(in == "vanish")
        {
            return "limbo";
        }
        return in == "sleep" ? "asleep" : "awake";
    });

    engine.execute("alice", "sleep");
    assert(engine.state_of("alice") == Scalar{"asleep"});
    assert(local->size() == 1);

    // The second call starts where the first one left the machine.
    engine.execute("alice", "snore");
    assert(started_from.back() == Scalar{"asleep"});
    assert(engine.state_of("alice") == Scalar{"asleep"});

    // Machines are independent of each other.
    engine.execute(7, "sleep");
    engine.execute("bob", "nothing");
    assert(engine.state_of(7) == Scalar{"asleep"});
    assert(engine.state_of("bob").is_none());
    assert(local->size() == 2);

    engine.execute("alice", "wake");
    assert(engine.state_of("alice").is_none());
    assert(!local->contains("alice"));
    assert((started_from == std::vector<Scalar>{"awake", "asleep", "awake", "awake", "asleep"}));

    // Identifiers are validated before the store is read.
    try
    {
        engine.execute(true, "sleep");
        assert(false);
    } catch(const sengine::InvalidIdentifierKind& e)
    {
        assert(e.identifier() == Scalar{true});
    }
    try
    {
        engine.execute(sengine::none, "sleep");
        assert(false);
    } catch(const sengine::InvalidIdentifierKind&)
    {
    }
    try
    {
        (void)engine.state_of(false);
        assert(false);
    } catch(const sengine::InvalidIdentifierKind&)
    {
    }
    assert(started_from.size() == 5);

    // Distinct identifiers never share a stored state.
    try
    {
        engine.execute(std::numeric_limits<std::uint64_t>::max(), "sleep");
        assert(false);
    } catch(const std::out_of_range&)
    {
    }
    assert(engine.state_of(-1).is_none());
    engine.execute(std::numeric_limits<std::int64_t>::max(), "sleep");
    assert(engine.state_of(std::numeric_limits<std::int64_t>::max()) == Scalar{"asleep"});
    assert(engine.state_of(-1).is_none());
    assert(engine.state_of(std::numeric_limits<std::int64_t>::min()).is_none());
    engine.reset(std::numeric_limits<std::int64_t>::max());

    try
    {
        engine.execute(std::nan(""), "sleep");
        assert(false);
    } catch(const sengine::InvalidIdentifierKind&)
    {
    }
    assert(started_from.size() == 6);

    // Dispatch failures propagate and leave the stored state alone.
    engine.execute("carol", "vanish");
    assert(engine.state_of("carol") == Scalar{"limbo"});
    try
    {
        engine.execute("carol", "sleep");
        assert(false);
    } catch(const sengine::NoHandlerForState& e)
    {
        assert(e.state() == Scalar{"limbo"});
    }
    assert(engine.state_of("carol") == Scalar{"limbo"});

    engine.reset("carol");
    assert(engine.state_of("carol").is_none());
    engine.reset("never-seen");

    // The default-constructed engine keeps its machines in memory.
    sengine::ManagedEngine<int> counter;
    counter.default_handler(0)([](int step) -> Scalar { return step; });
    counter.state_handler(1)([](int step) -> Scalar { return 1 + step; });
    counter.state_handler(2)([](int) -> Scalar { return 0; });
    counter.execute("c", 1);
    counter.execute("c", 1);
    assert(counter.state_of("c") == Scalar{2});
    counter.execute("c", 0);
    assert(counter.state_of("c").is_none());
    assert(static_cast<sengine::LocalStateStore&>(counter.store()).size() == 0);

    return 0;
}
