#include <cassert>
#include <stdexcept>
#include <string>
#include <thread>

#include <sengine/core.hpp>

using sengine::Scalar;
using Machine = sengine::Dispatcher<const std::string&>;

int main()
{
    Machine m;

    try
    {
        (void)m.current_state();
        assert(false);
    } catch(const sengine::OutsideHandlerContext& e)
    {
        assert(e.accessor() == "current_state");
    }
    try
    {
        (void)m.current_handler();
        assert(false);
    } catch(const sengine::OutsideHandlerContext& e)
    {
        assert(e.accessor() == "current_handler");
    }
    assert(!m.in_handler());

    Scalar seen_state;
    bool saw_handler = false;
    bool other_thread_saw_context = true;

    m.state_handler("home", true)([&](const std::string& in) -> Scalar {
        seen_state = m.current_state();
        saw_handler = static_cast<bool>(m.current_handler());
        if(in == "thread")
        {
            std::thread probe([&] { other_thread_saw_context = m.in_handler(); });
            probe.join();
        }
        if(in == "fail")
        {
            throw std::runtime_error("handler failed");
        }
        return in == "go" ? "away" : "home";
    });

    m.state_handler("away")([&](const std::string& in) -> Scalar {
        if(in == "nested")
        {
            // Re-entering the same dispatcher stacks a frame; it is popped on return.
            assert(m.current_state() == Scalar{"away"});
            auto inner = m.execute("home", "stay");
            assert(inner == Scalar{"home"});
            assert(seen_state == Scalar{"home"});
            assert(m.current_state() == Scalar{"away"});
        }
        return "home";
    });

    // none resolves to the entry point, and the context reports its key.
    assert(m.execute(sengine::none, "go") == Scalar{"away"});
    assert(seen_state == Scalar{"home"});
    assert(saw_handler);
    assert(!m.in_handler());

    assert(m.execute("away", "nested") == Scalar{"home"});
    assert(!m.in_handler());

    // Context is per thread.
    (void)m.execute("home", "thread");
    assert(!other_thread_saw_context);

    // Context is cleared when the handler throws.
    try
    {
        (void)m.execute("home", "fail");
        assert(false);
    } catch(const std::runtime_error&)
    {
    }
    assert(!m.in_handler());
    try
    {
        (void)m.current_state();
        assert(false);
    } catch(const sengine::OutsideHandlerContext&)
    {
    }

    // A handler driving another dispatcher sees each one's own frame.
    sengine::Dispatcher<int> inner;
    Scalar outer_seen_from_inner;
    Scalar inner_seen;
    inner.default_handler(10)([&](int) -> Scalar {
        inner_seen = inner.current_state();
        outer_seen_from_inner = m.current_state();
        return 10;
    });
    Machine outer;
    outer.default_handler("root")([&](const std::string&) -> Scalar {
        (void)inner.execute(sengine::none, 0);
        assert(outer.current_state() == Scalar{"root"});
        return "root";
    });
    m.state_handler("bridge")([&](const std::string&) -> Scalar {
        (void)outer.execute(sengine::none, "");
        return "home";
    });
    (void)m.execute("bridge", "");
    assert(inner_seen == Scalar{10});
    assert(outer_seen_from_inner == Scalar{"bridge"});
    assert(!inner.in_handler() && !outer.in_handler() && !m.in_handler());

    return 0;
}
