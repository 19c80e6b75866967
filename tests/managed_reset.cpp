#include <cassert>
#include <memory>

#include <sengine/engine.hpp>

using sengine::Scalar;

enum class Step
{
    Advance,
    Finish,
    Rest
};

int main()
{
    auto owned = std::make_unique<sengine::LocalStateStore>();
    auto* local = owned.get();
    sengine::ManagedEngine<Step> engine(std::move(owned));

    engine.state_handler("ready", true)([](Step s) -> Scalar {
        return s == Step::Advance ? "running" : "ready";
    });
    engine.state_handler("running")([](Step s) -> Scalar {
        switch(s)
        {
        case Step::Advance: return "running";
        case Step::Finish: return sengine::none;
        case Step::Rest: return "ready";
        }
        return "running";
    });

    // Returning none removes the machine from the store.
    engine.execute("job-1", Step::Advance);
    assert(local->contains("job-1"));
    engine.execute("job-1", Step::Finish);
    assert(!local->contains("job-1"));

    // So does returning the default state.
    engine.execute("job-2", Step::Advance);
    engine.execute("job-2", Step::Advance);
    assert(local->get("job-2") == Scalar{"running"});
    engine.execute("job-2", Step::Rest);
    assert(!local->contains("job-2"));

    // A machine that stays at rest is never written.
    engine.execute("job-3", Step::Rest);
    engine.execute("job-3", Step::Finish);
    assert(!local->contains("job-3"));
    assert(local->size() == 0);

    // An entry for the default key left by someone else is read as the entry point and dropped.
    local->set("job-4", "ready");
    engine.execute("job-4", Step::Rest);
    assert(!local->contains("job-4"));

    // Without a default nothing runs and nothing is written.
    sengine::ManagedEngine<Step> headless;
    headless.state_handler("running")([](Step) -> Scalar { return "running"; });
    try
    {
        headless.execute("job-5", Step::Advance);
        assert(false);
    } catch(const sengine::NoDefaultRegistered&)
    {
    }
    assert(headless.state_of("job-5").is_none());

    try
    {
        sengine::ManagedEngine<Step> broken{std::unique_ptr<sengine::StateStore>{}};
        assert(false);
    } catch(const std::invalid_argument&)
    {
    }

    return 0;
}
