#ifndef SENGINE_DETAIL_CONTEXT_HPP
#define SENGINE_DETAIL_CONTEXT_HPP

#include <vector>

#include <sengine/detail/scalar.hpp>

namespace sengine
{
namespace detail
{

// One entry per handler invocation in flight on this thread.
struct Frame
{
    const void* owner = nullptr;
    const Scalar* state = nullptr;
    const void* handler = nullptr;
};

inline std::vector<Frame>& frames() noexcept
{
    thread_local std::vector<Frame> stack;
    return stack;
}

// Innermost invocation started by `owner` on the calling thread.
inline const Frame* find_frame(const void* owner) noexcept
{
    const auto& stack = frames();
    for(auto it = stack.rbegin(); it != stack.rend(); ++it)
    {
        if(it->owner == owner)
        {
            return &*it;
        }
    }
    return nullptr;
}

class ContextScope
{
public:
    ContextScope(const void* owner, const Scalar& state, const void* handler)
    {
        frames().push_back(Frame{owner, &state, handler});
    }

    ~ContextScope()
    {
        frames().pop_back();
    }

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;
};

} // namespace detail
} // namespace sengine

#endif
