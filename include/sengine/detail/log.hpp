#ifndef SENGINE_DETAIL_LOG_HPP
#define SENGINE_DETAIL_LOG_HPP

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace sengine
{
namespace log
{

inline constexpr const char* logger_name = "sengine";

namespace detail
{

inline std::shared_ptr<spdlog::logger> make_default_logger()
{
    if(auto existing = spdlog::get(logger_name))
    {
        return existing;
    }
    auto created = spdlog::default_logger()->clone(logger_name);
    // Picks up levels loaded from SPDLOG_LEVEL and the global formatter.
    spdlog::initialize_logger(created);
    return created;
}

inline std::shared_ptr<spdlog::logger>& slot()
{
    static std::shared_ptr<spdlog::logger> instance = make_default_logger();
    return instance;
}

} // namespace detail

inline spdlog::logger& logger()
{
    return *detail::slot();
}

// Not synchronized with concurrent logging; install before first use.
inline void set_logger(std::shared_ptr<spdlog::logger> replacement)
{
    if(replacement)
    {
        detail::slot() = std::move(replacement);
    }
}

inline void set_level(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

} // namespace log
} // namespace sengine

#endif
