/**
 * @file run_context.cpp
 * @brief Run identifier generation
 */

#include <migrate/engine/run_context.hpp>

#include <migrate/compat/format.hpp>
#include <migrate/compat/time.hpp>

#include <cstdint>
#include <ctime>
#include <random>

namespace migrate::engine {

auto generate_run_id() -> std::string {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    char stamp[20] = "00000000T000000";
    if (compat::gmtime_safe(&now, &tm) != nullptr) {
        std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm);
    }

    return compat::format("run-{}-{:08x}", stamp, dist(engine));
}

}  // namespace migrate::engine
