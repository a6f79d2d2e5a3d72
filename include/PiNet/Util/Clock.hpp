#ifndef PINET_CLOCK_HPP
#define PINET_CLOCK_HPP

#include <chrono>
#include <thread>

namespace PiNet
{
    /**
     * @brief Time source and sleeper used by caches and readiness polling
     */
    class Clock
    {
    public:
        using time_point = std::chrono::steady_clock::time_point;
        using duration = std::chrono::steady_clock::duration;

        virtual ~Clock() = default;

        virtual time_point now() const = 0;
        virtual void sleep_for(duration d) = 0;
    };

    class SteadyClock final : public Clock
    {
    public:
        time_point now() const override
        {
            return std::chrono::steady_clock::now();
        }

        void sleep_for(const duration d) override
        {
            std::this_thread::sleep_for(d);
        }
    };
}

#endif //PINET_CLOCK_HPP
