#ifndef PINET_CORE_STATUS_CACHE_HPP
#define PINET_CORE_STATUS_CACHE_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <tl/expected.hpp>

#include "PiNet/Config.hpp"
#include "PiNet/Util/Clock.hpp"
#include "PiNet/Util/Error.hpp"

namespace PiNet
{
    /**
     * @brief Short-TTL memoizer for status probes
     *
     * Each probe costs one external process; a UI polling status would
     * otherwise spawn them without bound. Failed fetches are never stored.
     * Entries survive until they expire or invalidate_all() is called; a
     * fetch that was in flight across an invalidation is returned to its
     * caller but not stored.
     */
    template <typename Value>
    class StatusCache
    {
    public:
        using Fetch = std::function<tl::expected<Value, Error>()>;

        explicit StatusCache(const Clock& clock, const Clock::duration ttl = Config::STATUS_CACHE_TTL)
            : clock_(clock), ttl_(ttl)
        {
        }

        tl::expected<Value, Error> get_or_fetch(const std::string& key, const Fetch& fetch)
        {
            const auto now = clock_.now();
            std::uint64_t generation{0};
            {
                std::shared_lock lock(mutex_);
                if (const auto it = entries_.find(key); it != entries_.end() && now - it->second.captured < ttl_)
                {
                    return it->second.value;
                }
                generation = generation_;
            }

            auto fetched = fetch();
            if (!fetched)
            {
                return fetched;
            }

            std::unique_lock lock(mutex_);
            if (generation == generation_)
            {
                entries_.insert_or_assign(key, Entry{now, *fetched});
            }
            return fetched;
        }

        void invalidate_all()
        {
            std::unique_lock lock(mutex_);
            entries_.clear();
            ++generation_;
        }

        std::size_t size() const
        {
            std::shared_lock lock(mutex_);
            return entries_.size();
        }

        Clock::duration ttl() const { return ttl_; }

    private:
        struct Entry
        {
            Clock::time_point captured;
            Value value;
        };

        const Clock& clock_;
        const Clock::duration ttl_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
        std::uint64_t generation_{0};
    };
}

#endif //PINET_CORE_STATUS_CACHE_HPP
