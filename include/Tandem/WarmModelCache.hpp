// =================================================================
// include/Tandem/WarmModelCache.hpp
// =================================================================
// Tracks which role models are resident in the inference runtime.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include <list>
#include <mutex>
#include <string>
#include <vector>

namespace Tandem {

/**
 * @brief Least-recently-used set of resident ("warm") roles
 *
 * Capacity is 1 unless the host can keep several models loaded. A miss
 * is a model switch: the caller loads the model and reports the load
 * latency through recordSwitchTime().
 */
class WarmModelCache {
public:
    explicit WarmModelCache(size_t capacity = 1);

    /**
     * @brief Mark a role as used
     * @param role Role about to be invoked
     * @return True on a hit (no load needed), false on a miss
     *
     * On a miss the role becomes resident and the least recently used
     * role is evicted when the cache is full.
     */
    bool touch(AgentRole role);

    bool contains(AgentRole role) const;

    /**
     * @brief Forget a resident role, e.g. after the runtime reported it unavailable
     * @return False if the role was not resident
     */
    bool evict(AgentRole role);

    /**
     * @brief Add the load latency of the last switch
     * @param seconds Time spent loading the model
     */
    void recordSwitchTime(double seconds);

    /**
     * @brief Most recently used role
     * @param role Receives the role when the cache is not empty
     * @return False when nothing is warm
     */
    bool current(AgentRole& role) const;

    /**
     * @brief Id of the most recently used role, empty when cold
     */
    std::string currentId() const;

    std::vector<AgentRole> residents() const;

    size_t getCapacity() const;

    /**
     * @brief Change capacity, evicting least recently used roles if needed
     */
    void setCapacity(size_t capacity);

    size_t getHitCount() const;
    size_t getMissCount() const;
    size_t getSwitchCount() const;
    double getTotalSwitchTime() const;
    double getAverageSwitchTime() const;

    /**
     * @brief Drop residents and reset all counters
     */
    void clear();

private:
    mutable std::mutex m_mutex;
    size_t m_capacity;
    std::list<AgentRole> m_residents;   // front is most recently used
    size_t m_hits = 0;
    size_t m_misses = 0;
    size_t m_timed_switches = 0;
    double m_total_switch_time = 0.0;
};

} // namespace Tandem
