// =================================================================
// src/Tandem/WarmModelCache.cpp
// =================================================================
// Implementation of the resident model cache.

#include "Tandem/WarmModelCache.hpp"
#include <algorithm>
#include <stdexcept>

namespace Tandem {

WarmModelCache::WarmModelCache(size_t capacity) : m_capacity(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("WarmModelCache capacity must be at least 1");
    }
}

bool WarmModelCache::touch(AgentRole role) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find(m_residents.begin(), m_residents.end(), role);
    if (it != m_residents.end()) {
        m_residents.splice(m_residents.begin(), m_residents, it);
        m_hits++;
        return true;
    }

    m_residents.push_front(role);
    while (m_residents.size() > m_capacity) {
        m_residents.pop_back();
    }
    m_misses++;
    return false;
}

bool WarmModelCache::contains(AgentRole role) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::find(m_residents.begin(), m_residents.end(), role) != m_residents.end();
}

bool WarmModelCache::evict(AgentRole role) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find(m_residents.begin(), m_residents.end(), role);
    if (it == m_residents.end()) {
        return false;
    }
    m_residents.erase(it);
    return true;
}

void WarmModelCache::recordSwitchTime(double seconds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_switch_time += seconds;
    m_timed_switches++;
}

bool WarmModelCache::current(AgentRole& role) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_residents.empty()) {
        return false;
    }
    role = m_residents.front();
    return true;
}

std::string WarmModelCache::currentId() const {
    AgentRole role;
    if (!current(role)) {
        return "";
    }
    return AgentCapabilityUtils::roleToString(role);
}

std::vector<AgentRole> WarmModelCache::residents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<AgentRole>(m_residents.begin(), m_residents.end());
}

size_t WarmModelCache::getCapacity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity;
}

void WarmModelCache::setCapacity(size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("WarmModelCache capacity must be at least 1");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_capacity = capacity;
    while (m_residents.size() > m_capacity) {
        m_residents.pop_back();
    }
}

size_t WarmModelCache::getHitCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hits;
}

size_t WarmModelCache::getMissCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_misses;
}

size_t WarmModelCache::getSwitchCount() const {
    return getMissCount();
}

double WarmModelCache::getTotalSwitchTime() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_switch_time;
}

double WarmModelCache::getAverageSwitchTime() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_timed_switches == 0) {
        return 0.0;
    }
    return m_total_switch_time / static_cast<double>(m_timed_switches);
}

void WarmModelCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_residents.clear();
    m_hits = 0;
    m_misses = 0;
    m_timed_switches = 0;
    m_total_switch_time = 0.0;
}

} // namespace Tandem
