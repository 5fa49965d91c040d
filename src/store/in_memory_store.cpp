#include "in_memory_store.hpp"
#include <algorithm>

namespace engram {

void InMemoryStore::put_intervention(const Intervention& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[record.user_id].interventions.push_back(record);
}

void InMemoryStore::put_reflection(const Reflection& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[record.user_id].reflections.push_back(record);
}

std::vector<Intervention> InMemoryStore::scan_interventions(
    const std::string& user_id, uint64_t now, const std::vector<Outcome>& outcomes) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Intervention> results;
    auto it = users_.find(user_id);
    if (it == users_.end()) return results;

    for (const auto& record : it->second.interventions) {
        if (is_expired(record, now)) continue;
        if (!outcomes.empty() &&
            std::find(outcomes.begin(), outcomes.end(), record.outcome) == outcomes.end()) {
            continue;
        }
        results.push_back(record);
    }
    return results;
}

uint32_t InMemoryStore::count_interventions(const std::string& user_id, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return 0;
    return static_cast<uint32_t>(std::count_if(
        it->second.interventions.begin(), it->second.interventions.end(),
        [now](const Intervention& r) { return !is_expired(r, now); }));
}

std::vector<Reflection> InMemoryStore::recent_reflections(
    const std::string& user_id, uint64_t now, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Reflection> results;
    auto it = users_.find(user_id);
    if (it == users_.end() || limit == 0) return results;

    // Walk newest write first so equal timestamps keep write order reversed
    const auto& all = it->second.reflections;
    for (auto r = all.rbegin(); r != all.rend(); ++r) {
        if (!is_expired(*r, now)) results.push_back(*r);
    }
    std::stable_sort(results.begin(), results.end(),
                     [](const Reflection& a, const Reflection& b) {
                         return a.created_at > b.created_at;
                     });
    if (results.size() > limit) results.resize(limit);
    return results;
}

uint32_t InMemoryStore::count_reflections(const std::string& user_id, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return 0;
    return static_cast<uint32_t>(std::count_if(
        it->second.reflections.begin(), it->second.reflections.end(),
        [now](const Reflection& r) { return !is_expired(r, now); }));
}

uint32_t InMemoryStore::purge_expired(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (auto it = users_.begin(); it != users_.end();) {
        auto& ints = it->second.interventions;
        auto before = ints.size();
        ints.erase(std::remove_if(ints.begin(), ints.end(),
                                  [now](const Intervention& r) { return is_expired(r, now); }),
                   ints.end());
        removed += static_cast<uint32_t>(before - ints.size());

        auto& refs = it->second.reflections;
        before = refs.size();
        refs.erase(std::remove_if(refs.begin(), refs.end(),
                                  [now](const Reflection& r) { return is_expired(r, now); }),
                   refs.end());
        removed += static_cast<uint32_t>(before - refs.size());

        if (ints.empty() && refs.empty()) {
            it = users_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

uint32_t InMemoryStore::delete_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return 0;
    auto removed = static_cast<uint32_t>(it->second.interventions.size() +
                                         it->second.reflections.size());
    users_.erase(it);
    return removed;
}

} // namespace engram
