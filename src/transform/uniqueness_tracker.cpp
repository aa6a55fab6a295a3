#include "transform/uniqueness_tracker.hpp"

#include <format>

namespace dumpscrub {

std::shared_ptr<UniquenessTracker::KeyState> UniquenessTracker::state_for(const ColumnKey& key) {
    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(states_mutex_);
        const auto it = states_.find(key);
        if (it != states_.end()) {
            return it->second;
        }
    }

    // Slow path: unique lock + try_emplace
    std::unique_lock lock(states_mutex_);
    auto [it, inserted] = states_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<KeyState>();
    }
    return it->second;
}

std::string UniquenessTracker::disambiguate_locked(
    KeyState& state, const std::string& candidate, SuffixPosition position) {

    size_t insert_at = candidate.size();
    if (position == SuffixPosition::BEFORE_AT) {
        const auto at = candidate.rfind('@');
        if (at != std::string::npos) insert_at = at;
    }

    while (true) {
        ++state.counter;
        std::string value = std::format("{}-{}{}",
            candidate.substr(0, insert_at), state.counter, candidate.substr(insert_at));
        if (state.issued.insert(value).second) {
            return value;
        }
    }
}

std::string UniquenessTracker::ensure(const ColumnKey& key, const std::string& candidate,
                                      SuffixPosition position) {
    const auto state = state_for(key);
    std::lock_guard<std::mutex> lock(state->mutex);

    if (state->issued.insert(candidate).second) {
        return candidate;
    }
    return disambiguate_locked(*state, candidate, position);
}

std::string UniquenessTracker::ensure_generated(const ColumnKey& key,
                                                const std::function<std::string()>& generate,
                                                SuffixPosition position) {
    const auto state = state_for(key);
    std::lock_guard<std::mutex> lock(state->mutex);

    std::string candidate;
    for (int attempt = 0; attempt < kFreshCandidateAttempts; ++attempt) {
        candidate = generate();
        if (state->issued.insert(candidate).second) {
            return candidate;
        }
    }
    return disambiguate_locked(*state, candidate, position);
}

size_t UniquenessTracker::issued_count(const ColumnKey& key) const {
    std::shared_ptr<KeyState> state;
    {
        std::shared_lock lock(states_mutex_);
        const auto it = states_.find(key);
        if (it == states_.end()) return 0;
        state = it->second;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->issued.size();
}

size_t UniquenessTracker::key_count() const {
    std::shared_lock lock(states_mutex_);
    return states_.size();
}

} // namespace dumpscrub
