#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace dumpscrub {

/**
 * @brief Guarantees pairwise-distinct generated values per (table, column).
 *
 * One instance lives for exactly one run; it is owned by the caller that
 * orchestrates the run and passed by reference to the row rewriter.
 *
 * Locking: a shared_mutex guards the key -> state map (double-checked
 * creation, as in a registry), and each key's state has its own mutex, so
 * workers touching different columns never contend.
 *
 * Disambiguation policy (ensure_generated):
 * 1. Up to kFreshCandidateAttempts freshly generated candidates are tried.
 * 2. If every candidate collided, the last one gets "-N" appended, N being
 *    the key's strictly increasing counter, incremented until unused.
 */
class UniquenessTracker {
public:
    static constexpr int kFreshCandidateAttempts = 3;

    enum class SuffixPosition {
        END,
        BEFORE_AT   // "name@domain" -> "name-N@domain"
    };

    UniquenessTracker() = default;
    UniquenessTracker(const UniquenessTracker&) = delete;
    UniquenessTracker& operator=(const UniquenessTracker&) = delete;

    /**
     * @brief Record candidate for key, disambiguating it if already issued
     * @return candidate unchanged when unused, otherwise a suffixed form
     */
    [[nodiscard]] std::string ensure(const ColumnKey& key, const std::string& candidate,
                                     SuffixPosition position = SuffixPosition::END);

    /**
     * @brief Generate a unique value for key, retrying the generator before suffixing
     */
    [[nodiscard]] std::string ensure_generated(const ColumnKey& key,
                                               const std::function<std::string()>& generate,
                                               SuffixPosition position = SuffixPosition::END);

    [[nodiscard]] size_t issued_count(const ColumnKey& key) const;

    [[nodiscard]] size_t key_count() const;

private:
    struct KeyState {
        std::mutex mutex;
        std::unordered_set<std::string> issued;
        uint64_t counter = 0;
    };

    std::shared_ptr<KeyState> state_for(const ColumnKey& key);

    // Caller must hold state.mutex
    static std::string disambiguate_locked(KeyState& state, const std::string& candidate,
                                           SuffixPosition position);

    std::unordered_map<ColumnKey, std::shared_ptr<KeyState>, ColumnKeyHash> states_;
    mutable std::shared_mutex states_mutex_;
};

} // namespace dumpscrub
