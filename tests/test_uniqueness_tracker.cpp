#include <catch2/catch_test_macros.hpp>
#include "transform/uniqueness_tracker.hpp"

#include <future>
#include <set>
#include <vector>

using namespace dumpscrub;

TEST_CASE("First value is returned unchanged", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    CHECK(tracker.ensure(key, "jsmith") == "jsmith");
    CHECK(tracker.issued_count(key) == 1);
}

TEST_CASE("Repeated candidates get increasing suffixes", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    CHECK(tracker.ensure(key, "jsmith") == "jsmith");
    CHECK(tracker.ensure(key, "jsmith") == "jsmith-1");
    CHECK(tracker.ensure(key, "jsmith") == "jsmith-2");
    CHECK(tracker.ensure(key, "adoe") == "adoe");
    CHECK(tracker.ensure(key, "adoe") == "adoe-3");
    CHECK(tracker.issued_count(key) == 5);
}

TEST_CASE("Suffix skips values already issued verbatim", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    CHECK(tracker.ensure(key, "x-1") == "x-1");
    CHECK(tracker.ensure(key, "x") == "x");
    CHECK(tracker.ensure(key, "x") == "x-2");
}

TEST_CASE("Email suffix goes before the domain", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "email");
    const auto pos = UniquenessTracker::SuffixPosition::BEFORE_AT;
    CHECK(tracker.ensure(key, "a@example.com", pos) == "a@example.com");
    CHECK(tracker.ensure(key, "a@example.com", pos) == "a-1@example.com");
}

TEST_CASE("Keys are independent", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey a("public.person", "username");
    const ColumnKey b("public.staff", "username");
    CHECK(tracker.ensure(a, "jsmith") == "jsmith");
    CHECK(tracker.ensure(b, "jsmith") == "jsmith");
    CHECK(tracker.key_count() == 2);
}

TEST_CASE("Generator is retried before suffixing", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    CHECK(tracker.ensure(key, "taken") == "taken");

    int calls = 0;
    const auto value = tracker.ensure_generated(key, [&] {
        ++calls;
        return calls < 2 ? std::string("taken") : std::string("fresh");
    });
    CHECK(value == "fresh");
    CHECK(calls == 2);
}

TEST_CASE("Generator that always collides falls back to a suffix", "[uniqueness]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    CHECK(tracker.ensure(key, "same") == "same");

    int calls = 0;
    const auto value = tracker.ensure_generated(key, [&] { ++calls; return std::string("same"); });
    CHECK(value == "same-1");
    CHECK(calls == UniquenessTracker::kFreshCandidateAttempts);
}

TEST_CASE("Concurrent callers never receive the same value", "[uniqueness][concurrency]") {
    UniquenessTracker tracker;
    const ColumnKey key("public.person", "username");
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::vector<std::future<std::vector<std::string>>> futures;
    for (int t = 0; t < kThreads; ++t) {
        futures.push_back(std::async(std::launch::async, [&] {
            std::vector<std::string> values;
            for (int i = 0; i < kPerThread; ++i) {
                values.push_back(tracker.ensure_generated(key, [] { return std::string("dup"); }));
            }
            return values;
        }));
    }

    std::set<std::string> all;
    for (auto& f : futures) {
        for (auto& v : f.get()) all.insert(std::move(v));
    }
    CHECK(all.size() == static_cast<size_t>(kThreads * kPerThread));
    CHECK(tracker.issued_count(key) == all.size());
}
