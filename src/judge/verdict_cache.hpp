#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "judge/test_case.hpp"
#include "judge/verdict.hpp"

namespace evalbox::judge {

// Content-addressed verdict store handed to a TestHarness. Implementations
// must be safe to share between threads.
class VerdictCache {
public:
    virtual ~VerdictCache() = default;

    virtual std::optional<EvaluationVerdict> Lookup(const std::string& key) = 0;
    virtual void Store(const std::string& key, const EvaluationVerdict& verdict) = 0;
};

// Bounded LRU kept in memory.
class InMemoryVerdictCache : public VerdictCache {
public:
    explicit InMemoryVerdictCache(std::size_t capacity = 256);

    std::optional<EvaluationVerdict> Lookup(const std::string& key) override;
    void Store(const std::string& key, const EvaluationVerdict& verdict) override;

    std::size_t size() const;
    std::size_t hits() const;
    std::size_t misses() const;

private:
    using Entry = std::pair<std::string, EvaluationVerdict>;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

// Hex SHA-256 over a canonical encoding of everything that can change the
// verdict. Throws std::runtime_error if the digest cannot be computed.
std::string CacheKey(const Submission& submission,
                     const std::vector<TestCase>& cases,
                     std::chrono::milliseconds deadline,
                     const std::string& isolation);

}  // namespace evalbox::judge
