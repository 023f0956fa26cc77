#include "judge/verdict_cache.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

#include "sandbox/wire_codec.hpp"
#include "utils/logging.hpp"

namespace evalbox::judge {

InMemoryVerdictCache::InMemoryVerdictCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::optional<EvaluationVerdict> InMemoryVerdictCache::Lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    entries_.splice(entries_.begin(), entries_, it->second);
    return it->second->second;
}

void InMemoryVerdictCache::Store(const std::string& key, const EvaluationVerdict& verdict) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = verdict;
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }
    entries_.emplace_front(key, verdict);
    index_[key] = entries_.begin();
    while (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
        utils::Log(utils::LogLevel::kDebug, "cache", "evicted least recently used verdict");
    }
}

std::size_t InMemoryVerdictCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t InMemoryVerdictCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t InMemoryVerdictCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

std::string CacheKey(const Submission& submission,
                     const std::vector<TestCase>& cases,
                     std::chrono::milliseconds deadline,
                     const std::string& isolation) {
    nlohmann::json canonical;
    canonical["source"] = submission.source;
    canonical["target"] = submission.target_name;
    canonical["deadlineMs"] = deadline.count();
    canonical["isolation"] = isolation;
    auto encoded_cases = nlohmann::json::array();
    for (const auto& test_case : cases) {
        auto inputs = nlohmann::json::array();
        for (const auto& input : test_case.inputs) {
            inputs.push_back(sandbox::EncodeValue(input));
        }
        encoded_cases.push_back({std::move(inputs), sandbox::EncodeValue(test_case.expected)});
    }
    canonical["cases"] = std::move(encoded_cases);
    const auto text = sandbox::DumpJson(canonical);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

}  // namespace evalbox::judge
