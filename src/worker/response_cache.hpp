#ifndef RESPONSE_CACHE_HPP
#define RESPONSE_CACHE_HPP

#include <string>
#include <list>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace worker {

constexpr size_t DEFAULT_CACHE_MAX_SIZE = 1000;

// Trims outer whitespace and collapses inner whitespace runs to one space.
std::string normalizePrompt(const std::string &prompt);

// SHA-256 hex digest of the normalized prompt.
std::string cacheKey(const std::string &prompt);

// Bounded prompt -> response store. Once the entry count exceeds the maximum,
// the oldest entries by insertion order are dropped so that the newest half
// remain. Every operation takes the cache mutex.
class ResponseCache {
public:
    explicit ResponseCache(size_t maxSize = DEFAULT_CACHE_MAX_SIZE);

    std::optional<std::string> lookup(const std::string &key) const;

    // Replaces the value of an existing key in place (keeps its age).
    void insert(const std::string &key, const std::string &response);

    bool contains(const std::string &key) const;
    size_t size() const;
    size_t maxSize() const { return maxEntries; }
    void clear();

private:
    size_t maxEntries;
    std::list<std::string> insertionOrder;  // oldest first
    std::unordered_map<std::string, std::pair<std::string, std::list<std::string>::iterator>> entries;
    mutable std::mutex cacheMutex;

    void evictLocked();
};

} // namespace worker

#endif // RESPONSE_CACHE_HPP
