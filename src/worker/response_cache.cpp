#include "response_cache.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <stdexcept>
#include <algorithm>
#include <openssl/evp.h>

namespace worker {

std::string normalizePrompt(const std::string &prompt) {
    std::string normalized;
    normalized.reserve(prompt.size());
    bool pendingSpace = false;
    for (unsigned char c : prompt) {
        if (std::isspace(c)) {
            pendingSpace = !normalized.empty();
            continue;
        }
        if (pendingSpace) {
            normalized.push_back(' ');
            pendingSpace = false;
        }
        normalized.push_back(static_cast<char>(c));
    }
    return normalized;
}

std::string cacheKey(const std::string &prompt) {
    std::string normalized = normalizePrompt(prompt);

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_Digest(normalized.data(), normalized.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        ss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

ResponseCache::ResponseCache(size_t maxSize) : maxEntries(maxSize) {}

std::optional<std::string> ResponseCache::lookup(const std::string &key) const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.first;
}

void ResponseCache::insert(const std::string &key, const std::string &response) {
    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = entries.find(key);
    if (it != entries.end()) {
        it->second.first = response;
        return;
    }

    insertionOrder.push_back(key);
    entries.emplace(key, std::make_pair(response, std::prev(insertionOrder.end())));
    evictLocked();
}

void ResponseCache::evictLocked() {
    if (entries.size() <= maxEntries) {
        return;
    }

    size_t keep = std::max<size_t>(maxEntries / 2, std::min<size_t>(maxEntries, 1));
    size_t before = entries.size();
    while (entries.size() > keep) {
        entries.erase(insertionOrder.front());
        insertionOrder.pop_front();
    }
    std::cout << "[ResponseCache] Evicted " << (before - entries.size()) << " oldest entries, "
              << entries.size() << " remain" << std::endl;
}

bool ResponseCache::contains(const std::string &key) const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return entries.count(key) > 0;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(cacheMutex);
    return entries.size();
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(cacheMutex);
    entries.clear();
    insertionOrder.clear();
}

} // namespace worker
