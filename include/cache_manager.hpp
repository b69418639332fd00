#pragma once

#include <atomic>
#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rag_engine {

template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;

        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            order_.erase(it->second.order_it);
            entries_.erase(it);
            return std::nullopt;
        }

        order_.splice(order_.begin(), order_, it->second.order_it);
        return it->second.value;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_size_ == 0) return;

        auto expiry = std::chrono::steady_clock::now() + ttl_;
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.expiry_time = expiry;
            order_.splice(order_.begin(), order_, it->second.order_it);
            return;
        }

        if (entries_.size() >= max_size_) {
            entries_.erase(order_.back());
            order_.pop_back();
        }
        order_.push_front(key);
        entries_.emplace(key, Entry{std::move(value), order_.begin(), expiry});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        order_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        Value value;
        typename std::list<Key>::iterator order_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> order_;
    std::unordered_map<Key, Entry> entries_;
    mutable std::mutex mutex_;
};

// Embeddings keyed by model + text; repeated chunks and repeated queries skip the network.
class EmbeddingCache {
public:
    explicit EmbeddingCache(size_t capacity = 4096,
                            std::chrono::seconds ttl = std::chrono::seconds(3600))
        : cache_(capacity, ttl) {}

    std::optional<std::vector<float>> get(const std::string& model, const std::string& text) {
        auto hit = cache_.get(model + '\x1f' + text);
        if (hit) ++hits_; else ++misses_;
        return hit;
    }

    void set(const std::string& model, const std::string& text, const std::vector<float>& embedding) {
        cache_.set(model + '\x1f' + text, embedding);
    }

    size_t hits() const { return hits_.load(); }
    size_t misses() const { return misses_.load(); }
    void clear() { cache_.clear(); }

private:
    LRUCache<std::string, std::vector<float>> cache_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

} // namespace rag_engine
