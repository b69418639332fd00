#pragma once
#include <atomic>
#include <cmath>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <vector>
#include "embedding_service.hpp"
#include "engine_config.hpp"
#include "text_utils.hpp"

namespace rag_engine::testing {

// Bag-of-words embedder: every token bumps one bucket, so texts that share
// words land close together. Deterministic across runs and threads.
class HashingEmbedder : public EmbeddingModel {
public:
    explicit HashingEmbedder(int dimension = 64) : dimension_(dimension) {}

    std::vector<float> embed(const std::string& text) override {
        ++calls_;
        std::vector<float> v(static_cast<size_t>(dimension_), 0.0f);
        for (const auto& token : tokenize(text)) {
            v[std::hash<std::string>{}(token) % v.size()] += 1.0f;
        }
        // Keep the vector non-zero so cosine similarity is defined.
        v[0] += 0.01f;
        return v;
    }

    int dimension() const override { return dimension_; }
    size_t calls() const { return calls_.load(); }

private:
    int dimension_;
    std::atomic<size_t> calls_{0};
};

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("ragengine_test_" + std::to_string(rd()) + "_" + std::to_string(counter()++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    static std::atomic<int>& counter() {
        static std::atomic<int> c{0};
        return c;
    }
    std::filesystem::path path_;
};

inline EngineConfig make_test_config(const std::filesystem::path& persist_dir,
                                     BackendType backend = BackendType::Faiss) {
    EngineConfig config;
    config.backend = backend;
    config.persist_dir = persist_dir.string();
    config.embedding_dimension = 64;
    config.worker_threads = 4;
    return config;
}

inline std::vector<float> unit_vector(int dimension, int axis) {
    std::vector<float> v(static_cast<size_t>(dimension), 0.0f);
    v[static_cast<size_t>(axis)] = 1.0f;
    return v;
}

} // namespace rag_engine::testing
