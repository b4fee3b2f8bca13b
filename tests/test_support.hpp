#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "knowledge/embedding_client.hpp"
#include "util/uuid.hpp"

namespace kbindexer::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("kbindexer_test_" + uuid::generate())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        const auto target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        return target;
    }

private:
    std::filesystem::path path_;
};

// Deterministic embedder: every vector is `dimension` copies of the text length.
class FakeEmbedder : public EmbeddingClient {
public:
    explicit FakeEmbedder(int dimension) : dimension_(dimension) {}

    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts, const std::string&) override {
        ++calls;
        std::vector<std::vector<float>> vectors;
        vectors.reserve(texts.size());
        for (const auto& text : texts) {
            vectors.emplace_back(static_cast<std::size_t>(dimension_), static_cast<float>(text.size()));
        }
        return vectors;
    }

    int calls = 0;

private:
    int dimension_;
};

}  // namespace kbindexer::test
