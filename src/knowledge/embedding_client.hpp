#pragma once

#include <string>
#include <vector>

namespace kbindexer {

class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;

    // Returns one vector per input, in input order. Throws on transport or API failure.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                                  const std::string& model) = 0;
};

}  // namespace kbindexer
