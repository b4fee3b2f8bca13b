#include "knowledge/backend.hpp"

namespace kbindexer
{

    void to_json(nlohmann::json &json, const BackendStats &stats)
    {
        json = {
            {"total_sources", stats.total_sources},
            {"total_chunks", stats.total_chunks},
            {"total_embeddings", stats.total_embeddings},
        };
    }

} // namespace kbindexer
