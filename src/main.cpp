#include "chunk/text_chunker.hpp"
#include "config/config.hpp"
#include "db/memory_backend.hpp"
#include "db/pg_backend.hpp"
#include "embedding/openai_embedder.hpp"
#include "http/internal_server.hpp"
#include "indexer/knowledge_indexer.hpp"
#include "knowledge/errors.hpp"
#include "loader/file_source_loader.hpp"
#include "util/log.hpp"
#include "version.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace kbindexer {
namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;

enum class Mode { None, Index, Reindex, Files, Remove, Stats, Serve };

struct Options {
    Mode mode = Mode::None;
    std::string target;
    std::vector<std::filesystem::path> files;
    bool force = false;
    bool recursive = true;
    std::string backend = "postgres";
};

void print_usage() {
    std::cerr << "usage: kb-indexer (--index DIR | --reindex DIR | --files F... | --remove ID_OR_PATH | --stats | --serve)\n"
                 "                  [--force] [--no-recursive] [--backend postgres|memory]\n";
}

bool set_mode(Options& options, Mode mode) {
    if (options.mode != Mode::None) {
        log::error("only one of --index, --reindex, --files, --remove, --stats, --serve may be given");
        return false;
    }
    options.mode = mode;
    return true;
}

// Returns false on a usage error, which has already been logged.
bool parse_arguments(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--index" || arg == "--reindex" || arg == "--remove") {
            if (i + 1 >= argc) {
                log::error(std::string{arg} + " requires an argument");
                return false;
            }
            const Mode mode = arg == "--index" ? Mode::Index : (arg == "--reindex" ? Mode::Reindex : Mode::Remove);
            if (!set_mode(options, mode)) {
                return false;
            }
            options.target = argv[++i];
        } else if (arg == "--files") {
            if (!set_mode(options, Mode::Files)) {
                return false;
            }
            while (i + 1 < argc && std::string_view{argv[i + 1]}.rfind("--", 0) != 0) {
                options.files.emplace_back(argv[++i]);
            }
            if (options.files.empty()) {
                log::error("--files requires at least one path");
                return false;
            }
        } else if (arg == "--stats") {
            if (!set_mode(options, Mode::Stats)) {
                return false;
            }
        } else if (arg == "--serve") {
            if (!set_mode(options, Mode::Serve)) {
                return false;
            }
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--no-recursive") {
            options.recursive = false;
        } else if (arg == "--backend") {
            if (i + 1 >= argc) {
                log::error("--backend requires a value");
                return false;
            }
            options.backend = argv[++i];
            if (options.backend != "postgres" && options.backend != "memory") {
                log::error("unknown backend: " + options.backend);
                return false;
            }
        } else {
            log::error("unknown argument: " + std::string{arg});
            return false;
        }
    }
    if (options.mode == Mode::None) {
        log::error("no command given");
        return false;
    }
    return true;
}

std::unique_ptr<KnowledgeBackend> make_backend(const Config& config, const std::string& name) {
    if (name == "memory") {
        return std::make_unique<MemoryBackend>(config.embedding_dimension());
    }
    auto backend = std::make_unique<PostgresBackend>(config.pg_conninfo(), config.embedding_dimension());
    backend->ensure_schema();
    return backend;
}

int run(const Config& config, const Options& options) {
    const TextChunker chunker(config.chunker_options());
    FileSourceLoader loader(config.max_file_size());
    OpenAIEmbedder embedder(config);
    auto backend = make_backend(config, options.backend);
    KnowledgeIndexer indexer(*backend, loader, chunker, embedder, config.embedding_model());

    switch (options.mode) {
    case Mode::Index:
        std::cout << nlohmann::json(indexer.index_directory(options.target, options.recursive, options.force)).dump(2)
                  << '\n';
        return 0;
    case Mode::Reindex:
        std::cout << nlohmann::json(indexer.reindex_changed_files(options.target, options.recursive)).dump(2) << '\n';
        return 0;
    case Mode::Files:
        std::cout << nlohmann::json(indexer.index_files(options.files, options.force)).dump(2) << '\n';
        return 0;
    case Mode::Remove:
        indexer.remove_source(options.target);
        std::cout << nlohmann::json{{"removed", options.target}}.dump(2) << '\n';
        return 0;
    case Mode::Stats:
        std::cout << nlohmann::json(indexer.get_index_stats()).dump(2) << '\n';
        return 0;
    case Mode::Serve:
        return run_http_server(indexer, config.http_host(), config.http_port());
    case Mode::None:
        break;
    }
    return kExitUsage;
}

}  // namespace
}  // namespace kbindexer

int main(int argc, char** argv) {
    kbindexer::Options options;
    if (!kbindexer::parse_arguments(argc, argv, options)) {
        kbindexer::print_usage();
        return kbindexer::kExitUsage;
    }

    try {
        kbindexer::log::info(std::string{"kb-indexer starting (version "} + kbindexer::kVersion + ')');
        const auto config = kbindexer::Config::load();
        return kbindexer::run(config, options);
    } catch (const kbindexer::KnowledgeValidationError& ex) {
        kbindexer::log::error(std::string{"invalid configuration: "} + ex.what());
        return kbindexer::kExitUsage;
    } catch (const std::exception& ex) {
        kbindexer::log::error(std::string{"fatal error: "} + ex.what());
        return kbindexer::kExitFailure;
    }
}
