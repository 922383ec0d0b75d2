#include "../../../shared/cpp/chronicle/include/config.hpp"
#include "../../../shared/cpp/chronicle/include/memory.hpp"
#include "../../../shared/cpp/chronicle/include/semantic.hpp"
#include "../../../shared/cpp/chronicle/include/util.hpp"
#include <iostream>
#include <filesystem>
#include <cstdio>

static void usage() {
    std::cerr << "chronicle usage:\n"
              << "  init\n"
              << "  add <content> [--platform P] [--project P] [--tags t1 t2 ...]\n"
              << "  search <query> [--limit N]\n"
              << "  ask <question> --answer <text>\n"
              << "  context [--limit N]\n"
              << "  stats\n"
              << "  index [--path DIR|FILE] [--pattern GLOB] [--force]\n"
              << "  semantic-search --query \"...\" [--limit N] [--min-score S]\n"
              << "  semantic-stats\n"
              << "common options: --db <file> --semantic-db <file> --embedder ollama|hash|none\n"
              << "                --ollama <url> --embed-model <name> --embed-dim N\n"
              << "                --chunk-size N --chunk-overlap N\n";
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::string platform{"cli"};
    std::string project{"default"};
    std::vector<std::string> tags;
    std::string answer;
    std::string path;
    std::string pattern{"*.md"};
    std::string query;
    int limit{-1};
    float min_score{0.3f};
    bool force{false};
};

static std::string preview(const std::string& s, size_t n) {
    return s.size() > n ? s.substr(0, n) + "..." : s;
}

static int run_semantic(const CliArgs& a, const ChronicleConfig& cfg) {
    auto embedder = make_embedding_provider(cfg.embed);
    SemanticIndex index(cfg.semantic_db_path, embedder.get(), cfg.chunking);

    if (a.command == "index") {
        std::string path = a.path.empty() ? cfg.index_path : expand_home(a.path);
        std::cout << "Indexing " << path << "...\n";
        if (index.degraded()) {
            std::cerr << "[chronicle] No embedding provider configured; storing chunks without vectors\n";
        }
        IndexReport r;
        if (std::filesystem::is_regular_file(path)) {
            r.degraded = index.degraded();
            r.files = 1;
            r.written = index.index_file(path, a.force);
        } else {
            r = index.index_directory(path, a.pattern, a.force);
        }
        std::cout << "[OK] Indexed " << r.written << " new chunks from " << r.files << " files\n";
        if (!r.failures.empty()) {
            std::cout << r.failures.size() << " files failed:\n";
            for (auto& f : r.failures) std::cout << "  " << f.path << ": " << f.error << "\n";
        }
        return 0;
    }
    if (a.command == "semantic-search") {
        if (a.query.empty()) { usage(); return 2; }
        auto outcome = index.search(a.query, a.limit > 0 ? a.limit : 5, a.min_score);
        if (!outcome.available()) {
            std::cerr << "[chronicle] Semantic search unavailable: no embedding provider configured\n";
            return 3;
        }
        std::cout << "Searching for: " << a.query << "\n\n";
        if (outcome.hits.empty()) std::cout << "No matching chunks.\n";
        int i = 1;
        for (auto& h : outcome.hits) {
            char score[16];
            snprintf(score, sizeof(score), "%.3f", h.score);
            std::cout << "[" << i++ << "] Score: " << score << "\n"
                      << "    File: " << std::filesystem::path(h.source_path).filename().string() << "\n"
                      << "    " << preview(h.text, 200) << "\n\n";
        }
        return 0;
    }
    // semantic-stats
    auto s = index.stats();
    std::cout << "Total chunks: " << s.total_chunks << "\n"
              << "Total files: " << s.distinct_source_files << "\n"
              << "Embedder: " << (embedder ? embedder->name() : std::string("none (degraded)")) << "\n";
    return 0;
}

static int run_memory(const CliArgs& a, const ChronicleConfig& cfg) {
    MemoryStore chronicle(cfg.db_path);

    if (a.command == "init") {
        std::cout << "[OK] Chronicle initialized at " << chronicle.path() << "\n";
    } else if (a.command == "add") {
        if (a.positional.empty()) { usage(); return 2; }
        auto m = chronicle.add(a.positional[0], a.platform, a.project, a.tags);
        std::cout << "[OK] Memory added: " << m.id << "\n";
    } else if (a.command == "search") {
        if (a.positional.empty()) { usage(); return 2; }
        auto results = chronicle.search(a.positional[0], a.limit > 0 ? a.limit : 10);
        if (results.empty()) {
            std::cout << "No memories found.\n";
            return 0;
        }
        std::cout << "\nFound " << results.size() << " memories:\n\n";
        for (auto& m : results) {
            std::cout << "[" << m.timestamp << "] (" << m.platform << "/" << m.project << ")\n"
                      << "  " << m.content << "\n";
            if (!m.tags.empty()) {
                std::cout << "  Tags: ";
                for (size_t i = 0; i < m.tags.size(); ++i) std::cout << (i ? ", " : "") << m.tags[i];
                std::cout << "\n";
            }
            std::cout << "\n";
        }
    } else if (a.command == "ask") {
        if (a.positional.empty() || a.answer.empty()) { usage(); return 2; }
        chronicle.ask(a.positional[0], a.answer);
        std::cout << "[OK] Q&A saved\n";
    } else if (a.command == "context") {
        auto memories = chronicle.context(a.limit > 0 ? a.limit : 10);
        std::cout << "\nRecent context (" << memories.size() << " memories):\n\n";
        for (auto& m : memories) {
            std::cout << "[" << m.timestamp << "] " << m.content.substr(0, 100) << "\n";
        }
    } else {
        auto s = chronicle.stats();
        std::cout << "\nChronicle Statistics\n\n"
                  << "Total memories: " << s.total_memories << "\n"
                  << "Total Q&As: " << s.total_asks << "\n"
                  << "\nPlatforms:\n";
        for (auto& kv : s.platforms) std::cout << "  " << kv.first << ": " << kv.second << "\n";
        std::cout << "\nProjects:\n";
        for (auto& kv : s.projects) std::cout << "  " << kv.first << ": " << kv.second << "\n";
        std::cout << "\nDatabase: " << s.db_path << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    CliArgs a;
    a.command = argv[1];
    try {
        ChronicleConfig cfg = load_config();
        for (int i = 2; i < argc; ++i) {
            std::string f = argv[i];
            bool has_value = i + 1 < argc;
            if (f == "--db" && has_value) cfg.db_path = argv[++i];
            else if (f == "--semantic-db" && has_value) cfg.semantic_db_path = argv[++i];
            else if (f == "--embedder" && has_value) cfg.embed.provider = argv[++i];
            else if (f == "--ollama" && has_value) cfg.embed.ollama_url = argv[++i];
            else if (f == "--embed-model" && has_value) cfg.embed.embed_model = argv[++i];
            else if (f == "--embed-dim" && has_value) cfg.embed.dimension = parse_dimension(argv[++i], "--embed-dim");
            else if (f == "--chunk-size" && has_value) cfg.chunking.window_size = std::stoi(argv[++i]);
            else if (f == "--chunk-overlap" && has_value) cfg.chunking.overlap = std::stoi(argv[++i]);
            else if (f == "--platform" && has_value) a.platform = argv[++i];
            else if (f == "--project" && has_value) a.project = argv[++i];
            else if (f == "--answer" && has_value) a.answer = argv[++i];
            else if ((f == "--path" || f == "-p") && has_value) a.path = argv[++i];
            else if (f == "--pattern" && has_value) a.pattern = argv[++i];
            else if ((f == "--query" || f == "-q") && has_value) a.query = argv[++i];
            else if ((f == "--limit" || f == "-l") && has_value) a.limit = std::stoi(argv[++i]);
            else if (f == "--min-score" && has_value) a.min_score = std::stof(argv[++i]);
            else if (f == "--force") a.force = true;
            else if (f == "--tags") {
                while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) a.tags.push_back(argv[++i]);
            }
            else if (f.rfind("-", 0) == 0) {
                std::cerr << "Unknown or incomplete flag: " << f << "\n";
                usage();
                return 2;
            }
            else a.positional.push_back(f);
        }
        resolve_paths(cfg);

        if (a.command == "index" || a.command == "semantic-search" || a.command == "semantic-stats") {
            return run_semantic(a, cfg);
        }
        if (a.command == "init" || a.command == "add" || a.command == "search" || a.command == "ask" ||
            a.command == "context" || a.command == "stats") {
            return run_memory(a, cfg);
        }
        std::cerr << "Unknown command: " << a.command << "\n";
        usage();
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
