#pragma once
#include "store.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>

struct Memory {
    std::string id; // sha256(content + timestamp), 16 hex chars
    std::string content;
    std::string timestamp;
    std::string platform{"unknown"};
    std::string project{"default"};
    std::vector<std::string> tags;
    nlohmann::json context = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Memory& m);

struct Recollection {
    std::string text;
    std::string timestamp;
    std::string source;
    std::vector<std::string> tags;
};

struct Ask {
    std::string question;
    std::string answer;
    std::string memory_id;
    std::string timestamp;
};

struct MemoryStats {
    int64_t total_memories{0};
    int64_t total_asks{0};
    std::map<std::string, int64_t> platforms;
    std::map<std::string, int64_t> projects;
    std::string db_path;
};

std::string memory_id(const std::string& content, const std::string& timestamp);

// Captured memories and Q&A pairs; plain substring search over SQLite.
class MemoryStore {
public:
    explicit MemoryStore(const std::string& db_path);
    ~MemoryStore();
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    Memory add(const std::string& content,
               const std::string& platform = "unknown",
               const std::string& project = "default",
               const std::vector<std::string>& tags = {},
               const nlohmann::json& context = nlohmann::json::object());
    Memory remember(const std::string& text, const std::string& source = "unknown",
                    const std::vector<std::string>& tags = {});

    std::vector<Memory> search(const std::string& query, int limit = 10);
    std::vector<Recollection> recall(const std::string& query, int limit = 5);
    std::vector<Memory> context(int limit = 10);

    void ask(const std::string& question, const std::string& answer, const std::string& memory_id = "");
    std::vector<Ask> get_asks(const std::string& query = "");

    MemoryStats stats();
    const std::string& path() const { return db_path_; }

private:
    void init();
    void exec(const std::string& sql);
    std::vector<Memory> select_memories(const std::string& sql, const std::string& like, int limit);
    [[noreturn]] void fail(const std::string& what);

    std::string db_path_;
    struct sqlite3* db_ {nullptr};
};
