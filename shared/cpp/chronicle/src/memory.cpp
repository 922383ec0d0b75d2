#include "../include/memory.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>

using json = nlohmann::json;

namespace {
void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

struct Stmt {
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
};

// SQL LIKE pattern for a literal substring; '\' is the escape character.
std::string like_pattern(const std::string& q) {
    std::string out = "%";
    for (char c : q) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += '%';
    return out;
}
}

void to_json(json& j, const Memory& m) {
    j = json{
        {"id", m.id},
        {"content", m.content},
        {"timestamp", m.timestamp},
        {"platform", m.platform},
        {"project", m.project},
        {"tags", m.tags},
        {"context", m.context}
    };
}

std::string memory_id(const std::string& content, const std::string& timestamp) {
    return sha256_hex(content + timestamp).substr(0, 16);
}

MemoryStore::MemoryStore(const std::string& db_path) : db_path_(db_path) {
    if (db_path != ":memory:" && !ensure_parent_dir(db_path)) {
        throw StoreError("Failed to create directory for SQLite DB: " + db_path);
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    try {
        init();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

MemoryStore::~MemoryStore() {
    if (db_) sqlite3_close(db_);
}

void MemoryStore::fail(const std::string& what) {
    throw StoreError(what + ": " + sqlite3_errmsg(db_));
}

void MemoryStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

void MemoryStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA busy_timeout=5000;");
    exec("CREATE TABLE IF NOT EXISTS memories (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  content TEXT NOT NULL,\n"
         "  timestamp TEXT NOT NULL,\n"
         "  platform TEXT,\n"
         "  project TEXT,\n"
         "  tags TEXT,\n"
         "  context TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS asks (\n"
         "  question TEXT,\n"
         "  answer TEXT,\n"
         "  memory_id TEXT,\n"
         "  timestamp TEXT\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_timestamp ON memories(timestamp);");
    exec("CREATE INDEX IF NOT EXISTS idx_project ON memories(project);");
    exec("CREATE INDEX IF NOT EXISTS idx_platform ON memories(platform);");
}

Memory MemoryStore::add(const std::string& content, const std::string& platform,
                        const std::string& project, const std::vector<std::string>& tags,
                        const json& context) {
    Memory m;
    m.content = content;
    m.timestamp = now_iso8601();
    m.platform = platform;
    m.project = project;
    m.tags = tags;
    m.context = context.is_object() ? context : json::object();
    m.id = memory_id(m.content, m.timestamp);

    Stmt s(db_, "INSERT INTO memories (id, content, timestamp, platform, project, tags, context) \n"
                "VALUES (?, ?, ?, ?, ?, ?, ?);");
    bind_text(s.st, 1, m.id);
    bind_text(s.st, 2, m.content);
    bind_text(s.st, 3, m.timestamp);
    bind_text(s.st, 4, m.platform);
    bind_text(s.st, 5, m.project);
    bind_text(s.st, 6, json(m.tags).dump());
    bind_text(s.st, 7, m.context.dump());
    if (sqlite3_step(s.st) != SQLITE_DONE) fail("insert memory failed");
    return m;
}

Memory MemoryStore::remember(const std::string& text, const std::string& source,
                             const std::vector<std::string>& tags) {
    return add(text, source, "default", tags);
}

std::vector<Memory> MemoryStore::select_memories(const std::string& sql, const std::string& like, int limit) {
    std::vector<Memory> out;
    Stmt s(db_, sql);
    int idx = 1;
    if (!like.empty()) bind_text(s.st, idx++, like);
    sqlite3_bind_int(s.st, idx, limit);
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        Memory m;
        m.id = column_text(s.st, 0);
        m.content = column_text(s.st, 1);
        m.timestamp = column_text(s.st, 2);
        m.platform = column_text(s.st, 3);
        m.project = column_text(s.st, 4);
        auto tags = json::parse(column_text(s.st, 5), nullptr, false);
        if (tags.is_array()) {
            for (auto& t : tags) if (t.is_string()) m.tags.push_back(t.get<std::string>());
        }
        auto ctx = json::parse(column_text(s.st, 6), nullptr, false);
        m.context = ctx.is_object() ? ctx : json::object();
        out.push_back(std::move(m));
    }
    if (rc != SQLITE_DONE) fail("select memories failed");
    return out;
}

std::vector<Memory> MemoryStore::search(const std::string& query, int limit) {
    return select_memories(
        "SELECT id, content, timestamp, platform, project, tags, context FROM memories \n"
        "WHERE content LIKE ? ESCAPE '\\' ORDER BY timestamp DESC LIMIT ?;",
        like_pattern(query), limit);
}

std::vector<Recollection> MemoryStore::recall(const std::string& query, int limit) {
    std::vector<Recollection> out;
    for (auto& m : search(query, limit)) {
        out.push_back({m.content, m.timestamp, m.platform, m.tags});
    }
    return out;
}

std::vector<Memory> MemoryStore::context(int limit) {
    return select_memories(
        "SELECT id, content, timestamp, platform, project, tags, context FROM memories \n"
        "ORDER BY timestamp DESC LIMIT ?;",
        "", limit);
}

void MemoryStore::ask(const std::string& question, const std::string& answer, const std::string& memory_id) {
    Stmt s(db_, "INSERT INTO asks (question, answer, memory_id, timestamp) VALUES (?, ?, ?, ?);");
    bind_text(s.st, 1, question);
    bind_text(s.st, 2, answer);
    if (memory_id.empty()) sqlite3_bind_null(s.st, 3);
    else bind_text(s.st, 3, memory_id);
    bind_text(s.st, 4, now_iso8601());
    if (sqlite3_step(s.st) != SQLITE_DONE) fail("insert ask failed");
}

std::vector<Ask> MemoryStore::get_asks(const std::string& query) {
    std::vector<Ask> out;
    std::string sql = "SELECT question, answer, memory_id, timestamp FROM asks ";
    if (!query.empty()) sql += "WHERE question LIKE ? ESCAPE '\\' ";
    sql += "ORDER BY timestamp DESC;";
    Stmt s(db_, sql);
    if (!query.empty()) bind_text(s.st, 1, like_pattern(query));
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back({column_text(s.st, 0), column_text(s.st, 1),
                       column_text(s.st, 2), column_text(s.st, 3)});
    }
    if (rc != SQLITE_DONE) fail("select asks failed");
    return out;
}

MemoryStats MemoryStore::stats() {
    MemoryStats st;
    st.db_path = db_path_;
    {
        Stmt s(db_, "SELECT (SELECT COUNT(*) FROM memories), (SELECT COUNT(*) FROM asks);");
        if (sqlite3_step(s.st) != SQLITE_ROW) fail("memory stats failed");
        st.total_memories = sqlite3_column_int64(s.st, 0);
        st.total_asks = sqlite3_column_int64(s.st, 1);
    }
    auto group = [&](const char* sql, std::map<std::string, int64_t>& into) {
        Stmt s(db_, sql);
        int rc;
        while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
            into[column_text(s.st, 0)] = sqlite3_column_int64(s.st, 1);
        }
        if (rc != SQLITE_DONE) fail("memory stats failed");
    };
    group("SELECT platform, COUNT(*) FROM memories GROUP BY platform;", st.platforms);
    group("SELECT project, COUNT(*) FROM memories GROUP BY project;", st.projects);
    return st;
}
