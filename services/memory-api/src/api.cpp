#include "../include/api.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static ApiResponse reply(int status, const json& body) {
    return ApiResponse{status, body.dump(), "application/json"};
}

static ApiResponse bad_request(const std::string& msg) {
    return reply(400, json{{"error", msg}});
}

static std::string param(const std::map<std::string, std::string>& q, const std::string& key,
                         const std::string& def = "") {
    auto it = q.find(key);
    return it == q.end() ? def : it->second;
}

static int int_param(const std::map<std::string, std::string>& q, const std::string& key, int def) {
    auto v = param(q, key);
    return v.empty() ? def : std::stoi(v);
}

ApiResponse handle_request(ApiContext& ctx, const std::string& method, const std::string& path,
                           const std::map<std::string, std::string>& query, const std::string& body) {
    try {
        if (method == "POST" && path == "/memories") {
            auto j = json::parse(body);
            auto content = j.value("content", std::string());
            if (content.empty()) return bad_request("content required");
            auto m = ctx.memories.add(content,
                                      j.value("platform", std::string("unknown")),
                                      j.value("project", std::string("default")),
                                      j.value("tags", std::vector<std::string>{}),
                                      j.value("context", json::object()));
            return reply(200, json(m));
        }
        if (method == "GET" && path == "/memories/search") {
            auto q = param(query, "q");
            if (q.empty()) return bad_request("q query parameter required");
            json arr = json::array();
            for (auto& m : ctx.memories.search(q, int_param(query, "limit", 10))) arr.push_back(json(m));
            return reply(200, json{{"results", arr}});
        }
        if (method == "GET" && path == "/context") {
            json arr = json::array();
            for (auto& m : ctx.memories.context(int_param(query, "limit", 10))) arr.push_back(json(m));
            return reply(200, json{{"results", arr}});
        }
        if (method == "POST" && path == "/asks") {
            auto j = json::parse(body);
            auto question = j.value("question", std::string());
            auto answer = j.value("answer", std::string());
            if (question.empty() || answer.empty()) return bad_request("question and answer required");
            ctx.memories.ask(question, answer, j.value("memory_id", std::string()));
            return reply(200, json{{"ok", true}});
        }
        if (method == "GET" && path == "/asks") {
            json arr = json::array();
            for (auto& a : ctx.memories.get_asks(param(query, "q"))) {
                arr.push_back({{"question", a.question}, {"answer", a.answer},
                               {"memory_id", a.memory_id}, {"timestamp", a.timestamp}});
            }
            return reply(200, json{{"asks", arr}});
        }
        if (method == "GET" && path == "/stats") {
            auto m = ctx.memories.stats();
            auto s = ctx.semantic.stats();
            json out = {
                {"memories", {
                    {"total_memories", m.total_memories},
                    {"total_asks", m.total_asks},
                    {"platforms", m.platforms},
                    {"projects", m.projects},
                    {"db_path", m.db_path}
                }},
                {"semantic", {
                    {"total_chunks", s.total_chunks},
                    {"total_files", s.distinct_source_files},
                    {"available", !ctx.semantic.degraded()}
                }}
            };
            return reply(200, out);
        }
        if (method == "POST" && path == "/index") {
            auto j = json::parse(body);
            auto target = j.value("path", std::string());
            if (target.empty()) return bad_request("path required");
            auto r = ctx.semantic.index_directory(target, j.value("pattern", std::string("*.md")),
                                                  j.value("force", false));
            json failures = json::array();
            for (auto& f : r.failures) failures.push_back({{"path", f.path}, {"error", f.error}});
            return reply(200, json{{"written", r.written}, {"files", r.files},
                                   {"failures", failures}, {"degraded", r.degraded}});
        }
        if (method == "GET" && path == "/semantic/search") {
            auto q = param(query, "q");
            if (q.empty()) return bad_request("q query parameter required");
            auto min_score = param(query, "min_score");
            auto outcome = ctx.semantic.search(q, int_param(query, "top_k", 5),
                                               min_score.empty() ? 0.3f : std::stof(min_score));
            if (!outcome.available()) {
                return reply(503, json{{"error", "semantic search unavailable"}});
            }
            json arr = json::array();
            for (auto& h : outcome.hits) {
                arr.push_back({{"source_path", h.source_path}, {"text", h.text}, {"score", h.score}});
            }
            return reply(200, json{{"results", arr}});
        }
        return reply(404, json{{"error", "not found"}});
    } catch (const EmbeddingError& e) {
        return reply(502, json{{"error", std::string("embedding provider failed: ") + e.what()}});
    } catch (const std::exception& e) {
        return bad_request(e.what());
    }
}
