#pragma once
#include "../../../shared/cpp/chronicle/include/memory.hpp"
#include "../../../shared/cpp/chronicle/include/semantic.hpp"
#include <string>
#include <map>

struct ApiContext {
    MemoryStore& memories;
    SemanticIndex& semantic;
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// Routes one request; no sockets involved so handlers can be exercised directly.
ApiResponse handle_request(ApiContext& ctx, const std::string& method, const std::string& path,
                           const std::map<std::string, std::string>& query, const std::string& body);
