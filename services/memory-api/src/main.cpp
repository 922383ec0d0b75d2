#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <cstring>
#include <csignal>
#include <cstdint>
#include <unistd.h>
#include <microhttpd.h>
#include "../include/api.hpp"
#include "../../../shared/cpp/chronicle/include/config.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, const ApiResponse& r) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(r.body.size(), (void*)r.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, r.content_type.c_str());
    MhdResult ret = MHD_queue_response(conn, (unsigned int)r.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult collect_arg(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string,std::string>*>(cls);
    (*m)[key ? key : ""] = val ? val : "";
    return MHD_YES;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND, &collect_arg, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    auto* ctx = static_cast<ApiContext*>(cls);
    auto r = handle_request(*ctx, ci->method, ci->url, parse_query(connection), ci->body);
    if (r.status >= 500) {
        std::cerr << "[memory-api] " << ci->method << " " << ci->url << " -> " << r.status << "\n";
    }
    return send_response(connection, r);
}

static void request_completed(void* /*cls*/, struct MHD_Connection*, void** con_cls,
                              enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void on_signal(int) {}

int main(int, char**) {
    try {
        ChronicleConfig cfg = load_config();
        resolve_paths(cfg);

        auto embedder = make_embedding_provider(cfg.embed);
        MemoryStore memories(cfg.db_path);
        SemanticIndex semantic(cfg.semantic_db_path, embedder.get(), cfg.chunking);
        ApiContext ctx{memories, semantic};

        if (!embedder) {
            std::cout << "[memory-api] No embedding provider configured; semantic search disabled\n";
        }
        std::cout << "[memory-api] Starting HTTP server on port " << cfg.api_port << "...\n";
        // one internal polling thread: handlers never run concurrently
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.api_port,
                                                nullptr, nullptr, &handler, &ctx,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            std::cerr << "[memory-api] Failed to start HTTP server" << std::endl;
            return 1;
        }
        std::signal(SIGTERM, on_signal);
        std::signal(SIGINT, on_signal);
        pause();
        std::cout << "[memory-api] Shutting down\n";
        MHD_stop_daemon(d);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[memory-api] " << e.what() << "\n";
        return 1;
    }
}
