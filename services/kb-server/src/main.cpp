#include "../include/routes.hpp"
#include <curl/curl.h>
#include <microhttpd.h>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
volatile std::sig_atomic_t g_stop = 0;

struct ServerContext {
    KnowledgeBase* kb;
    ConversationHistory* history;
};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body,
                        const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, (unsigned int)status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
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

    auto* ctx = static_cast<ServerContext*>(cls);
    ApiResponse r = handle_request(*ctx->kb, *ctx->history, ci->method, ci->url, ci->body);
    return send_response(connection, r.status, r.body);
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

void on_signal(int) { g_stop = 1; }
}

int main(int, char**) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[kb-server] curl_global_init failed" << std::endl;
        return 1;
    }
    int rc = 0;
    try {
        SiteRagConfig cfg = load_config_from_env();
        auto kb = std::make_unique<KnowledgeBase>(cfg,
                                                  std::make_shared<CurlFetcher>(),
                                                  std::make_shared<OllamaEmbedder>(cfg.embed),
                                                  std::make_shared<OllamaAnswerer>(cfg.llm),
                                                  std::make_shared<SessionStore>(cfg.store.db_path));
        ConversationHistory history(cfg.server.history_size);
        ServerContext ctx{kb.get(), &history};

        std::cout << "[kb-server] Base URL " << cfg.crawl.base_url << ", database " << cfg.store.db_path << std::endl;
        kb->start_build(BuildMode::LoadOrBuild);

        std::cout << "[kb-server] Starting HTTP server on port " << cfg.server.port << "..." << std::endl;
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                                                (uint16_t)cfg.server.port, nullptr, nullptr,
                                                &handler, &ctx,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            std::cerr << "[kb-server] Failed to start HTTP server" << std::endl;
            rc = 1;
        } else {
            std::signal(SIGINT, on_signal);
            std::signal(SIGTERM, on_signal);
            while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));
            std::cout << "[kb-server] Stopping" << std::endl;
            MHD_stop_daemon(d);
        }
        // Build threads are not cancellable; the destructor waits for one in flight.
        kb.reset();
    } catch (const std::exception& e) {
        std::cerr << "[kb-server] " << e.what() << std::endl;
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
