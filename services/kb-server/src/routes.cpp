#include "../include/routes.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace {
ApiResponse reply(int status, const json& j) {
    return ApiResponse{status, j.dump()};
}

ApiResponse status_route(KnowledgeBase& kb) {
    auto s = kb.status();
    json out = {
        {"ready", s.ready},
        {"building", s.building},
        {"chunks_count", s.chunk_count},
        {"pages_crawled", s.pages_crawled},
        {"pdfs_processed", s.pdfs_processed},
        {"last_updated", s.last_build_time > 0 ? json(s.last_build_time) : json(nullptr)},
        {"data_source", s.source.empty() ? json(nullptr) : json(s.source)},
        {"message", s.ready ? "Knowledge base ready" : (s.building ? "Building knowledge base..." : "Knowledge base not loaded")}
    };
    if (!s.last_error.empty()) out["last_error"] = s.last_error;
    return reply(200, out);
}

ApiResponse build_route(KnowledgeBase& kb, BuildMode mode, const char* started_msg) {
    if (!kb.start_build(mode)) {
        return reply(409, {{"success", false}, {"error", "already building"}});
    }
    return reply(200, {{"success", true}, {"message", started_msg}});
}

ApiResponse ask_route(KnowledgeBase& kb, ConversationHistory& history, const std::string& body) {
    auto j = json::parse(body);
    std::string question = j.value("question", std::string());
    auto res = kb.query(question, history.recent());
    if (!res.error.empty()) return reply(200, {{"error", res.error}});
    history.add({question, res.answer});
    return reply(200, {{"answer", res.answer}, {"suggestions", res.suggestions}});
}

ApiResponse stats_route(KnowledgeBase& kb) {
    auto s = kb.store_stats();
    return reply(200, {
        {"total_sessions", s.total_sessions},
        {"active_sessions", s.active_sessions},
        {"web_chunks", s.web_chunks},
        {"pdf_chunks", s.pdf_chunks},
        {"total_chunks", s.total_chunks},
        {"total_pdfs", s.total_pdfs}
    });
}
}

ApiResponse handle_request(KnowledgeBase& kb, ConversationHistory& history,
                           const std::string& method, const std::string& path, const std::string& body) {
    try {
        if (method == "GET" && path == "/status") return status_route(kb);
        if (method == "GET" && path == "/stats") return stats_route(kb);
        if (method == "POST" && path == "/update") return build_route(kb, BuildMode::Update, "Update started");
        if (method == "POST" && path == "/rebuild") {
            auto r = build_route(kb, BuildMode::ForceRebuild, "Complete rebuild started");
            if (r.status == 200) history.clear();
            return r;
        }
        if (method == "POST" && path == "/ask") return ask_route(kb, history, body);
        return reply(404, {{"error", "not found"}});
    } catch (const json::exception& e) {
        std::cerr << "[kb-server] " << method << " " << path << ": " << e.what() << std::endl;
        return reply(400, {{"error", e.what()}});
    } catch (const std::exception& e) {
        std::cerr << "[kb-server] " << method << " " << path << ": " << e.what() << std::endl;
        return reply(500, {{"error", e.what()}});
    }
}
