#pragma once
#include "../../../agents/site-rag/include/rag.hpp"
#include <string>

struct ApiResponse {
    int status{200};
    std::string body; // JSON
};

// Dispatches one HTTP request against the knowledge base. Never throws;
// malformed JSON answers 400 and other failures 500, both with {"error": ...}.
ApiResponse handle_request(KnowledgeBase& kb, ConversationHistory& history,
                           const std::string& method, const std::string& path, const std::string& body);
