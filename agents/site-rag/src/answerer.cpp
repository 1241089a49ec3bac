#include "../include/answerer.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
const char* kAnswerRules =
    "You are an AI assistant for this website. Answer questions directly and conversationally.\n"
    "1. Give precise, to-the-point answers only.\n"
    "2. Answer exactly what is asked; do not add extra information.\n"
    "3. Use a natural, conversational tone.\n"
    "4. If the question relates to previous context, acknowledge it naturally.\n"
    "5. Keep responses short: two or three sentences for simple questions.\n"
    "If the context does not contain the answer, say you don't know.";

// Drops a leading "- ", "* ", "• " or "N. " marker.
std::string strip_list_marker(std::string line) {
    if (line.rfind("- ", 0) == 0 || line.rfind("* ", 0) == 0) return trim(line.substr(2));
    if (line.rfind("\xE2\x80\xA2 ", 0) == 0) return trim(line.substr(4));
    size_t i = 0;
    while (i < line.size() && std::isdigit((unsigned char)line[i])) ++i;
    if (i > 0 && i + 1 < line.size() && (line[i] == '.' || line[i] == ')') && line[i + 1] == ' ') {
        return trim(line.substr(i + 2));
    }
    return line;
}
}

OllamaAnswerer::OllamaAnswerer(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaAnswerer::chat(const std::string& system_prompt, const std::string& user_prompt) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", json::array({
            json{{"role","system"},{"content",system_prompt}},
            json{{"role","user"},{"content",user_prompt}}
        })}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error("chat failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body);
    if (data.contains("message")) return data["message"]["content"].get<std::string>();
    return {};
}

std::string OllamaAnswerer::answer(const std::string& prompt, const std::vector<std::string>& context) {
    std::string user = "Context from website and documents:\n" + join(context, "\n\n") +
                       "\n\nQuestion with context: " + prompt + "\n\nAnswer naturally and directly.";
    return chat(kAnswerRules, user);
}

std::vector<std::string> OllamaAnswerer::suggest(const std::string& question, const std::string& answer) {
    std::string user = "Based on this Q&A, suggest 3 short follow-up questions (max 6 words each).\n\n"
                       "Question: " + question + "\nAnswer: " + answer +
                       "\n\nReply with the 3 questions only, one per line.";
    return parse_suggestions(chat("You write short follow-up questions.", user));
}

std::string format_answer(const std::string& text) {
    std::istringstream lines(trim(text));
    std::vector<std::string> kept;
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty()) continue;
        line = strip_list_marker(line);
        size_t pos;
        while ((pos = line.find("**")) != std::string::npos) line.erase(pos, 2);
        line = trim(line);
        if (!line.empty()) kept.push_back(line);
    }
    std::string out;
    for (char c : join(kept, " ")) {
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        out.push_back(c);
    }
    return trim(out);
}

std::vector<std::string> parse_suggestions(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line) && out.size() < 3) {
        line = strip_list_marker(trim(line));
        if (!line.empty()) out.push_back(line);
    }
    return out;
}
