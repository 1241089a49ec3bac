#pragma once
#include "config.hpp"
#include <string>
#include <vector>

class Answerer {
public:
    virtual ~Answerer() = default;
    virtual std::string answer(const std::string& prompt, const std::vector<std::string>& context) = 0;
    // Up to three short follow-up questions.
    virtual std::vector<std::string> suggest(const std::string& question, const std::string& answer) = 0;
};

class OllamaAnswerer : public Answerer {
public:
    explicit OllamaAnswerer(LlmConfig cfg);
    std::string answer(const std::string& prompt, const std::vector<std::string>& context) override;
    std::vector<std::string> suggest(const std::string& question, const std::string& answer) override;

private:
    std::string chat(const std::string& system_prompt, const std::string& user_prompt);

    LlmConfig cfg_;
};

// Flattens model output into one conversational paragraph: list markers and
// bold markers dropped, lines joined, repeated spaces collapsed.
std::string format_answer(const std::string& text);

// One suggestion per non-empty line, list markers stripped, at most three.
std::vector<std::string> parse_suggestions(const std::string& text);
