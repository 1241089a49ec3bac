#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
std::string sha1_hex(const std::string& bytes);
void write_binary_file(const std::filesystem::path& p, const std::string& bytes);

std::string to_lower(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);
std::string trim(const std::string& s);
std::vector<std::string> split_words(const std::string& text);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// "annual_report-2024.pdf" -> "Annual Report-2024"
std::string title_from_filename(const std::string& filename);
