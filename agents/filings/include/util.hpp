#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
std::string sha256_hex(const std::string& bytes);
std::string base64_encode(const std::string& bytes);
std::string read_text_file(const std::filesystem::path& p);
std::int64_t unix_now();

std::string to_lower(std::string s);
std::string trim(const std::string& s);
// Lowercased alphanumeric terms with English stop words removed.
std::vector<std::string> tokenize_terms(const std::string& text);
// Drops a surrounding ``` fence (with optional language tag) from model output.
std::string strip_code_fences(const std::string& text);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
