#include "../include/util.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <unordered_set>
#include <chrono>
#include <cctype>
#include <cmath>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string sha256_hex(const std::string& bytes) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    if (n < 0) throw std::runtime_error("base64 encoding failed");
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open file: " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::vector<std::string> tokenize_terms(const std::string& text) {
    static const std::unordered_set<std::string> stop = {
        "a", "an", "and", "are", "as", "at", "be", "by", "for", "from", "has", "in",
        "is", "it", "its", "of", "on", "or", "that", "the", "to", "was", "were",
        "what", "which", "who", "how", "did", "do", "does", "with", "this", "their"
    };
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]{
        if (!cur.empty() && !stop.count(cur)) out.push_back(cur);
        cur.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) cur.push_back(static_cast<char>(std::tolower(c)));
        else flush();
    }
    flush();
    return out;
}

std::string strip_code_fences(const std::string& text) {
    auto t = trim(text);
    if (t.rfind("```", 0) != 0) return t;
    auto nl = t.find('\n');
    if (nl == std::string::npos) return t;
    auto close = t.rfind("```");
    if (close == 0 || close <= nl) return trim(t.substr(nl + 1));
    return trim(t.substr(nl + 1, close - nl - 1));
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}
