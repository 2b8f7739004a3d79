#include "../include/models.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

std::string DocumentId::key() const {
    std::string k = entity + "_" + doc_type + "_" + fiscal_period;
    for (auto& c : k) {
        if (std::isspace(static_cast<unsigned char>(c))) c = '-';
    }
    return k;
}

int ExtractedText::page_at(std::size_t offset) const {
    for (const auto& p : pages) {
        if (offset >= p.begin && offset < p.end) return p.number;
    }
    return pages.empty() ? 1 : pages.back().number;
}

// Accepts the usual filing notations: "$1,234.5", "(123)" for negatives, "12%".
TypedValue TypedValue::parse(const std::string& cell) {
    TypedValue v;
    std::string s;
    for (char c : cell) {
        if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
    }
    if (s.empty() || s == "-" || s == "—") return v;

    bool negative = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = s.substr(1, s.size() - 2);
    }
    std::string digits;
    for (char c : s) {
        if (c == '$' || c == ',' || c == '%') continue;
        digits.push_back(c);
    }
    if (!digits.empty() && digits.front() == '-') {
        negative = !negative;
        digits.erase(0, 1);
    }
    bool numeric = !digits.empty() &&
        std::all_of(digits.begin(), digits.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)) || c == '.'; }) &&
        std::count(digits.begin(), digits.end(), '.') <= 1 && digits != ".";
    if (numeric) {
        v.type = Type::Number;
        v.number = std::strtod(digits.c_str(), nullptr) * (negative ? -1.0 : 1.0);
        v.text = cell;
        return v;
    }
    v.type = Type::Text;
    v.text = cell;
    return v;
}
