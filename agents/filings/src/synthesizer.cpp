#include "../include/synthesizer.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <sstream>

namespace {

struct Source {
    std::string doc_id;
    int page{0};
    std::string location;
    std::string content;
};

std::string cell(const QueryRows& rows, std::size_t r, const char* column) {
    int idx = rows.column_index(column);
    return idx < 0 ? std::string() : rows.rows[r][(std::size_t)idx];
}

int to_int(const std::string& s) {
    try {
        return s.empty() ? 0 : std::stoi(s);
    } catch (const std::exception&) {
        return 0;
    }
}

std::vector<Source> row_sources(const QueryRows& rows) {
    std::vector<Source> out;
    for (std::size_t r = 0; r < rows.rows.size(); ++r) {
        Source s;
        s.doc_id = cell(rows, r, "doc_id");
        s.page = to_int(cell(rows, r, "page"));
        std::string rec = cell(rows, r, "record_id");
        std::string row = cell(rows, r, "row_index");
        if (!rec.empty()) s.location = "table " + rec + (row.empty() ? "" : ", row " + row);
        else s.location = "query row " + std::to_string(r + 1);
        std::ostringstream os;
        for (std::size_t c = 0; c < rows.columns.size(); ++c) {
            if (c) os << ", ";
            os << rows.columns[c] << "=" << rows.rows[r][c];
        }
        s.content = os.str();
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<Source> chunk_sources(const RetrievalResult& retrieval) {
    std::vector<Source> out;
    for (const auto& r : retrieval.results) {
        Source s;
        s.doc_id = r.chunk.doc_id;
        s.page = r.chunk.page;
        s.location = "chunk " + std::to_string(r.chunk.ordinal) + ", " + r.chunk.section;
        s.content = r.chunk.text;
        out.push_back(std::move(s));
    }
    return out;
}

std::string render_sources(const std::vector<Source>& sources, std::size_t max_chars) {
    std::ostringstream os;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& s = sources[i];
        os << "[" << i + 1 << "] (" << s.doc_id;
        if (s.page > 0) os << ", p." << s.page;
        os << ", " << s.location << ")\n";
        os << (s.content.size() > max_chars ? s.content.substr(0, max_chars) + "..." : s.content) << "\n\n";
    }
    return os.str();
}

// First sentence of a passage, bounded, whitespace collapsed.
std::string lead_sentence(const std::string& text, std::size_t max_chars) {
    std::string flat;
    for (char c : text) {
        if (std::isspace((unsigned char)c)) {
            if (!flat.empty() && flat.back() != ' ') flat.push_back(' ');
        } else {
            flat.push_back(c);
        }
    }
    flat = trim(flat);
    auto stop = flat.find(". ");
    if (stop != std::string::npos && stop < max_chars) return flat.substr(0, stop);
    if (flat.size() > max_chars) return flat.substr(0, max_chars) + "...";
    if (!flat.empty() && flat.back() == '.') flat.pop_back();
    return flat;
}

using Extract = std::vector<std::pair<std::string, int>>; // claim, 1-based source

Extract extractive_rows(const QueryRows& rows, std::size_t max_rows) {
    Extract out;
    std::size_t n = std::min(rows.rows.size(), max_rows);
    for (std::size_t r = 0; r < n; ++r) {
        std::ostringstream os;
        std::string label = cell(rows, r, "row_label");
        std::string column = cell(rows, r, "column_label");
        std::string value = cell(rows, r, "value_text");
        if (value.empty()) value = cell(rows, r, "value_num");
        if (!label.empty() && !value.empty()) {
            std::string entity = cell(rows, r, "entity");
            os << (entity.empty() ? "" : entity + " ") << label << (column.empty() ? "" : " (" + column + ")")
               << " was " << value;
        } else {
            for (std::size_t c = 0; c < rows.columns.size(); ++c) {
                os << (c ? ", " : "") << rows.columns[c] << " " << rows.rows[r][c];
            }
        }
        out.emplace_back(os.str(), (int)r + 1);
    }
    return out;
}

Extract extractive_chunks(const RetrievalResult& retrieval, std::size_t max_results) {
    Extract out;
    std::size_t n = std::min(retrieval.results.size(), max_results);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& c = retrieval.results[i].chunk;
        std::string section = c.section;
        if (!section.empty() && section.back() == '.') section.pop_back();
        // Quote the body, not the heading line the section starts with.
        std::string body = c.text;
        if (!c.section.empty() && body.compare(0, c.section.size(), c.section) == 0) {
            auto nl = body.find('\n');
            if (nl != std::string::npos && trim(body.substr(nl + 1)).size() > 0) body = body.substr(nl + 1);
        }
        out.emplace_back(c.doc_id + " (" + section + "): " + lead_sentence(body, 300), (int)i + 1);
    }
    return out;
}

void apply_extract(Synthesis& out, const Extract& claims, const std::vector<Source>& sources) {
    std::ostringstream os;
    for (const auto& claim : claims) {
        os << claim.first << " [" << claim.second << "].\n";
        const auto& s = sources[(std::size_t)claim.second - 1];
        out.citations.push_back({claim.second, s.doc_id, s.page, s.location, claim.first});
    }
    out.text = trim(os.str());
}

// Builds per-claim citations; counts claims that cite no valid source.
void cite(Synthesis& out, const std::vector<Source>& sources) {
    for (const auto& claim : split_claims(out.text)) {
        bool cited = false;
        for (int n : claim.sources) {
            if (n < 1 || (std::size_t)n > sources.size()) continue;
            const auto& s = sources[(std::size_t)n - 1];
            out.citations.push_back({n, s.doc_id, s.page, s.location, claim.text});
            cited = true;
        }
        if (!cited) ++out.uncited_claims;
    }
}

bool cites_any(const std::string& text, std::size_t source_count) {
    for (const auto& claim : split_claims(text)) {
        for (int n : claim.sources) {
            if (n >= 1 && (std::size_t)n <= source_count) return true;
        }
    }
    return false;
}

const char* kAnswerSystem =
    "You answer questions about company filings using only the numbered sources provided. "
    "End every sentence that states a fact with the marker of its source, e.g. [1] or [2][3]. "
    "If the sources do not answer the question, say so in one sentence.";

}  // namespace

const char* to_string(Confidence c) {
    switch (c) {
        case Confidence::VeryHigh: return "very_high";
        case Confidence::High: return "high";
        case Confidence::Medium: return "medium";
        case Confidence::Low: return "low";
    }
    return "low";
}

Confidence lower(Confidence c) {
    switch (c) {
        case Confidence::VeryHigh: return Confidence::High;
        case Confidence::High: return Confidence::Medium;
        default: return Confidence::Low;
    }
}

std::vector<Claim> split_claims(const std::string& text) {
    static const std::regex marker("\\[(\\d+)\\]");
    std::vector<Claim> out;
    std::string cur;
    auto flush = [&]() {
        std::string t = trim(cur);
        cur.clear();
        // A sentence holding only markers belongs to the previous claim.
        std::string bare = trim(std::regex_replace(t, marker, ""));
        bool only_markers = bare.empty() || bare == ".";
        if (t.empty() || (only_markers && out.empty())) return;
        Claim c;
        for (auto it = std::sregex_iterator(t.begin(), t.end(), marker); it != std::sregex_iterator(); ++it) {
            // No answer lists a million sources; longer markers cite nothing.
            std::string digits = (*it)[1].str();
            if (digits.size() <= 6) c.sources.push_back(std::stoi(digits));
        }
        if (only_markers) {
            for (int s : c.sources) out.back().sources.push_back(s);
            return;
        }
        c.text = t;
        out.push_back(std::move(c));
    };
    for (std::size_t i = 0; i < text.size(); ++i) {
        cur.push_back(text[i]);
        bool end = text[i] == '\n' ||
                   ((text[i] == '.' || text[i] == '?' || text[i] == '!') &&
                    (i + 1 == text.size() || std::isspace((unsigned char)text[i + 1])));
        // Keep markers written after the full stop with their sentence.
        if (end && text[i] != '\n') {
            std::size_t j = i + 1;
            while (j < text.size() && text[j] == ' ') ++j;
            if (j < text.size() && text[j] == '[') continue;
        }
        if (end) flush();
    }
    flush();
    return out;
}

Confidence structured_confidence(const QueryRows& rows) {
    if (rows.rows.empty()) return Confidence::Low;
    int idx = rows.column_index("confidence");
    if (idx < 0) return Confidence::High;
    double min_conf = 1.0;
    for (const auto& r : rows.rows) {
        try {
            min_conf = std::min(min_conf, std::stod(r[(std::size_t)idx]));
        } catch (const std::exception&) {
            return Confidence::High;
        }
    }
    return min_conf >= 0.9 ? Confidence::VeryHigh : Confidence::High;
}

Confidence semantic_confidence(const RetrievalResult& retrieval) {
    if (retrieval.results.empty()) return Confidence::Low;
    int agreed = 0;
    for (const auto& r : retrieval.results) {
        if (r.lexical_rank >= 0 && r.vector_rank >= 0) ++agreed;
    }
    bool both_rankings = retrieval.lexical_ok && retrieval.vector_ok;
    return (agreed >= 2 && both_rankings) ? Confidence::High : Confidence::Medium;
}

Synthesis AnswerSynthesizer::from_rows(const std::string& question, const StructuredQuery& query,
                                       const QueryRows& rows, bool fallback_used) {
    Synthesis out;
    auto sources = row_sources(rows);
    if (llm_) {
        std::string prompt = "Question: " + question + "\n\nQuery: " + query.sql + "\n\nSources:\n" +
                             render_sources(sources, 400) + "Answer:";
        try {
            out.text = trim(llm_->generate(kAnswerSystem, prompt));
        } catch (const std::exception& e) {
            out.warnings.push_back(std::string("answer generation failed, listing rows: ") + e.what());
        }
        if (!out.text.empty() && !cites_any(out.text, sources.size())) {
            out.warnings.push_back("generated answer cited no source, listing rows");
            out.text.clear();
        }
    }
    if (out.text.empty()) {
        apply_extract(out, extractive_rows(rows, 10), sources);
        if (rows.rows.size() > 10) out.text += "\n(" + std::to_string(rows.rows.size() - 10) + " more rows not shown.)";
    } else {
        cite(out, sources);
    }
    if (rows.truncated) out.warnings.push_back("result truncated to " + std::to_string(rows.rows.size()) + " rows");

    out.confidence = structured_confidence(rows);
    if (fallback_used) out.confidence = lower(out.confidence);
    if (out.uncited_claims > 0) out.confidence = lower(out.confidence);
    return out;
}

Synthesis AnswerSynthesizer::from_chunks(const std::string& question, const RetrievalResult& retrieval,
                                         bool fallback_used) {
    Synthesis out;
    out.warnings = retrieval.warnings;
    if (retrieval.results.empty()) {
        out.text = "No passage in the ingested filings matches this question.";
        out.confidence = Confidence::Low;
        out.warnings.push_back("no chunks retrieved");
        return out;
    }
    auto sources = chunk_sources(retrieval);
    if (llm_) {
        std::string prompt = "Question: " + question + "\n\nSources:\n" + render_sources(sources, 1500) + "Answer:";
        try {
            out.text = trim(llm_->generate(kAnswerSystem, prompt));
        } catch (const std::exception& e) {
            out.warnings.push_back(std::string("answer generation failed, quoting passages: ") + e.what());
        }
        if (!out.text.empty() && !cites_any(out.text, sources.size())) {
            out.warnings.push_back("generated answer cited no source, quoting passages");
            out.text.clear();
        }
    }
    if (out.text.empty()) apply_extract(out, extractive_chunks(retrieval, 3), sources);
    else cite(out, sources);
    out.confidence = semantic_confidence(retrieval);
    if (fallback_used) out.confidence = lower(out.confidence);
    if (out.uncited_claims > 0) out.confidence = lower(out.confidence);
    for (const auto& w : out.warnings) std::cerr << "[query] " << w << "\n";
    return out;
}
