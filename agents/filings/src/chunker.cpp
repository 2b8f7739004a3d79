#include "../include/chunker.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<Section> split_sections(const std::string& text, const std::vector<std::string>& markers) {
    std::vector<std::pair<std::size_t, std::string>> hits;
    std::size_t from = 0;
    for (const auto& m : markers) {
        if (m.empty()) continue;
        auto pos = text.find(m, from);
        if (pos == std::string::npos) continue;
        hits.emplace_back(pos, m);
        from = pos + m.size();
    }

    std::vector<Section> out;
    std::size_t first = hits.empty() ? text.size() : hits.front().first;
    if (first > 0) out.push_back({"Preamble", 0, first});
    for (std::size_t i = 0; i < hits.size(); ++i) {
        std::size_t end = i + 1 < hits.size() ? hits[i + 1].first : text.size();
        if (end > hits[i].first) out.push_back({hits[i].second, hits[i].first, end});
    }
    return out;
}

std::vector<Chunk> chunk_document(const std::string& doc_id, const ExtractedText& text,
                                  const std::vector<std::string>& markers, const ChunkerOptions& opts) {
    const std::size_t size = opts.chunk_chars();
    const std::size_t overlap = opts.overlap_chars();
    if (size == 0 || overlap >= size) {
        throw std::invalid_argument("chunk size must be positive and larger than overlap");
    }
    const std::size_t step = size - overlap;

    std::vector<Chunk> out;
    auto emit = [&](const Section& s, std::size_t b, std::size_t e) {
        Chunk c;
        c.doc_id = doc_id;
        c.ordinal = (int)out.size();
        c.section = s.label;
        c.text = text.text.substr(b, e - b);
        c.char_begin = b;
        c.char_end = e;
        c.page = text.page_at(b);
        out.push_back(std::move(c));
    };

    for (const auto& s : split_sections(text.text, markers)) {
        std::size_t len = s.end - s.begin;
        if (len <= size) {
            emit(s, s.begin, s.end);
            continue;
        }
        for (std::size_t start = s.begin;; start += step) {
            std::size_t end = std::min(s.end, start + size);
            emit(s, start, end);
            if (end == s.end) break;
        }
    }
    return out;
}
