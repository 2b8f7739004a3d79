#pragma once
#include "config.hpp"
#include "models.hpp"
#include <string>
#include <vector>

struct Section {
    std::string label;
    std::size_t begin{0};
    std::size_t end{0};
};

// Partitions text at the first occurrence of each marker, searching in marker
// order from the previous match. Unmatched markers are skipped. Text before the
// first match is the "Preamble" section. Empty sections are dropped.
std::vector<Section> split_sections(const std::string& text, const std::vector<std::string>& markers);

// Section-aligned chunks with contiguous ordinals from 0. A section of at most
// chunk_chars() characters becomes one chunk; longer sections are windowed
// with chunk_chars() and a step of chunk_chars() - overlap_chars().
std::vector<Chunk> chunk_document(const std::string& doc_id, const ExtractedText& text,
                                  const std::vector<std::string>& markers, const ChunkerOptions& opts);
