#pragma once
#include "models.hpp"

// Converts raw filing bytes to plain text with page boundaries.
// Throws PipelineError(ExtractionFailure) for corrupt, binary or empty input.
ExtractedText extract_text(const RawDocument& doc);

ExtractedText extract_plain_text(const std::string& bytes);
ExtractedText extract_html_text(const std::string& html);
std::string decode_html_entities(const std::string& s);
