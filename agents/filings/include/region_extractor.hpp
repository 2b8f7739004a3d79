#pragma once
#include "config.hpp"
#include "model_clients.hpp"
#include "models.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct RegionExtraction {
    std::vector<StructuredRecord> records;
    int pages_sent{0};
    int regions_returned{0}; // billable unit at the vision boundary
    bool degraded{false};
    std::string degraded_reason;
};

// Finds table-like pages and converts them to StructuredRecords through the
// vision boundary. Never throws for vision failures: it reports degraded
// instead, with no records.
class StructuredRegionExtractor {
public:
    StructuredRegionExtractor(VisionClient& vision, RetryPolicy retry);
    RegionExtraction extract(const std::string& doc_id, const ExtractedText& text);

private:
    VisionClient& vision_;
    RetryPolicy retry_;
};

bool page_has_structured_region(const PageSpan& page);

// Validates vision output; malformed regions are dropped.
std::vector<StructuredRecord> parse_regions(const nlohmann::json& regions, const std::string& doc_id,
                                            int page, int first_index);
