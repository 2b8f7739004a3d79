#include "../include/region_extractor.hpp"
#include "../include/errors.hpp"
#include "../include/retry.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {
int numeric_tokens(const std::string& line) {
    int n = 0;
    std::istringstream ss(line);
    std::string tok;
    while (ss >> tok) {
        if (TypedValue::parse(tok).type == TypedValue::Type::Number) ++n;
    }
    return n;
}

std::string cell_text(const json& cell) {
    if (cell.is_string()) return cell.get<std::string>();
    if (cell.is_null()) return {};
    return cell.dump();
}
}

bool page_has_structured_region(const PageSpan& page) {
    if (to_lower(page.raw).find("<table") != std::string::npos) return true;
    // Column-aligned numbers: three consecutive lines with two or more figures.
    std::istringstream ss(page.raw);
    std::string line;
    int run = 0;
    while (std::getline(ss, line)) {
        run = numeric_tokens(line) >= 2 ? run + 1 : 0;
        if (run >= 3) return true;
    }
    return false;
}

std::vector<StructuredRecord> parse_regions(const json& regions, const std::string& doc_id,
                                            int page, int first_index) {
    if (!regions.is_array()) throw std::runtime_error("vision output is not a list of regions");
    std::vector<StructuredRecord> out;
    for (const auto& r : regions) {
        if (!r.is_object() || !r.contains("rows") || !r["rows"].is_array() || r["rows"].empty()) continue;
        StructuredRecord rec;
        rec.doc_id = doc_id;
        rec.record_index = first_index + (int)out.size();
        rec.page = r.contains("page") && r["page"].is_number_integer() ? r["page"].get<int>() : page;
        rec.caption = r.value("caption", std::string());
        if (r.contains("columns") && r["columns"].is_array()) {
            for (const auto& c : r["columns"]) rec.columns.push_back(cell_text(c));
        }
        for (const auto& row : r["rows"]) {
            if (!row.is_array()) continue;
            std::vector<TypedValue> cells;
            for (const auto& cell : row) cells.push_back(TypedValue::parse(cell_text(cell)));
            rec.rows.push_back(std::move(cells));
        }
        if (rec.rows.empty()) continue;
        double conf = r.contains("confidence") && r["confidence"].is_number() ? r["confidence"].get<double>() : 0.5;
        rec.confidence = std::max(0.0, std::min(1.0, conf));
        out.push_back(std::move(rec));
    }
    return out;
}

StructuredRegionExtractor::StructuredRegionExtractor(VisionClient& vision, RetryPolicy retry)
    : vision_(vision), retry_(retry) {}

RegionExtraction StructuredRegionExtractor::extract(const std::string& doc_id, const ExtractedText& text) {
    RegionExtraction res;
    try {
        for (const auto& page : text.pages) {
            if (!page_has_structured_region(page)) continue;
            PageImage img;
            img.page_number = page.number;
            img.mime = "text/html";
            img.bytes = page.raw;
            ++res.pages_sent;
            auto regions = with_retry(retry_, "vision page " + std::to_string(page.number),
                                      [&]{ return vision_.extract_regions(img); });
            if (regions.is_array()) res.regions_returned += (int)regions.size();
            auto recs = parse_regions(regions, doc_id, page.number, (int)res.records.size());
            for (auto& r : recs) res.records.push_back(std::move(r));
        }
    } catch (const std::exception& e) {
        res.records.clear();
        res.degraded = true;
        res.degraded_reason = e.what();
        std::cerr << "[ingest] " << doc_id << ": structured extraction degraded: " << e.what() << "\n";
    }
    return res;
}
