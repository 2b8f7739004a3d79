#include "../include/catalog.hpp"
#include "../include/util.hpp"
#include <stdexcept>

FilingCatalog FilingCatalog::from_json(const nlohmann::json& j) {
    if (!j.is_array()) throw std::runtime_error("filing manifest must be a JSON array");
    FilingCatalog c;
    for (const auto& e : j) {
        FilingEntry f;
        f.id.entity = e.at("entity").get<std::string>();
        f.id.doc_type = e.value("doc_type", std::string("10-K"));
        f.id.fiscal_period = e.at("fiscal_period").is_number()
            ? std::to_string(e.at("fiscal_period").get<int>())
            : e.at("fiscal_period").get<std::string>();
        f.locator = e.value("url", e.value("path", std::string()));
        if (f.locator.empty()) {
            throw std::runtime_error("manifest entry for " + f.id.key() + " has no url or path");
        }
        c.entries_.push_back(std::move(f));
    }
    return c;
}

FilingCatalog FilingCatalog::load(const std::string& path) {
    return from_json(nlohmann::json::parse(read_text_file(path)));
}

std::optional<FilingEntry> FilingCatalog::find(const std::string& entity, const std::string& doc_type,
                                               const std::string& fiscal_period) const {
    auto want = to_lower(entity);
    for (const auto& e : entries_) {
        if (to_lower(e.id.entity) == want && e.id.doc_type == doc_type && e.id.fiscal_period == fiscal_period) {
            return e;
        }
    }
    return std::nullopt;
}
