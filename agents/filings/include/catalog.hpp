#pragma once
#include "models.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct FilingEntry {
    DocumentId id;
    std::string locator;
};

// Resolves a filing identity to its source location. Loaded from a manifest:
// [{"entity":"TSLA","doc_type":"10-K","fiscal_period":"2020","url":"..."}]
class FilingCatalog {
public:
    static FilingCatalog from_json(const nlohmann::json& j);
    static FilingCatalog load(const std::string& path);

    std::optional<FilingEntry> find(const std::string& entity, const std::string& doc_type,
                                    const std::string& fiscal_period) const;
    const std::vector<FilingEntry>& entries() const { return entries_; }

private:
    std::vector<FilingEntry> entries_;
};
