#include "../include/schema.hpp"
#include "../include/util.hpp"
#include <sstream>

bool TableSchema::has_column(const std::string& column) const {
    auto want = to_lower(column);
    for (const auto& c : columns) {
        if (to_lower(c.name) == want) return true;
    }
    return false;
}

const TableSchema* SchemaDescription::table(const std::string& name) const {
    auto want = to_lower(name);
    for (const auto& t : tables) {
        if (to_lower(t.name) == want) return &t;
    }
    return nullptr;
}

std::string SchemaDescription::describe() const {
    std::ostringstream os;
    for (const auto& t : tables) {
        os << "TABLE " << t.name;
        if (!t.description.empty()) os << " -- " << t.description;
        os << "\n";
        for (const auto& c : t.columns) {
            os << "  " << c.name << " " << c.type;
            if (!c.description.empty()) os << " -- " << c.description;
            os << "\n";
        }
    }
    return os.str();
}
