#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

/**
 * @brief Closed set of element types found in a ring lattice
 *
 * Each category carries fixed metadata (default field names and whether its
 * conversions are scaled by beam rigidity), resolved once when the element
 * table is read.
 */
enum class ElementCategory {
    DRIFT = 0,
    BEND,
    QUADRUPOLE,
    SEXTUPOLE,
    MULTIPOLE,
    CORRECTOR_HORIZONTAL,
    CORRECTOR_VERTICAL,
    BPM,
    RF_CAVITY,
    INSTRUMENT      ///< Anything else (screens, monitors, markers)
};

/**
 * @brief Fixed metadata of a category
 */
struct CategoryInfo {
    ElementCategory category;
    const char* name;                  ///< Canonical type name in the element table
    std::vector<const char*> aliases;  ///< Other accepted spellings (lowercase)
    std::vector<const char*> fields;   ///< Fields an element of this type exposes
    bool rigidity_scaled;              ///< Magnet strengths normalised by rigidity
};

inline const std::vector<CategoryInfo>& category_table() {
    static const std::vector<CategoryInfo> table = {
        {ElementCategory::DRIFT,      "drift",      {"drif"},                 {},             false},
        {ElementCategory::BEND,       "bend",       {"dipole", "sbend", "rbend"}, {"b0"},     true},
        {ElementCategory::QUADRUPOLE, "quadrupole", {"quad"},                 {"b1"},         true},
        {ElementCategory::SEXTUPOLE,  "sextupole",  {"sext"},                 {"b2"},         true},
        {ElementCategory::MULTIPOLE,  "multipole",  {"octupole", "skew"},     {"a1", "b1"},   true},
        {ElementCategory::CORRECTOR_HORIZONTAL, "hstr", {"hcm", "hkick", "hcorrector"}, {"x_kick"}, true},
        {ElementCategory::CORRECTOR_VERTICAL,   "vstr", {"vcm", "vkick", "vcorrector"}, {"y_kick"}, true},
        {ElementCategory::BPM,        "bpm",        {"monitor"},              {"x", "y", "enabled"}, false},
        {ElementCategory::RF_CAVITY,  "rf",         {"rfcavity", "cavity"},   {"f", "voltage"}, false},
        {ElementCategory::INSTRUMENT, "instrument", {},                       {},             false},
    };
    return table;
}

inline const CategoryInfo& info(ElementCategory category) {
    for (const auto& entry : category_table()) {
        if (entry.category == category) return entry;
    }
    return category_table().back();
}

inline const char* to_string(ElementCategory category) {
    return info(category).name;
}

/**
 * @brief Map an element-table type name onto a category
 *
 * Matching is case-insensitive; unknown types become INSTRUMENT.
 */
inline ElementCategory parse_category(const std::string& type_name) {
    std::string lower = type_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : category_table()) {
        if (lower == entry.name) return entry.category;
        for (const char* alias : entry.aliases) {
            if (lower == alias) return entry.category;
        }
    }
    return ElementCategory::INSTRUMENT;
}

inline bool is_rigidity_scaled(ElementCategory category) {
    return info(category).rigidity_scaled;
}

/**
 * @brief Whether elements of a category expose a field
 */
inline bool exposes_field(ElementCategory category, const std::string& field) {
    for (const char* name : info(category).fields) {
        if (field == name) return true;
    }
    return false;
}
