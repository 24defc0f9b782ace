#pragma once
#include "../core/units_error.hpp"
#include "element_category.hpp"
#include <string>
#include <vector>

/**
 * @brief One row of the element table
 */
struct ElementInfo {
    int id{0};                 ///< 1-based position in the ring
    std::string name;          ///< May be empty
    std::string type;          ///< Type name as written in the table
    ElementCategory category{ElementCategory::INSTRUMENT};
    double length{0.0};        ///< Length in metres
    double s{0.0};             ///< Start position in metres
};

/**
 * @brief Ordered elements of a lattice
 *
 * Element ids are 1-based positions; id 0 designates the lattice itself and
 * is never stored here.
 */
class ElementTable {
public:
    /**
     * @brief Append an element, assigning the next id and its s position
     * @return Assigned element id
     */
    int add(const std::string& name, const std::string& type, double length) {
        if (length < 0.0) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "element '" + name + "' has negative length");
        }
        ElementInfo e;
        e.id = static_cast<int>(elements_.size()) + 1;
        e.name = name;
        e.type = type;
        e.category = parse_category(type);
        e.length = length;
        e.s = elements_.empty() ? 0.0 : elements_.back().s + elements_.back().length;
        elements_.push_back(e);
        return e.id;
    }

    bool contains(int id) const {
        return id >= 1 && id <= static_cast<int>(elements_.size());
    }

    const ElementInfo& at(int id) const {
        if (!contains(id)) {
            throw AccessError(AccessErrorKind::FIELD_ERROR,
                              "no element with id " + std::to_string(id));
        }
        return elements_[static_cast<std::size_t>(id - 1)];
    }

    /**
     * @brief Ids of all elements in a category, in ring order
     */
    std::vector<int> ids_of(ElementCategory category) const {
        std::vector<int> ids;
        for (const auto& e : elements_) {
            if (e.category == category) ids.push_back(e.id);
        }
        return ids;
    }

    std::size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }
    const std::vector<ElementInfo>& elements() const { return elements_; }

private:
    std::vector<ElementInfo> elements_;
};
