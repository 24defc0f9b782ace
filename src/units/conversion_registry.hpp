#pragma once
#include "../core/units_error.hpp"
#include "conversion_record.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * @brief One row of the units table
 *
 * kind is kept as written ("null", "poly" or "pchip") so that an unknown
 * kind can be reported against its row.
 */
struct UnitsRow {
    int element_id{0};
    std::string field;
    std::string kind;
    std::optional<int> conversion_id;   ///< Required unless kind is "null"
    std::string phys_units;
    std::string eng_units;
    std::optional<double> lower_limit;
    std::optional<double> upper_limit;
};

/**
 * @brief One polynomial coefficient; value multiplies x^coefficient_index
 */
struct PolyRow {
    int conversion_id{0};
    int coefficient_index{0};
    double value{0.0};
};

/**
 * @brief One calibration sample; rows of a conversion id form its curve in order
 */
struct PchipRow {
    int conversion_id{0};
    double eng{0.0};
    double phys{0.0};
};

/**
 * @brief Rigidity to apply to an element's non-null conversions, if any
 */
using RigidityPolicy = std::function<std::optional<double>(int element_id)>;

/**
 * @brief Immutable index from (element id, field) to its conversion
 *
 * Built once with build(), which validates every row and throws
 * RegistryBuildError on the first malformed one; a partially built registry
 * is never returned. Lookups of unknown keys resolve to an identity record.
 * Records with identical conversion data are shared between elements.
 *
 * The registry is published as a shared pointer to const; concurrent
 * resolve() calls need no locking.
 */
class ConversionRegistry {
public:
    using Key = std::pair<int, std::string>;
    using RecordPtr = std::shared_ptr<const ConversionRecord>;

    /**
     * @brief Build and validate all records
     * @param units Units table rows
     * @param poly Polynomial coefficient rows
     * @param pchip Calibration sample rows
     * @param rigidity Optional policy for rigidity-scaled elements
     * @throws RegistryBuildError naming the offending element/field/conversion
     */
    static std::shared_ptr<const ConversionRegistry> build(
            const std::vector<UnitsRow>& units,
            const std::vector<PolyRow>& poly,
            const std::vector<PchipRow>& pchip,
            const RigidityPolicy& rigidity = nullptr) {
        std::shared_ptr<ConversionRegistry> registry(new ConversionRegistry());

        auto polynomials = collect_polynomials(poly);
        auto curves = collect_curves(pchip);

        std::map<RecordKey, RecordPtr> shared;
        for (const auto& row : units) {
            Key key(row.element_id, row.field);
            int uc_id = row.conversion_id.value_or(-1);

            if (row.field.empty()) {
                throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id, row.field,
                                         uc_id, "missing field name");
            }
            if (row.element_id < 0) {
                throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id, row.field,
                                         uc_id, "negative element id");
            }
            if (registry->entries_.count(key)) {
                throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id, row.field,
                                         uc_id, "duplicate units row");
            }

            ConversionKind kind = parse_kind(row);
            Limits limits{row.lower_limit, row.upper_limit};
            std::optional<double> scale;
            if (kind != ConversionKind::NONE) {
                if (!row.conversion_id) {
                    throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id, row.field,
                                             -1, std::string("missing conversion id for ") +
                                             to_string(kind) + " conversion");
                }
                // Checked before the sharing lookup; NaN cannot be ordered as a key
                if (!limits.finite()) {
                    throw RegistryBuildError(UnitsErrorKind::DOMAIN_ERROR, row.element_id, row.field,
                                             uc_id, "clamp limits must be finite");
                }
                if (rigidity) scale = rigidity(row.element_id);
            } else {
                // Identity conversions carry no data, limits or scaling
                limits = Limits{};
                uc_id = -1;
            }

            RecordKey rk(static_cast<int>(kind), uc_id, row.eng_units, row.phys_units,
                         limits.lower, limits.upper, scale);
            auto found = shared.find(rk);
            if (found != shared.end()) {
                registry->entries_.emplace(std::move(key), found->second);
                continue;
            }

            RecordPtr record;
            try {
                switch (kind) {
                    case ConversionKind::NONE:
                        record = std::make_shared<const ConversionRecord>(
                            ConversionRecord::identity(row.eng_units, row.phys_units));
                        break;
                    case ConversionKind::POLYNOMIAL: {
                        auto it = polynomials.find(uc_id);
                        if (it == polynomials.end()) {
                            throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id,
                                                     row.field, uc_id, "no polynomial data");
                        }
                        record = std::make_shared<const ConversionRecord>(
                            ConversionRecord::polynomial(it->second, row.eng_units, row.phys_units,
                                                         limits, scale));
                        break;
                    }
                    case ConversionKind::PIECEWISE: {
                        auto it = curves.find(uc_id);
                        if (it == curves.end()) {
                            throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id,
                                                     row.field, uc_id, "no calibration data");
                        }
                        record = std::make_shared<const ConversionRecord>(
                            ConversionRecord::piecewise(it->second, row.eng_units, row.phys_units,
                                                        limits, scale));
                        break;
                    }
                }
            } catch (const RegistryBuildError&) {
                throw;
            } catch (const UnitsError& e) {
                throw RegistryBuildError(e.kind(), row.element_id, row.field, uc_id, e.message());
            }

            shared.emplace(std::move(rk), record);
            registry->entries_.emplace(std::move(key), std::move(record));
        }

        registry->distinct_ = shared.size();
        return registry;
    }

    /**
     * @brief Conversion governing a field; identity when none was declared
     */
    const ConversionRecord& resolve(int element_id, const std::string& field) const {
        auto it = entries_.find(Key(element_id, field));
        if (it == entries_.end()) return null_record();
        return *it->second;
    }

    /**
     * @brief Shared handle to a declared record, nullptr when absent
     */
    RecordPtr find(int element_id, const std::string& field) const {
        auto it = entries_.find(Key(element_id, field));
        return it == entries_.end() ? nullptr : it->second;
    }

    bool contains(int element_id, const std::string& field) const {
        return entries_.count(Key(element_id, field)) > 0;
    }

    /**
     * @brief Fields with a declared conversion on an element, sorted
     */
    std::vector<std::string> fields(int element_id) const {
        std::vector<std::string> out;
        for (auto it = entries_.lower_bound(Key(element_id, std::string()));
             it != entries_.end() && it->first.first == element_id; ++it) {
            out.push_back(it->first.second);
        }
        return out;
    }

    std::size_t size() const { return entries_.size(); }

    /**
     * @brief Number of distinct records after sharing
     */
    std::size_t distinct_records() const { return distinct_; }

    const std::map<Key, RecordPtr>& entries() const { return entries_; }

    static const ConversionRecord& null_record() {
        static const ConversionRecord record = ConversionRecord::identity();
        return record;
    }

private:
    using RecordKey = std::tuple<int, int, std::string, std::string,
                                 std::optional<double>, std::optional<double>, std::optional<double>>;

    std::map<Key, RecordPtr> entries_;
    std::size_t distinct_{0};

    ConversionRegistry() = default;

    static ConversionKind parse_kind(const UnitsRow& row) {
        if (row.kind == "null") return ConversionKind::NONE;
        if (row.kind == "poly") return ConversionKind::POLYNOMIAL;
        if (row.kind == "pchip") return ConversionKind::PIECEWISE;
        throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, row.element_id, row.field,
                                 row.conversion_id.value_or(-1),
                                 "unknown conversion kind '" + row.kind + "'");
    }

    static std::map<int, std::vector<double>> collect_polynomials(const std::vector<PolyRow>& rows) {
        std::map<int, std::map<int, double>> by_id;
        for (const auto& row : rows) {
            if (row.coefficient_index < 0) {
                throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, -1, "", row.conversion_id,
                                         "negative coefficient index " +
                                         std::to_string(row.coefficient_index));
            }
            if (!by_id[row.conversion_id].emplace(row.coefficient_index, row.value).second) {
                throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, -1, "", row.conversion_id,
                                         "duplicate coefficient index " +
                                         std::to_string(row.coefficient_index));
            }
        }

        std::map<int, std::vector<double>> out;
        for (const auto& [id, coefficients] : by_id) {
            std::vector<double> dense;
            int expected = 0;
            for (const auto& [index, value] : coefficients) {
                if (index != expected) {
                    throw RegistryBuildError(UnitsErrorKind::MALFORMED_ROW, -1, "", id,
                                             "coefficient index gap: expected " +
                                             std::to_string(expected) + ", found " +
                                             std::to_string(index));
                }
                dense.push_back(value);
                ++expected;
            }
            out.emplace(id, std::move(dense));
        }
        return out;
    }

    static std::map<int, CalibrationCurve> collect_curves(const std::vector<PchipRow>& rows) {
        std::map<int, std::pair<std::vector<double>, std::vector<double>>> by_id;
        for (const auto& row : rows) {
            auto& samples = by_id[row.conversion_id];
            samples.first.push_back(row.eng);
            samples.second.push_back(row.phys);
        }

        std::map<int, CalibrationCurve> out;
        for (auto& [id, samples] : by_id) {
            try {
                out.emplace(id, CalibrationCurve(std::move(samples.first), std::move(samples.second)));
            } catch (const UnitsError& e) {
                throw RegistryBuildError(e.kind(), -1, "", id, e.message());
            }
        }
        return out;
    }
};
