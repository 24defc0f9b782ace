#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Error kinds raised by the unit conversion engine
 */
enum class UnitsErrorKind {
    DIVISION_ERROR = 0,   ///< Degenerate linear inversion (zero gradient)
    NOT_INVERTIBLE,       ///< Inversion of an unsupported polynomial degree
    DOMAIN_ERROR,         ///< Invalid conversion data (curve, limits, energy)
    MALFORMED_ROW,        ///< Table row missing or contradicting required data
    UNKNOWN_UNITS         ///< Unit system selector not understood
};

inline const char* to_string(UnitsErrorKind kind) {
    switch (kind) {
        case UnitsErrorKind::DIVISION_ERROR: return "DIVISION_ERROR";
        case UnitsErrorKind::NOT_INVERTIBLE: return "NOT_INVERTIBLE";
        case UnitsErrorKind::DOMAIN_ERROR:   return "DOMAIN_ERROR";
        case UnitsErrorKind::MALFORMED_ROW:  return "MALFORMED_ROW";
        case UnitsErrorKind::UNKNOWN_UNITS:  return "UNKNOWN_UNITS";
    }
    return "UNKNOWN";
}

/**
 * @brief Exception raised by conversion records and the registry
 */
class UnitsError : public std::runtime_error {
public:
    UnitsError(UnitsErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind)
        , message_(message) {}

    UnitsErrorKind kind() const { return kind_; }

    /**
     * @brief Message without the kind prefix
     */
    const std::string& message() const { return message_; }

private:
    UnitsErrorKind kind_;
    std::string message_;
};

/**
 * @brief Registry construction failure identifying the offending table row
 *
 * Any of element_id / field / conversion_id may be unknown for the row that
 * failed (e.g. a data row that no units row references); unknown ids are -1.
 */
class RegistryBuildError : public UnitsError {
public:
    RegistryBuildError(UnitsErrorKind kind, int element_id, const std::string& field,
                       int conversion_id, const std::string& reason)
        : UnitsError(kind, describe(element_id, field, conversion_id, reason))
        , element_id_(element_id)
        , field_(field)
        , conversion_id_(conversion_id) {}

    int element_id() const { return element_id_; }
    const std::string& field() const { return field_; }
    int conversion_id() const { return conversion_id_; }

private:
    int element_id_;
    std::string field_;
    int conversion_id_;

    static std::string describe(int element_id, const std::string& field,
                                int conversion_id, const std::string& reason) {
        std::string where;
        if (element_id >= 0) where += "element " + std::to_string(element_id) + " ";
        if (!field.empty()) where += "field '" + field + "' ";
        if (conversion_id >= 0) where += "conversion " + std::to_string(conversion_id) + " ";
        if (where.empty()) where = "registry ";
        return where + "- " + reason;
    }
};

/**
 * @brief Field access error kinds
 */
enum class AccessErrorKind {
    FIELD_ERROR = 0,       ///< No device bound to the (element, field) pair
    HANDLE_ERROR,          ///< Device has no point for the requested handle
    CONTROL_SYSTEM_ERROR,  ///< Client failed to read or write a point
    READ_ONLY              ///< Point cannot be written
};

inline const char* to_string(AccessErrorKind kind) {
    switch (kind) {
        case AccessErrorKind::FIELD_ERROR:          return "FIELD_ERROR";
        case AccessErrorKind::HANDLE_ERROR:         return "HANDLE_ERROR";
        case AccessErrorKind::CONTROL_SYSTEM_ERROR: return "CONTROL_SYSTEM_ERROR";
        case AccessErrorKind::READ_ONLY:            return "READ_ONLY";
    }
    return "UNKNOWN";
}

class AccessError : public std::runtime_error {
public:
    AccessError(AccessErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind)
        , message_(message) {}

    AccessErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

private:
    AccessErrorKind kind_;
    std::string message_;
};

/**
 * @brief CSV table read/parse failure
 */
class TableError : public std::runtime_error {
public:
    TableError(const std::string& file, std::size_t line, const std::string& reason)
        : std::runtime_error(file + (line > 0 ? ":" + std::to_string(line) : std::string()) +
                             ": " + reason)
        , file_(file)
        , line_(line) {}

    const std::string& file() const { return file_; }
    std::size_t line() const { return line_; }

private:
    std::string file_;
    std::size_t line_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
