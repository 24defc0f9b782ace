#pragma once
#include "../core/units_error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Header-addressed CSV table
 *
 * The first non-empty line names the columns; fields may be double-quoted
 * (with "" as an escaped quote) and surrounding whitespace is trimmed.
 * Blank lines and lines starting with '#' are skipped.
 */
class CsvTable {
public:
    /**
     * @brief View of one data row
     */
    class Row {
    public:
        Row(const CsvTable& table, std::size_t index) : table_(table), index_(index) {}

        std::size_t line() const { return table_.lines_[index_]; }

        const std::string& get(const std::string& column) const {
            return table_.rows_[index_][table_.column(column)];
        }

        bool empty(const std::string& column) const { return get(column).empty(); }

        int get_int(const std::string& column) const {
            const std::string& s = require(column);
            char* end = nullptr;
            errno = 0;
            long v = std::strtol(s.c_str(), &end, 10);
            if (errno != 0 || end == s.c_str() || *end != '\0' ||
                v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
                fail(column, "'" + s + "' is not an integer");
            }
            return static_cast<int>(v);
        }

        double get_double(const std::string& column) const {
            const std::string& s = require(column);
            char* end = nullptr;
            errno = 0;
            double v = std::strtod(s.c_str(), &end);
            if (errno == ERANGE || end == s.c_str() || *end != '\0') {
                fail(column, "'" + s + "' is not a number");
            }
            return v;
        }

        std::optional<int> get_optional_int(const std::string& column) const {
            if (empty(column)) return std::nullopt;
            return get_int(column);
        }

        std::optional<double> get_optional_double(const std::string& column) const {
            if (empty(column)) return std::nullopt;
            return get_double(column);
        }

    private:
        const CsvTable& table_;
        std::size_t index_;

        const std::string& require(const std::string& column) const {
            const std::string& s = get(column);
            if (s.empty()) fail(column, "value is empty");
            return s;
        }

        [[noreturn]] void fail(const std::string& column, const std::string& reason) const {
            throw TableError(table_.path_, line(), "column '" + column + "': " + reason);
        }
    };

    /**
     * @brief Read a whole file
     * @throws TableError if the file cannot be opened or a row is ragged
     */
    static CsvTable read(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw TableError(path, 0, "cannot open file");

        CsvTable table;
        table.path_ = path;
        std::string line;
        std::size_t line_no = 0;
        bool have_header = false;
        while (std::getline(in, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            auto fields = split(line, path, line_no);
            if (!have_header) {
                table.header_ = std::move(fields);
                have_header = true;
                continue;
            }
            if (fields.size() != table.header_.size()) {
                throw TableError(path, line_no,
                                 "expected " + std::to_string(table.header_.size()) +
                                 " fields, found " + std::to_string(fields.size()));
            }
            table.rows_.push_back(std::move(fields));
            table.lines_.push_back(line_no);
        }
        if (!have_header) throw TableError(path, 0, "missing header row");
        return table;
    }

    std::size_t size() const { return rows_.size(); }
    Row row(std::size_t index) const { return Row(*this, index); }
    const std::vector<std::string>& header() const { return header_; }
    const std::string& path() const { return path_; }

    bool has_column(const std::string& name) const {
        for (const auto& h : header_) {
            if (h == name) return true;
        }
        return false;
    }

    /**
     * @brief Fail unless every named column is present
     */
    void require_columns(const std::vector<std::string>& names) const {
        for (const auto& name : names) {
            if (!has_column(name)) throw TableError(path_, 0, "missing column '" + name + "'");
        }
    }

private:
    std::string path_;
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<std::size_t> lines_;

    std::size_t column(const std::string& name) const {
        for (std::size_t i = 0; i < header_.size(); ++i) {
            if (header_[i] == name) return i;
        }
        throw TableError(path_, 0, "missing column '" + name + "'");
    }

    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    static std::vector<std::string> split(const std::string& line, const std::string& path,
                                          std::size_t line_no) {
        std::vector<std::string> out;
        std::string field;
        bool quoted = false;
        bool was_quoted = false;
        for (std::size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quoted) {
                if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else if (c == '"') {
                    quoted = false;
                } else {
                    field += c;
                }
            } else if (c == '"' && trim(field).empty()) {
                field.clear();
                quoted = true;
                was_quoted = true;
            } else if (c == ',') {
                out.push_back(was_quoted ? field : trim(field));
                field.clear();
                was_quoted = false;
            } else {
                field += c;
            }
        }
        if (quoted) throw TableError(path, line_no, "unterminated quote");
        out.push_back(was_quoted ? field : trim(field));
        return out;
    }
};
