#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace xpq::cli {

enum class output_format { table, csv, vertical };

// Throws invalid_argument for anything but "table", "csv" or "vertical".
output_format parse_output_format(const std::string& name);

// Collects a header and rows of text cells, then renders them at once.
class table_writer {
    std::vector<std::string> _header;
    std::vector<std::vector<std::string>> _rows;
private:
    void write_table(std::ostream& out) const;
    void write_csv(std::ostream& out) const;
    void write_vertical(std::ostream& out) const;
public:
    explicit table_writer(std::vector<std::string> header) : _header{std::move(header)} {}
    void add_row(std::vector<std::string> cells);
    size_t size() const { return _rows.size(); }
    void write(std::ostream& out, output_format format) const;
};

} // namespace xpq::cli
