#include "table_writer.hh"

#include <xpq/exception.hh>

#include <algorithm>

namespace xpq::cli {

output_format parse_output_format(const std::string& name) {
    if (name == "table") {
        return output_format::table;
    } else if (name == "csv") {
        return output_format::csv;
    } else if (name == "vertical") {
        return output_format::vertical;
    }
    throw invalid_argument(seastar::format("unknown output format {} (expected table, csv or vertical)", name));
}

void table_writer::add_row(std::vector<std::string> cells) {
    if (cells.size() != _header.size()) {
        throw invalid_argument(seastar::format("row has {} cells, the header has {}", cells.size(), _header.size()));
    }
    _rows.push_back(std::move(cells));
}

void table_writer::write(std::ostream& out, output_format format) const {
    switch (format) {
    case output_format::table: write_table(out); break;
    case output_format::csv: write_csv(out); break;
    case output_format::vertical: write_vertical(out); break;
    }
}

// Columns are separated by two spaces. The last column is not padded.
void table_writer::write_table(std::ostream& out) const {
    std::vector<size_t> widths(_header.size());
    for (size_t i = 0; i < _header.size(); ++i) {
        widths[i] = _header[i].size();
        for (const auto& row : _rows) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    auto write_line = [&] (const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            out << cells[i];
            if (i + 1 < cells.size()) {
                out << std::string(widths[i] - cells[i].size() + 2, ' ');
            }
        }
        out << '\n';
    };
    write_line(_header);
    for (const auto& row : _rows) {
        write_line(row);
    }
}

namespace {

void write_csv_cell(std::ostream& out, const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        out << cell;
        return;
    }
    out << '"';
    for (char c : cell) {
        if (c == '"') {
            out << '"';
        }
        out << c;
    }
    out << '"';
}

} // namespace

void table_writer::write_csv(std::ostream& out) const {
    auto write_line = [&] (const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i > 0) {
                out << ',';
            }
            write_csv_cell(out, cells[i]);
        }
        out << "\r\n";
    };
    write_line(_header);
    for (const auto& row : _rows) {
        write_line(row);
    }
}

void table_writer::write_vertical(std::ostream& out) const {
    size_t width = 0;
    for (const std::string& label : _header) {
        width = std::max(width, label.size());
    }
    for (const auto& row : _rows) {
        out << '\n';
        for (size_t i = 0; i < row.size(); ++i) {
            out << _header[i] << ':' << std::string(width - _header[i].size() + 2, ' ') << row[i] << '\n';
        }
    }
}

} // namespace xpq::cli
