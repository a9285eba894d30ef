#pragma once

#include "table_writer.hh"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace xpq::cli {

struct options {
    std::string command;
    std::string path;
    std::vector<std::string> columns;
    std::optional<int64_t> limit;
    std::optional<uint64_t> seed;
    output_format format = output_format::table;
};

constexpr int64_t default_read_limit = 300;
constexpr int64_t default_sample_size = 100;

// Runs one of schema, count, read, sample or frequency and writes its output to out.
// Must be called from a seastar thread. Throws invalid_argument for an unknown command.
void run_command(const options& opts, std::ostream& out);

} // namespace xpq::cli
