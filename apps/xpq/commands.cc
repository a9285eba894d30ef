#include "commands.hh"

#include <xpq/dataset.hh>
#include <xpq/exception.hh>
#include <xpq/frequency.hh>
#include <xpq/sampler.hh>
#include <xpq/schema_printer.hh>

#include <seastar/util/log.hh>

#include <random>

namespace xpq::cli {

static seastar::logger xpq_logger("xpq");

namespace {

std::vector<std::string> field_names(const schema::schema& schema, const std::vector<size_t>& selected) {
    std::vector<std::string> names;
    names.reserve(selected.size());
    for (size_t i : selected) {
        names.push_back(schema::name(schema.fields[i]));
    }
    return names;
}

// Runs func over a row stream of ds and closes the stream whether or not func throws.
template <typename Func>
auto with_rows(dataset& ds, std::vector<size_t> selected, Func func) {
    row_stream rows{ds, std::move(selected)};
    try {
        auto result = func(rows);
        rows.close();
        return result;
    } catch (...) {
        rows.close();
        throw;
    }
}

void print_schema(dataset& ds, const options& opts, std::ostream& out) {
    schema::print_schema(ds.raw_schema(), out);
}

void count(dataset& ds, const options& opts, std::ostream& out) {
    table_writer table{{"count"}};
    table.add_row({std::to_string(ds.count_rows())});
    table.write(out, opts.format);
}

void read(dataset& ds, const options& opts, std::ostream& out) {
    int64_t limit = opts.limit.value_or(default_read_limit);
    if (limit < 0) {
        throw invalid_argument(seastar::format("--limit must not be negative, got {}", limit));
    }
    std::vector<size_t> selected = select_fields(ds.schema(), opts.columns);
    table_writer table{field_names(ds.schema(), selected)};
    with_rows(ds, selected, [&table, limit] (row_stream& rows) {
        while (static_cast<int64_t>(table.size()) < limit) {
            auto row = rows.read_one();
            if (!row) {
                break;
            }
            table.add_row(record::format_row(*row));
        }
        return table.size();
    });
    table.write(out, opts.format);
}

void sample(dataset& ds, const options& opts, std::ostream& out) {
    int64_t k = opts.limit.value_or(default_sample_size);
    uint64_t seed;
    if (opts.seed) {
        seed = *opts.seed;
    } else {
        std::random_device device;
        seed = (uint64_t(device()) << 32) | device();
        xpq_logger.debug("sampling with seed {}", seed);
    }
    std::vector<size_t> selected = select_fields(ds.schema(), opts.columns);
    table_writer table{field_names(ds.schema(), selected)};
    std::vector<record::row> sampled = with_rows(ds, selected, [k, seed] (row_stream& rows) {
        return xpq::sample(rows, k, seed);
    });
    for (const record::row& r : sampled) {
        table.add_row(record::format_row(r));
    }
    table.write(out, opts.format);
}

void frequency(dataset& ds, const options& opts, std::ostream& out) {
    std::optional<uint64_t> limit;
    if (opts.limit) {
        if (*opts.limit < 0) {
            throw invalid_argument(seastar::format("--limit must not be negative, got {}", *opts.limit));
        }
        limit = *opts.limit;
    }
    frequency_counter counter{ds.schema(), opts.columns};
    std::vector<column_frequencies> results = with_rows(ds, counter.required_fields(ds.schema()),
            [&counter, limit] (row_stream& rows) {
        return count_frequencies(rows, counter, limit);
    });
    table_writer table{{"FIELD", "VALUE", "COUNT"}};
    for (const column_frequencies& column : results) {
        for (const auto& [key, n] : column.counts) {
            table.add_row({column.column, key, std::to_string(n)});
        }
    }
    table.write(out, opts.format);
}

using command_function = void (*)(dataset&, const options&, std::ostream&);

command_function find_command(const std::string& name) {
    if (name == "schema") {
        return print_schema;
    } else if (name == "count") {
        return count;
    } else if (name == "read") {
        return read;
    } else if (name == "sample") {
        return sample;
    } else if (name == "frequency") {
        return frequency;
    }
    throw invalid_argument(seastar::format(
            "unknown command {} (expected schema, count, read, sample or frequency)", name));
}

} // namespace

void run_command(const options& opts, std::ostream& out) {
    command_function command = find_command(opts.command);
    dataset ds = dataset::open(opts.path);
    xpq_logger.debug("{}: {} on {} files", opts.command, opts.path, ds.paths().size());
    try {
        command(ds, opts, out);
    } catch (...) {
        ds.close();
        throw;
    }
    ds.close();
}

} // namespace xpq::cli
