#include "commands.hh"

#include <xpq/exception.hh>

#include <seastar/core/app-template.hh>
#include <seastar/core/thread.hh>

#include <iostream>
#include <sstream>

using namespace seastar;

int main(int argc, char** argv) {
    app_template::config cfg;
    cfg.name = "xpq";
    cfg.description = "Inspect parquet files.\n\n"
            "Usage: xpq <schema|count|read|sample|frequency> <file or directory> [options]";
    app_template app{std::move(cfg)};
    namespace bpo = boost::program_options;
    app.add_options()
        ("columns", bpo::value<std::vector<std::string>>()->multitoken(),
                "top-level fields to show (read, sample) or leaf paths to count (frequency)")
        ("limit", bpo::value<int64_t>(),
                "rows to show (read: 300), rows to draw (sample: 100) or rows to scan (frequency: all)")
        ("seed", bpo::value<uint64_t>(), "seed of the sampler (sample: random)")
        ("format", bpo::value<std::string>()->default_value("table"), "output format: table, csv or vertical");
    app.add_positional_options({
        {"command", bpo::value<std::string>(), "schema, count, read, sample or frequency", 1},
        {"path", bpo::value<std::string>(), "parquet file or directory of parquet files", 1},
    });

    return app.run(argc, argv, [&app] {
        return async([&app] {
            auto& args = app.configuration();
            try {
                xpq::cli::options opts;
                if (!args.count("command") || !args.count("path")) {
                    throw xpq::invalid_argument("expected a command and a path, see --help");
                }
                opts.command = args["command"].as<std::string>();
                opts.path = args["path"].as<std::string>();
                if (args.count("columns")) {
                    opts.columns = args["columns"].as<std::vector<std::string>>();
                }
                if (args.count("limit")) {
                    opts.limit = args["limit"].as<int64_t>();
                }
                if (args.count("seed")) {
                    opts.seed = args["seed"].as<uint64_t>();
                }
                opts.format = xpq::cli::parse_output_format(args["format"].as<std::string>());

                std::ostringstream out;
                xpq::cli::run_command(opts, out);
                std::cout << out.str() << std::flush;
                return 0;
            } catch (const std::exception& e) {
                std::cerr << "error: " << e.what() << std::endl;
                return 1;
            }
        });
    });
}
