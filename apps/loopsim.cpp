#include <loopsim/core/error.hpp>
#include <loopsim/core/scheduler.hpp>
#include <loopsim/core/types.hpp>

#include <loopsim/io/error.hpp>
#include <loopsim/io/metrics.hpp>
#include <loopsim/io/scenario_injection.hpp>
#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/trace_export.hpp>
#include <loopsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = loopsim::core;
namespace io = loopsim::io;

struct Config {
    std::string scenario_file;
    std::string output_file{"-"};
    std::string format{"json"};
    std::optional<std::size_t> capacity;
    std::optional<std::size_t> guard;
    int64_t until{-1};  // -1 = run to completion
    bool metrics{false};
    bool labels{false};
    bool verbose{false};
};

// Fans every trace record out to the output writer and the metrics buffer.
class TeeTraceWriter : public core::TraceWriter {
public:
    TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second)
        : first_(first)
        , second_(second) {}

    void begin(core::TimePoint time) override {
        first_.begin(time);
        second_.begin(time);
    }

    void type(std::string_view name) override {
        first_.type(name);
        second_.type(name);
    }

    void field(std::string_view key, uint64_t value) override {
        first_.field(key, value);
        second_.field(key, value);
    }

    void field(std::string_view key, std::string_view value) override {
        first_.field(key, value);
        second_.field(key, value);
    }

    void end() override {
        first_.end();
        second_.end();
    }

private:
    core::TraceWriter& first_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TraceWriter& second_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("loopsim", "Deterministic event-loop simulator");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("capacity", "Worker pool capacity (overrides the scenario)", cxxopts::value<std::size_t>())
        ("guard", "Livelock guard (overrides the scenario)", cxxopts::value<std::size_t>())
        ("until", "Stop at this tick (default: run to completion)", cxxopts::value<int64_t>()->default_value("-1"))
        ("metrics", "Print metrics to stderr")
        ("labels", "Print execution order by label to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("capacity") != 0U) {
        config.capacity = result["capacity"].as<std::size_t>();
    }
    if (result.count("guard") != 0U) {
        config.guard = result["guard"].as<std::size_t>();
    }
    config.until = result["until"].as<int64_t>();
    config.metrics = result.count("metrics") != 0U;
    config.labels = result.count("labels") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }

    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load scenario; command-line options win over the file
        auto scenario = io::load_scenario(config.scenario_file);
        if (config.capacity) {
            scenario.options.worker_pool_capacity = config.capacity;
        }
        if (config.guard) {
            scenario.options.livelock_guard = config.guard;
        }
        if (config.until < 0 && io::has_unbounded_interval(scenario)) {
            throw io::LoaderError("interval without 'repeat' requires --until",
                                  config.scenario_file);
        }

        // 2. Create scheduler and inject submissions
        core::Scheduler scheduler;
        io::LabelLog labels;
        io::inject_scenario(scheduler, scenario, &labels);

        // 3. Setup trace writer
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.format != "null" && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        std::unique_ptr<core::TraceWriter> writer;
        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            bool color = config.output_file == "-";
            writer = std::make_unique<io::TextualTraceWriter>(*out, color);
        } else {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        }

        io::MemoryTraceWriter memory;
        TeeTraceWriter tee(*writer, memory);
        if (config.metrics) {
            scheduler.set_trace_writer(&tee);
        } else {
            scheduler.set_trace_writer(writer.get());
        }

        if (config.verbose) {
            std::cerr << "Starting run..." << std::endl;
        }

        // 4. Run
        int status = 0;
        try {
            if (config.until >= 0) {
                scheduler.run(core::time_from_ticks(config.until));
            } else {
                scheduler.run();
            }
        } catch (const core::LivelockError& e) {
            std::cerr << "Livelock: " << e.what() << " (" << e.partial_trace().size()
                      << " callbacks executed)" << std::endl;
            status = 2;
        }

        // 5. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.labels) {
            io::write_label_log(labels, std::cerr);
        }
        if (config.metrics) {
            io::write_metrics_summary(io::compute_metrics(memory.records()), std::cerr);
        }

        if (config.verbose) {
            std::cerr << "Run complete at tick " << core::time_to_ticks(scheduler.time())
                      << ", " << scheduler.executed_count() << " callbacks executed, "
                      << scheduler.uncaught_count() << " uncaught" << std::endl;
        }

        return status;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
