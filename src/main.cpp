// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cxxopts.hpp>
#include <iostream>

#include "graphdelta/commands.hpp"
#include "graphdelta/version.hpp"

using namespace graphdelta;

void print_banner() {
    std::cout << "graphdelta - Program Graph Edit Distance v" << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "graphdelta", "Build CFG, DFG, call graph, PDG and CPG for Python code and measure "
                      "graph edit distance between two versions");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("verbose", "Print progress and fallback warnings");

    opts("before", "Source file before the change", cxxopts::value<std::string>());
    opts("after", "Source file after the change", cxxopts::value<std::string>());
    opts("k,kinds", "Kinds (comma-separated: cfg,dfg,callgraph,pdg,cpg,ast,tokens,complexity)",
         cxxopts::value<std::vector<std::string>>());
    opts("strategy", "GED strategy (hybrid, beam, astar)", cxxopts::value<std::string>());
    opts("beam-width", "Beam width for --strategy beam", cxxopts::value<int>());
    opts("max-iterations", "Iteration cap for --strategy astar", cxxopts::value<size_t>());
    opts("time-budget", "Wall-clock budget in seconds for --strategy hybrid",
         cxxopts::value<double>());
    opts("dfg", "DFG variant (basic, ssa)", cxxopts::value<std::string>());
    opts("json", "Print results as JSON");
    opts("config", "JSON config file (flags override it)", cxxopts::value<std::string>());

    opts("batch", "Compare every Python file under --before-dir and --after-dir");
    opts("before-dir", "Root directory before the change", cxxopts::value<std::string>());
    opts("after-dir", "Root directory after the change", cxxopts::value<std::string>());
    opts("j,jobs", "Number of threads for --batch (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("o,output", "Write the report or dump to this file",
         cxxopts::value<std::string>()->default_value(""));

    opts("dump",
         "Dump one kind (cfg, dfg, callgraph, pdg, cpg, ast, tokens, complexity) of --file as JSON",
         cxxopts::value<std::string>());
    opts("file", "Source file for --dump", cxxopts::value<std::string>());

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  graphdelta --before a.py --after b.py             All graph kinds"
                      << std::endl;
            std::cout << "  graphdelta --before a.py --after b.py -k cfg,dfg  Selected kinds"
                      << std::endl;
            std::cout << "  graphdelta --before a.py --after b.py --strategy astar --json"
                      << std::endl;
            std::cout << "  graphdelta --batch --before-dir old --after-dir new -j 8 -o out.json"
                      << std::endl;
            std::cout << "  graphdelta --dump cfg --file a.py                 Print the CFG"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "graphdelta v" << VERSION_STRING << std::endl;
            return 0;
        }

        bool verbose = result.count("verbose") > 0;
        std::string output_path = result["output"].as<std::string>();

        // Config file first, explicit flags on top
        CompareOptions compare;
        if (result.count("config")) {
            if (!load_config(result["config"].as<std::string>(), compare))
                return 1;
        }
        if (result.count("kinds"))
            compare.kinds = parse_kinds(result["kinds"].as<std::vector<std::string>>());
        if (result.count("strategy")) {
            std::string name = result["strategy"].as<std::string>();
            if (!ged_strategy_from_string(name, compare.ged.strategy)) {
                std::cerr << "Error: unknown strategy: " << name << std::endl;
                return 1;
            }
        }
        if (result.count("beam-width"))
            compare.ged.beam.beam_width = result["beam-width"].as<int>();
        if (result.count("max-iterations"))
            compare.ged.astar.max_iterations = result["max-iterations"].as<size_t>();
        if (result.count("time-budget"))
            compare.ged.hybrid.time_budget_seconds = result["time-budget"].as<double>();
        if (result.count("dfg")) {
            std::string name = result["dfg"].as<std::string>();
            if (!dfg_variant_from_string(name, compare.dfg_variant)) {
                std::cerr << "Error: unknown DFG variant: " << name << std::endl;
                return 1;
            }
        }
        compare.ged.hybrid.verbose = verbose;

        if (result.count("dump")) {
            std::string name = result["dump"].as<std::string>();
            GraphKind kind;
            if (!graph_kind_from_string(name, kind)) {
                std::cerr << "Error: unknown graph kind: " << name << std::endl;
                return 1;
            }
            if (!result.count("file")) {
                std::cerr << "Error: --dump requires --file" << std::endl;
                return 1;
            }
            return cmd_dump(kind, result["file"].as<std::string>(), compare.dfg_variant,
                            output_path);
        }

        if (result.count("batch")) {
            if (!result.count("before-dir") || !result.count("after-dir")) {
                std::cerr << "Error: --batch requires --before-dir and --after-dir" << std::endl;
                return 1;
            }
            BatchConfig config;
            config.before_dir = result["before-dir"].as<std::string>();
            config.after_dir = result["after-dir"].as<std::string>();
            config.num_threads = result["jobs"].as<unsigned int>();
            config.verbose = verbose;
            config.compare = compare;
            return cmd_batch(config, output_path);
        }

        if (result.count("before") || result.count("after")) {
            if (!result.count("before") || !result.count("after")) {
                std::cerr << "Error: --before and --after must be given together" << std::endl;
                return 1;
            }
            return cmd_compare(result["before"].as<std::string>(),
                               result["after"].as<std::string>(), compare,
                               result.count("json") > 0);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
