#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "dualform/DotPath.hpp"
#include "dualform/Loader.hpp"
#include "dualform/Normalize.hpp"

using namespace dualform;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("dualform-cli", "Inspect and normalize fields given as a string or as a map");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "Path to JSON/TOML document ('-' for JSON on stdin)", cxxopts::value<std::string>())
            ("indent", "Indentation of printed JSON", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write the normalized document to FILE instead of stdout", cxxopts::value<std::string>())
            ("v,verbose", "Report the shape of each field on stderr")
            ("h,help", "Show help");

        // Command + sub-options captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: shape PATH... | normalize PATH... [-o FILE] | dump\n";
            return 0;
        }

        if (!result.count("file")) {
            std::cerr << "Error: --file must be provided\n";
            return 1;
        }
        const bool verbose = result.count("verbose") > 0;
        const int indent = result["indent"].as<int>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        Value doc = load_document_file(result["file"].as<std::string>());

        // SHAPE
        if (cmd == "shape") {
            if (cmdv.size() < 2) {
                std::cerr << "Error: insufficient arguments for command 'shape'\n";
                return 1;
            }
            for (size_t i = 1; i < cmdv.size(); ++i) {
                if (!contains_dot(doc, cmdv[i])) {
                    std::cout << cmdv[i] << ": missing\n";
                    continue;
                }
                std::cout << cmdv[i] << ": " << shape_name(shape_at(doc, cmdv[i])) << "\n";
            }
            return 0;
        }

        // NORMALIZE
        if (cmd == "normalize") {
            const std::string out = result.count("out") ? result["out"].as<std::string>() : "";
            const std::vector<std::string> paths(cmdv.begin() + 1, cmdv.end());
            if (paths.empty()) {
                std::cerr << "Error: insufficient arguments for command 'normalize'\n";
                return 1;
            }
            for (const auto& path : paths) {
                Shape before = normalize_field(doc, path);
                if (verbose) {
                    std::cerr << path << ": " << shape_name(before)
                              << (before == Shape::string ? " -> map" : "") << "\n";
                }
            }

            const std::string text = doc.dump(indent);
            if (!out.empty()) {
                std::ofstream ofs(out);
                if (!ofs) { std::cerr << "Error: cannot write to " << out << "\n"; return 1; }
                ofs << text << "\n";
                std::cout << "Wrote " << paths.size() << " field(s) to " << out << "\n";
            } else {
                std::cout << text << "\n";
            }
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << doc.dump(indent) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
