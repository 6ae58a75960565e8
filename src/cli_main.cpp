#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "jsonops/Diff.hpp"
#include "jsonops/Errors.hpp"
#include "jsonops/Format.hpp"
#include "jsonops/Loader.hpp"
#include "jsonops/Merge.hpp"
#include "jsonops/PathExpr.hpp"
#include "jsonops/Settings.hpp"
#include "jsonops/Tool.hpp"
#include "jsonops/Util.hpp"

using namespace jsonops;

namespace {

// One line per change: "changed $.b: 2 -> 3"
void print_changes(const std::vector<ChangeRecord>& records) {
    for (const auto& rec : records) {
        std::cout << to_string(rec.kind) << " " << rec.path;
        switch (rec.kind) {
            case ChangeKind::Added:
                std::cout << ": " << format(*rec.new_value, 0);
                break;
            case ChangeKind::Removed:
                std::cout << ": " << format(*rec.old_value, 0);
                break;
            case ChangeKind::Changed:
            case ChangeKind::TypeChanged:
                std::cout << ": " << format(*rec.old_value, 0) << " -> " << format(*rec.new_value, 0);
                break;
        }
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("jsonops", "Extract, merge, diff and format JSON documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("i,indent", "Spaces per level, 0 to minify (0-8)", cxxopts::value<int>())
            ("sort-keys", "Sort object keys in output")
            ("json", "Print the tool response document instead of plain output")
            ("settings", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value(DEFAULT_ENV_PREFIX))
            ("overrides", "Comma-separated dot.key:JSON_value settings pairs", cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Report progress on stderr")
            ("h,help", "Show help");

        // Command + sub-arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: get FILE EXPR | exists FILE EXPR | merge BASE OVERRIDE [MORE...] | "
                         "diff FIRST SECOND | format FILE | settings\n"
                         "Use '-' as FILE to read standard input.\n";
            return 0;
        }

        const bool verbose = result.count("verbose") > 0;
        auto log = [&](const std::string& msg) {
            if (verbose) std::cerr << "[jsonops] " << msg << "\n";
        };

        // Settings: built-in -> file -> env -> overrides -> command line
        LoadOptions load;
        if (result.count("settings")) load.file_path = result["settings"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());

        Settings settings = Settings::load(load);
        if (load.file_path) log("loaded settings from " + *load.file_path);
        if (result.count("indent")) settings.indent = result["indent"].as<int>();
        if (result.count("sort-keys")) settings.sort_keys = true;
        if (settings.indent < 0 || settings.indent > MAX_INDENT) {
            std::cerr << "Error: indent must be 0-" << MAX_INDENT << "\n";
            return 1;
        }
        log("limits: " + std::to_string(settings.limits.max_input_bytes) + " bytes, depth " +
            std::to_string(settings.limits.max_depth));

        const bool as_json = result.count("json") > 0;
        auto emit = [&](const Value& response) {
            std::cout << format(response, settings.indent, settings.sort_keys) << "\n";
            return tool::is_error(response) ? 1 : 0;
        };

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        // Argument counts include the command itself
        auto expect_args = [&](size_t want) {
            if (cmdv.size() != want) {
                throw InvalidArgument("command '" + cmd + "' takes " + std::to_string(want - 1) +
                                      " argument(s), got " + std::to_string(cmdv.size() - 1));
            }
        };
        auto expect_at_least = [&](size_t want) {
            if (cmdv.size() < want) {
                throw InvalidArgument("insufficient arguments for command '" + cmd + "'");
            }
        };

        // GET
        if (cmd == "get") {
            expect_args(3);
            const std::string& file = cmdv[1];
            const std::string& expr = cmdv[2];
            if (as_json) {
                return emit(tool::transform(read_text_file(file), expr, settings.limits));
            }
            const Value doc = load_document_file(file, "data", settings.limits);
            log("resolving " + render_path(parse_path(expr)));
            std::cout << format(resolve(doc, expr), settings.indent, settings.sort_keys) << "\n";
            return 0;
        }

        // EXISTS
        if (cmd == "exists") {
            expect_args(3);
            const Value doc = load_document_file(cmdv[1], "data", settings.limits);
            const bool ok = contains_path(doc, cmdv[2]);
            std::cout << (ok ? "true" : "false") << "\n";
            return ok ? 0 : 1;
        }

        // MERGE
        if (cmd == "merge") {
            if (as_json) {
                expect_args(3);
                return emit(tool::merge(read_text_file(cmdv[1]), read_text_file(cmdv[2]),
                                        settings.limits));
            }
            expect_at_least(3);
            std::vector<Value> sources;
            for (size_t i = 1; i < cmdv.size(); ++i) {
                log("merging " + cmdv[i]);
                sources.push_back(load_document_file(cmdv[i], i == 1 ? "base" : "override",
                                                     settings.limits));
            }
            std::cout << format(deep_merge_all(sources), settings.indent, settings.sort_keys) << "\n";
            return 0;
        }

        // DIFF
        if (cmd == "diff") {
            expect_args(3);
            if (as_json) {
                Value response = tool::diff(read_text_file(cmdv[1]), read_text_file(cmdv[2]),
                                            settings.limits);
                const int rc = emit(response);
                return rc != 0 ? rc : (response["equal"].get<bool>() ? 0 : 1);
            }
            const Value first = load_document_file(cmdv[1], "first", settings.limits);
            const Value second = load_document_file(cmdv[2], "second", settings.limits);
            const auto records = diff(first, second);
            log(std::to_string(records.size()) + " difference(s)");
            print_changes(records);
            return records.empty() ? 0 : 1;
        }

        // FORMAT
        if (cmd == "format") {
            expect_args(2);
            if (as_json) {
                return emit(tool::format(read_text_file(cmdv[1]), settings.indent,
                                         settings.sort_keys, settings.limits));
            }
            const Value doc = load_document_file(cmdv[1], "data", settings.limits);
            std::cout << format(doc, settings.indent, settings.sort_keys) << "\n";
            return 0;
        }

        // SETTINGS
        if (cmd == "settings") {
            expect_args(1);
            std::cout << format(settings.to_value(), settings.indent) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
