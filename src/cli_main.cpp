#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include "mergeguard/Ambient.hpp"
#include "mergeguard/Errors.hpp"
#include "mergeguard/KeyClassifier.hpp"
#include "mergeguard/Loader.hpp"
#include "mergeguard/Merge.hpp"
#include "mergeguard/Parse.hpp"
#include "mergeguard/PermissiveMerge.hpp"
#include "mergeguard/Settings.hpp"

using nlohmann::json;
using namespace mergeguard;

namespace {

constexpr int kExitRejected = 2;

int print_outcome(const MergeOutcome& outcome, const std::string& out) {
    if (outcome.is_rejected()) {
        std::cout << outcome.to_json().dump(2) << "\n";
        return kExitRejected;
    }
    if (!out.empty()) {
        write_json_file(out, outcome.value());
        std::cout << "Wrote merged document to " << out << "\n";
        return 0;
    }
    std::cout << outcome.value().dump(2) << "\n";
    return 0;
}

// Legacy merge against a private namespace; reports what leaked into it.
int run_permissive(const json& target, const json& source) {
    AmbientNamespace scratch;
    json merged = target;
    const std::size_t writes = permissive_merge(merged, source, scratch);
    json report = {
        {"status", "permissive"},
        {"result", merged},
        {"ambient_writes", writes},
        {"ambient", scratch.snapshot()},
        {"ambient_clean", scratch.verify_clean()}
    };
    std::cout << report.dump(2) << "\n";
    return writes == 0 ? 0 : kExitRejected;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("mergeguard", "Merge untrusted JSON/TOML documents into trusted ones under a key and type policy");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("p,policy", "Path to JSON/TOML policy document", cxxopts::value<std::string>())
            ("deny", "Comma-separated extra keys to deny", cxxopts::value<std::string>()->default_value(""))
            ("allow", "Comma-separated allow-list", cxxopts::value<std::string>())
            ("schema", "Comma-separated field:type pairs", cxxopts::value<std::string>()->default_value(""))
            ("max-depth", "Maximum nesting depth", cxxopts::value<int>())
            ("log-level", "debug|info|warn|error|off", cxxopts::value<std::string>())
            ("o,out", "Write the merged document to FILE", cxxopts::value<std::string>()->default_value(""))
            ("permissive", "Run the unsanitized legacy merge instead (demonstration only)")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge TARGET SOURCE | check SOURCE | classify KEY... | policy | verify\n";
            return 0;
        }

        install_ambient_guard();

        // Layered settings: defaults -> --policy file -> MERGEGUARD_* env -> flags
        LoadOptions load;
        if (result.count("policy")) load.file_path = result["policy"].as<std::string>();
        const auto denied = parse_key_list(result["deny"].as<std::string>());
        if (!denied.empty()) load.overrides["denied_keys"] = json(denied);
        if (result.count("allow")) load.overrides["allowed_keys"] = json(parse_key_list(result["allow"].as<std::string>()));
        const auto schema = parse_schema_list(result["schema"].as<std::string>());
        if (!schema.empty()) {
            // one mapping, so dotted field names stay single keys
            json fields = json::object();
            for (const auto& [field, kind] : schema) fields[field] = kind_name(kind);
            load.overrides["field_schema"] = fields;
        }
        if (result.count("max-depth")) load.overrides["max_depth"] = result["max-depth"].as<int>();
        if (result.count("log-level")) load.overrides["log_level"] = result["log-level"].as<std::string>();

        const Settings settings = Settings::load(load);
        apply_log_level(settings.log_level());
        const MergePolicy& policy = settings.policy();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        // MERGE
        if (cmd == "merge") {
            expect_args(3);
            const json target = load_document(cmdv[1]);
            const json source = load_document(cmdv[2]);
            if (result.count("permissive")) {
                return run_permissive(target, source);
            }
            return print_outcome(merge(target, source, policy), result["out"].as<std::string>());
        }

        // CHECK (dry run into an empty mapping)
        if (cmd == "check") {
            expect_args(2);
            const json source = load_document(cmdv[1]);
            const MergeOutcome outcome = merge(json::object(), source, policy);
            if (outcome.is_rejected()) {
                std::cout << outcome.to_json().dump(2) << "\n";
                return kExitRejected;
            }
            std::cout << "OK\n";
            return 0;
        }

        // CLASSIFY
        if (cmd == "classify") {
            expect_args(2);
            json report = json::object();
            bool all_allowed = true;
            for (size_t i = 1; i < cmdv.size(); ++i) {
                const Classification c = classify(cmdv[i], policy);
                all_allowed = all_allowed && c.allowed();
                report[cmdv[i]] = c.allowed() ? to_string(c.disposition)
                                              : to_string(c.disposition) + " (" + to_string(c.reason) + ")";
            }
            std::cout << report.dump(2) << "\n";
            return all_allowed ? 0 : kExitRejected;
        }

        // POLICY
        if (cmd == "policy") {
            std::cout << policy.to_json().dump(2) << "\n";
            return 0;
        }

        // VERIFY
        if (cmd == "verify") {
            const bool clean = verify_ambient_clean(policy.denied_keys());
            std::cout << json{{"installed", ambient().installed()}, {"clean", clean}}.dump(2) << "\n";
            return clean ? 0 : 1;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const PolicyError& pe) {
        std::cerr << "Error: " << pe.what() << "\n";
        return 1;
    } catch (const AmbientFrozenError& fe) {
        spdlog::critical("{}", fe.what());
        return 3;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
