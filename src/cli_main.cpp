#include <cxxopts.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iterator>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "statpatch/DotPath.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/FileDocumentStore.hpp"
#include "statpatch/Handler.hpp"
#include "statpatch/Logging.hpp"
#include "statpatch/Request.hpp"
#include "statpatch/Settings.hpp"

using nlohmann::json;
using namespace statpatch;

namespace {

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// "-" reads stdin, "@path" or a plain path reads the file.
std::string read_source(const std::string& arg) {
    if (arg == "-") return read_all(std::cin);
    const std::string path = (!arg.empty() && arg[0] == '@') ? arg.substr(1) : arg;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw std::runtime_error("Could not open " + path);
    return read_all(ifs);
}

// OPS is inline JSON, or @file holding JSON.
json read_ops(const std::string& arg) {
    const std::string text = (!arg.empty() && arg[0] == '@') ? read_source(arg) : arg;
    json ops = json::parse(text);
    if (!ops.is_array()) throw std::runtime_error("OPS must be a JSON array");
    return ops;
}

int print_response(const HttpResponse& res) {
    json body = json::parse(res.body, nullptr, false);
    std::cout << (body.is_discarded() ? res.body : body.dump(2)) << "\n";
    return (res.status >= 200 && res.status < 300) ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("statpatch", "Apply batched edits to per-application stats documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("store-dir", "Directory holding the stats documents", cxxopts::value<std::string>())
            ("bucket", "Bucket name reported in responses", cxxopts::value<std::string>())
            ("dry-run", "Compute results without writing (forces every request)")
            ("log-level", "DEBUG, INFO or ERROR", cxxopts::value<std::string>())
            ("request-id", "Request id attached to log records", cxxopts::value<std::string>()->default_value("-"))
            ("no-create", "apply: fail if the document does not exist yet")
            ("if-match", "apply: expected version tag of the document", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: apply APP OPS|@FILE [--no-create] [--if-match TAG] | event FILE|- | show APP [PATH]\n";
            return 0;
        }

        SettingsSources sources;
        if (result.count("config")) sources.file_path = result["config"].as<std::string>();
        if (result.count("store-dir")) sources.overrides["store_dir"] = result["store-dir"].as<std::string>();
        if (result.count("bucket")) sources.overrides["bucket"] = result["bucket"].as<std::string>();
        if (result.count("log-level")) sources.overrides["log_level"] = result["log-level"].as<std::string>();
        if (result.count("dry-run")) sources.overrides["dry_run"] = true;

        const ServiceSettings settings = load_settings(sources);
        const std::string request_id = result["request-id"].as<std::string>();

        Logger logger(settings.log_level, stderr);
        FileDocumentStore store(settings.store_dir);
        StatsHandler handler(store, settings, logger);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                std::exit(1);
            }
        };

        // APPLY
        if (cmd == "apply") {
            expect_args(3);
            json payload = {
                {"appName", cmdv[1]},
                {"ops", read_ops(cmdv[2])},
                {"createIfMissing", result.count("no-create") == 0},
            };
            if (result.count("if-match")) {
                payload["ifMatchEtag"] = result["if-match"].as<std::string>();
            }
            return print_response(handler.handle_payload(payload, request_id));
        }

        // EVENT
        if (cmd == "event") {
            expect_args(2);
            json event = json::parse(read_source(cmdv[1]));
            HttpResponse res = handler.handle(event, request_id);
            std::cout << res.to_json().dump(2) << "\n";
            return (res.status >= 200 && res.status < 300) ? 0 : 1;
        }

        // SHOW
        if (cmd == "show") {
            expect_args(2);
            const std::string key = stats_key(cmdv[1]);
            auto stored = store.read_body(key);
            if (!stored) {
                std::cerr << "No stats stored under " << key << "\n";
                return 1;
            }
            if (cmdv.size() > 2) {
                try {
                    std::cout << get_by_dot(stored->document, cmdv[2]).dump(2) << "\n";
                } catch (const ValidationError& e) {
                    std::cerr << "Error: " << e.what() << "\n";
                    return 1;
                }
            } else {
                std::cout << stored->document.dump(2) << "\n";
            }
            if (stored->version_tag) {
                std::cerr << "etag: " << *stored->version_tag << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const SettingsError& se) {
        std::cerr << "Error: " << se.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
