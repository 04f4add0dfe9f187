#include <cxxopts.hpp>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "patchwork/Composer.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/FieldPath.hpp"
#include "patchwork/Loader.hpp"
#include "patchwork/Parse.hpp"
#include "patchwork/Patch.hpp"
#include "patchwork/PatchSet.hpp"
#include "patchwork/Schema.hpp"
#include "patchwork/Transform.hpp"

using nlohmann::json;
using namespace patchwork;

namespace {

const char* kCommands =
    "Commands:\n"
    "  render COMPOSITION COMPOSITE [--observed FILE]   render every resource\n"
    "  expand COMPOSITION                               expand PatchSet references\n"
    "  apply PATCHES COMPOSITE [COMPOSED]               apply patches to two documents\n"
    "  transform TRANSFORMS VALUE                       run a transform pipeline\n"
    "  get DOCUMENT PATH                                read a field path\n";

void configure_logging(const cxxopts::ParseResult& result) {
    auto logger = spdlog::stderr_color_mt("patchwork");
    spdlog::set_default_logger(logger);

    std::string level = "warn";
    if (auto env = get_env_var("PATCHWORK_LOG_LEVEL")) level = *env;
    if (result.count("log-level")) level = result["log-level"].as<std::string>();
    if (result.count("verbose")) level = "debug";

    spdlog::set_level(spdlog::level::from_str(level));
}

// A patches file holds one patch object or an array of them
std::vector<Patch> load_patches(const std::string& path) {
    const json doc = load_document_file(path);
    std::vector<Patch> patches;
    if (doc.is_array()) {
        for (const auto& p : doc) patches.push_back(p.get<Patch>());
    } else {
        patches.push_back(doc.get<Patch>());
    }
    return patches;
}

std::vector<Transform> load_transforms(const std::string& path) {
    const json doc = load_document_file(path);
    std::vector<Transform> transforms;
    if (doc.is_array()) {
        for (const auto& t : doc) transforms.push_back(transform_from_json(t));
    } else {
        transforms.push_back(transform_from_json(doc));
    }
    return transforms;
}

std::map<std::string, json> load_observed(const std::string& path) {
    const json doc = load_document_file(path);
    if (!doc.is_object()) {
        throw SchemaError("observed documents must be an object keyed by resource name");
    }
    std::map<std::string, json> observed;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        observed.emplace(it.key(), it.value());
    }
    return observed;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("patchwork", "Apply field-path patches and transforms to JSON/TOML documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("v,verbose", "Log debug output to stderr")
            ("log-level", "Log level (trace, debug, info, warn, error, off)", cxxopts::value<std::string>())
            ("indent", "JSON output indentation", cxxopts::value<int>()->default_value("2"))
            ("observed", "JSON/TOML file of observed documents keyed by resource name", cxxopts::value<std::string>())
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({""}) << "\n" << kCommands;
            return 0;
        }

        configure_logging(result);
        const int indent = result["indent"].as<int>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        spdlog::debug("Running command {}", cmd);

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw std::invalid_argument("insufficient arguments for command '" + cmd + "'");
            }
        };

        // RENDER
        if (cmd == "render") {
            expect_args(3);
            const Composition composition = load_composition_file(cmdv[1]);
            const json composite = load_document_file(cmdv[2]);
            std::map<std::string, json> observed;
            if (result.count("observed")) {
                observed = load_observed(result["observed"].as<std::string>());
            }

            const RenderResult rendered = render(composition, composite, observed);
            json out = {{"composite", rendered.composite}, {"resources", json::object()}};
            for (const auto& [name, doc] : rendered.composed) {
                out["resources"][name] = doc;
            }
            std::cout << out.dump(indent) << "\n";
            return 0;
        }

        // EXPAND
        if (cmd == "expand") {
            expect_args(2);
            const Composition composition = load_composition_file(cmdv[1]);
            json out = json::array();
            for (const auto& t : composed_templates(composition.patch_sets, composition.resources)) {
                out.push_back(json(t));
            }
            std::cout << out.dump(indent) << "\n";
            return 0;
        }

        // APPLY
        if (cmd == "apply") {
            expect_args(3);
            const std::vector<Patch> patches = load_patches(cmdv[1]);
            json composite = load_document_file(cmdv[2]);
            json composed = cmdv.size() > 3 ? load_document_file(cmdv[3]) : json::object();
            for (const auto& p : patches) {
                apply(p, composite, composed);
            }
            std::cout << json{{"composite", composite}, {"composed", composed}}.dump(indent) << "\n";
            return 0;
        }

        // TRANSFORM
        if (cmd == "transform") {
            expect_args(3);
            const std::vector<Transform> transforms = load_transforms(cmdv[1]);
            const json input = parse_value(cmdv[2]);
            std::cout << resolve_transforms(transforms, input).dump(indent) << "\n";
            return 0;
        }

        // GET
        if (cmd == "get") {
            expect_args(3);
            const json doc = load_document_file(cmdv[1]);
            std::cout << get_value(doc, cmdv[2]).dump(indent) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n" << kCommands;
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
