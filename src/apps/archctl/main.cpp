// archctl: command driver over the staging core (C++20)

#include <arch_model/element_id.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/errors.hpp>
#include <arch_staging/changeset_exporter.hpp>
#include <arch_staging/mutation_handler.hpp>
#include <arch_staging/staging_area.hpp>
#include <arch_staging/staging_errors.hpp>
#include <arch_storage/config.hpp>
#include <arch_storage/file_system.hpp>
#include <arch_storage/log.hpp>
#include <arch_storage/model.hpp>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Args {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;   // --key value
    std::vector<std::string> flags;                             // --key

    bool flag(const std::string& name) const {
        for (const auto& f : flags) {
            if (f == name) return true;
        }
        return false;
    }
    std::optional<std::string> option(const std::string& name) const {
        for (const auto& [k, v] : options) {
            if (k == name) return v;
        }
        return std::nullopt;
    }
    std::vector<std::string> all(const std::string& name) const {
        std::vector<std::string> out;
        for (const auto& [k, v] : options) {
            if (k == name) out.push_back(v);
        }
        return out;
    }
    std::string arg(std::size_t i, const char* what) const {
        if (i >= positional.size()) throw std::invalid_argument(std::string("missing ") + what);
        return positional[i];
    }
    std::optional<std::string> arg_opt(std::size_t i) const {
        if (i >= positional.size()) return std::nullopt;
        return positional[i];
    }
};

const char* const boolean_flags[] = {"--skip-validation", "--force", "--dry-run", "--json", "--clear-description"};

bool is_boolean_flag(const std::string& s) {
    for (const char* f : boolean_flags) {
        if (s == f) return true;
    }
    return false;
}

void print_json(const nlohmann::json& j) {
    std::printf("%s\n", j.dump(2).c_str());
}

void print_usage() {
    std::fprintf(stderr,
        "usage: archctl [--root DIR] <command> [args]\n"
        "  init <name> [--layer L]... [--description TEXT]\n"
        "  create <name> [--description TEXT]\n"
        "  list [--status S] [--json] | stats | compare <changeset> <changeset>\n"
        "  activate <changeset> | deactivate | remove <changeset>\n"
        "  status [changeset] | preview [changeset] | diff [changeset]\n"
        "  add <layer> <type> <name> [--id ID] [--description TEXT] [--property k=v]...\n"
        "      [--relationship predicate=target]... [--reference type=target]...\n"
        "  update <element> [--name N] [--description TEXT | --clear-description]\n"
        "      [--property k=v]... [--unset k]...\n"
        "      [--relationship predicate=target]...\n"
        "  delete <element> | unstage <element>\n"
        "  commit [changeset] [--skip-validation] [--force] [--dry-run]\n"
        "  discard [changeset] | export <changeset> <file> | import <file>\n");
}

std::pair<std::string, std::string> split_pair(const std::string& s, const char* what) {
    const auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0) throw std::invalid_argument(std::string("expected key=value for ") + what);
    return {s.substr(0, eq), s.substr(eq + 1)};
}

// Values that parse as JSON keep their type; anything else is a string.
nlohmann::json parse_value(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return text;
    return j;
}

std::string changeset_or_active(const Args& args, std::size_t i, const arch_staging::StagingAreaManager& staging) {
    if (auto id = args.arg_opt(i)) return *id;
    if (auto active = staging.active_id()) return *active;
    throw arch_model::InvalidStateError("no changeset given and none is active");
}

nlohmann::json changeset_summary(const arch_staging::Changeset& cs) {
    nlohmann::json j = arch_staging::changeset_metadata_to_json(cs);
    j["changes"] = cs.changes().size();
    return j;
}

nlohmann::json drift_to_json(const arch_staging::DriftReport& r) {
    nlohmann::json elements = nlohmann::json::array();
    for (const auto& e : r.elements)
        elements.push_back({{"id", e.id}, {"layer", e.layer}, {"kind", arch_staging::drift_kind_name(e.kind)}});
    return {
        {"drifted", r.drifted},
        {"base_hash", r.base_hash},
        {"current_hash", r.current_hash},
        {"manifest_changed", r.manifest_changed},
        {"affected_layers", r.affected_layers},
        {"elements", elements},
        {"warnings", r.warnings},
    };
}

nlohmann::json violations_to_json(const std::vector<arch_staging::Violation>& violations) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : violations) {
        arr.push_back({{"severity", arch_staging::severity_name(v.severity)}, {"layer", v.layer},
            {"element_id", v.element_id}, {"message", v.message}});
    }
    return arr;
}

std::vector<arch_model::Relationship> parse_relationships(const Args& args) {
    std::vector<arch_model::Relationship> out;
    for (const auto& r : args.all("--relationship")) {
        auto [predicate, target] = split_pair(r, "--relationship");
        out.push_back(arch_model::Relationship{predicate, target, nlohmann::json::object()});
    }
    return out;
}

int run(const std::string& command, const Args& args, arch_storage::Model& model) {
    if (command == "init") {
        arch_model::Manifest manifest;
        manifest.name = args.arg(0, "model name");
        manifest.description = args.option("--description").value_or("");
        for (const auto& l : args.all("--layer")) manifest.declare_layer(l);
        model.initialize(std::move(manifest));
        std::printf("initialized model '%s' at %s\n", model.manifest().name.c_str(), model.model_dir().string().c_str());
        return 0;
    }

    model.load();
    arch_staging::StagingAreaManager staging(model);
    arch_staging::MutationHandler mutations(model, staging);
    arch_staging::ChangesetExporter exporter(staging);

    if (command == "create") {
        const auto cs = staging.create(args.arg(0, "changeset name"), args.option("--description").value_or(""));
        staging.set_active(cs.id());
        std::printf("created %s (%s), now active\n", cs.id().c_str(), cs.name().c_str());
    } else if (command == "list") {
        const auto active = staging.active_id();
        std::optional<arch_staging::ChangesetStatus> status;
        if (auto s = args.option("--status")) {
            status = arch_staging::changeset_status_from_string(*s);
            if (!status) throw std::invalid_argument("unknown changeset status '" + *s + "'");
        }
        const auto changesets = staging.list(status);
        if (args.flag("--json")) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& cs : changesets) {
                auto j = changeset_summary(cs);
                j["active"] = active == cs.id();
                arr.push_back(std::move(j));
            }
            print_json(arr);
            return 0;
        }
        for (const auto& cs : changesets) {
            std::printf("%s %-10s %-24s +%zu ~%zu -%zu%s\n", cs.id().c_str(),
                arch_staging::changeset_status_name(cs.status()), cs.name().c_str(), cs.stats().additions,
                cs.stats().modifications, cs.stats().deletions, active == cs.id() ? " (active)" : "");
        }
    } else if (command == "stats") {
        print_json(arch_staging::staging_statistics_to_json(staging.statistics()));
    } else if (command == "compare") {
        const auto comparison = staging.compare(args.arg(0, "first changeset"), args.arg(1, "second changeset"));
        print_json(arch_staging::changeset_comparison_to_json(comparison));
        return comparison.has_conflicts() ? 1 : 0;
    } else if (command == "activate") {
        staging.set_active(args.arg(0, "changeset"));
        std::printf("active changeset: %s\n", staging.active_id().value_or("").c_str());
    } else if (command == "deactivate") {
        staging.clear_active();
        std::printf("no active changeset\n");
    } else if (command == "remove") {
        staging.remove(args.arg(0, "changeset"));
    } else if (command == "status") {
        const auto report = staging.status(changeset_or_active(args, 0, staging));
        nlohmann::json j = changeset_summary(report.changeset);
        j["active"] = report.active;
        if (report.drift) j["drift"] = drift_to_json(*report.drift);
        print_json(j);
    } else if (command == "add") {
        arch_model::Element element;
        element.layer = args.arg(0, "layer");
        element.type = args.arg(1, "type");
        element.name = args.arg(2, "name");
        element.id = args.option("--id").value_or("");
        if (auto d = args.option("--description")) element.description = *d;
        for (const auto& p : args.all("--property")) {
            auto [k, v] = split_pair(p, "--property");
            element.properties[k] = parse_value(v);
        }
        for (const auto& r : args.all("--reference")) {
            auto [type, target] = split_pair(r, "--reference");
            element.references.push_back(arch_model::Reference{target, type, {}});
        }
        element.relationships = parse_relationships(args);
        const auto result = mutations.execute_add(std::move(element));
        std::printf("%s %s\n", result.staged ? "staged add of" : "added", result.record.element_id().c_str());
    } else if (command == "update") {
        const auto id = args.arg(0, "element id");
        const auto relationships = parse_relationships(args);
        const auto result = mutations.execute_update(id, [&](arch_model::Element& e) {
            if (auto n = args.option("--name")) e.name = *n;
            if (auto d = args.option("--description")) e.description = *d;
            else if (args.flag("--clear-description")) e.description.reset();
            for (const auto& p : args.all("--property")) {
                auto [k, v] = split_pair(p, "--property");
                e.properties[k] = parse_value(v);
            }
            for (const auto& k : args.all("--unset")) e.properties.erase(k);
            if (!relationships.empty()) e.relationships = relationships;
        });
        std::printf("%s %s\n", result.staged ? "staged update of" : "updated", id.c_str());
    } else if (command == "delete") {
        const auto id = args.arg(0, "element id");
        const auto result = mutations.execute_delete(id);
        std::printf("%s %s\n", result.staged ? "staged delete of" : "deleted", id.c_str());
    } else if (command == "unstage") {
        const auto removed = staging.unstage(args.arg(0, "element id"));
        std::printf("unstaged %zu change(s)\n", removed);
    } else if (command == "preview") {
        const auto projected = staging.preview(changeset_or_active(args, 0, staging));
        nlohmann::json layers = nlohmann::json::object();
        for (const auto& layer : projected.layer_names()) {
            nlohmann::json elements = nlohmann::json::array();
            for (const auto& n : projected.nodes_by_layer(layer))
                elements.push_back(arch_model::element_to_json(arch_model::to_element(n, projected.edges_from(n.id))));
            layers[layer] = std::move(elements);
        }
        print_json(layers);
    } else if (command == "diff") {
        print_json(arch_staging::model_diff_to_json(staging.diff(changeset_or_active(args, 0, staging))));
    } else if (command == "commit") {
        arch_staging::CommitOptions options;
        options.skip_validation = args.flag("--skip-validation");
        options.skip_drift_check = args.flag("--force");
        options.dry_run = args.flag("--dry-run");
        const auto result = staging.commit(changeset_or_active(args, 0, staging), options);
        std::printf("%s %s: +%zu ~%zu -%zu\n", result.dry_run ? "would commit" : "committed",
            result.changeset_id.c_str(), result.applied.additions, result.applied.modifications,
            result.applied.deletions);
        if (!result.new_hash.empty()) std::printf("base %s -> %s\n", result.base_hash.c_str(), result.new_hash.c_str());
        if (!result.findings.empty()) print_json(violations_to_json(result.findings));
    } else if (command == "discard") {
        const auto id = changeset_or_active(args, 0, staging);
        staging.discard(id);
        std::printf("discarded %s\n", id.c_str());
    } else if (command == "export") {
        exporter.export_to_file(args.arg(0, "changeset"), args.arg(1, "output file"));
    } else if (command == "import") {
        const auto cs = exporter.import_from_file(args.arg(0, "input file"));
        std::printf("imported %s (%s)\n", cs.id().c_str(), cs.name().c_str());
        print_json(arch_staging::compatibility_report_to_json(exporter.check_compatibility(cs)));
    } else {
        print_usage();
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<std::filesystem::path> root;
    std::string command;
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--root" && i + 1 < argc) {
            root = argv[++i];
        } else if (a == "--help" || a == "-h") {
            print_usage();
            return 0;
        } else if (a.rfind("--", 0) == 0) {
            if (is_boolean_flag(a) || i + 1 >= argc) args.flags.push_back(a);
            else args.options.emplace_back(a, argv[++i]);
        } else if (command.empty()) {
            command = a;
        } else {
            args.positional.push_back(a);
        }
    }
    if (command.empty()) {
        print_usage();
        return 2;
    }

    if (!root) root = arch_storage::find_model_root(std::filesystem::current_path());
    if (!root) root = std::filesystem::current_path();

    const auto config = arch_storage::load_store_config(*root);
    arch_storage::configure_logging(config, *root);

    arch_storage::LocalFileSystem fs;
    arch_storage::Model model(fs, *root, config);
    try {
        return run(command, args, model);
    } catch (const arch_staging::DriftError& e) {
        (void)std::fprintf(stderr, "drift: %s\n", e.what());
        print_json(drift_to_json(e.report()));
    } catch (const arch_staging::ValidationError& e) {
        (void)std::fprintf(stderr, "validation: %s\n", e.what());
        print_json(violations_to_json(e.violations()));
    } catch (const arch_model::ModelError& e) {
        (void)std::fprintf(stderr, "error: %s\n", e.what());
    } catch (const std::invalid_argument& e) {
        (void)std::fprintf(stderr, "invalid argument: %s\n", e.what());
    }
    return 1;
}
