#include <arch_staging/changeset_exporter.hpp>
#include <arch_staging/base_snapshot.hpp>
#include <arch_storage/document_batch.hpp>
#include <arch_storage/file_system.hpp>
#include <arch_storage/log.hpp>
#include <set>
#include <stdexcept>

namespace arch_staging {

ChangesetExporter::ChangesetExporter(StagingAreaManager& staging) : staging_(staging) {}

nlohmann::json ChangesetExporter::export_changeset(const std::string& id_or_name) const {
    const auto cs = staging_.load(id_or_name);

    nlohmann::json doc;
    doc["format"] = exchange_format;
    doc["version"] = exchange_version;
    doc["exported_at"] = utc_timestamp();
    doc["changeset"] = changeset_metadata_to_json(cs);
    doc["changes"] = change_log_to_json(cs)["changes"];
    if (auto detail = staging_.storage().load_snapshot_detail(cs.id())) doc["snapshot"] = std::move(*detail);
    return doc;
}

void ChangesetExporter::export_to_file(const std::string& id_or_name, const std::filesystem::path& path) const {
    arch_storage::DocumentBatch batch(staging_.model().fs());
    batch.put(path, export_changeset(id_or_name));
    batch.commit();
    arch_storage::logger()->info("changeset_exported changeset={} file={}", id_or_name, path.string());
}

Changeset ChangesetExporter::import_changeset(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("format") || doc["format"] != exchange_format)
        throw std::invalid_argument("not an archstage changeset document");
    if (!doc.contains("version") || !doc["version"].is_number_integer() || doc["version"].get<int>() > exchange_version)
        throw std::invalid_argument("unsupported changeset document version");
    if (!doc.contains("changeset") || !doc["changeset"].is_object())
        throw std::invalid_argument("changeset document has no metadata");

    nlohmann::json log;
    log["changes"] = doc.contains("changes") ? doc["changes"] : nlohmann::json::array();
    const Changeset source = changeset_from_json(doc["changeset"], log);

    std::optional<nlohmann::json> detail;
    if (doc.contains("snapshot") && snapshot_detail_from_json(doc["snapshot"])) detail = doc["snapshot"];

    return staging_.adopt(source.name(), source.description(), source.base_snapshot(), source.changes(), detail);
}

Changeset ChangesetExporter::import_from_file(const std::filesystem::path& path) {
    return import_changeset(arch_storage::read_document(staging_.model().fs(), path));
}

CompatibilityReport ChangesetExporter::check_compatibility(const Changeset& changeset) const {
    const auto& model = staging_.model();
    CompatibilityReport report;
    report.affected_layers = changeset.affected_layers();

    const auto current = BaseSnapshotManager{}.capture(model);
    report.base_snapshot_match = current.hash == changeset.base_snapshot();
    if (!report.base_snapshot_match)
        report.warnings.push_back("base snapshot differs from the current model; commit will report drift");

    // Walk the log the way replay would, tracking what exists at each step.
    std::set<std::string> present;
    std::set<std::string> missing;
    for (const auto& r : changeset.changes()) {
        const auto& id = r.element_id();
        const bool exists = present.count(id) || (model.graph().has_node(id) && !missing.count(id));
        switch (r.type()) {
            case ChangeType::Add:
                if (exists) report.warnings.push_back("'" + id + "' already exists; add will conflict");
                present.insert(id);
                missing.erase(id);
                break;
            case ChangeType::Update:
                if (!exists) report.missing_elements.push_back(id);
                break;
            case ChangeType::Delete:
                if (!exists) report.missing_elements.push_back(id);
                present.erase(id);
                missing.insert(id);
                break;
        }
    }
    for (const auto& layer : report.affected_layers) {
        if (!model.manifest().has_layer(layer))
            report.warnings.push_back("layer '" + layer + "' is not declared in the manifest");
    }
    report.compatible = report.missing_elements.empty();
    return report;
}

nlohmann::json compatibility_report_to_json(const CompatibilityReport& report) {
    nlohmann::json j;
    j["compatible"] = report.compatible;
    j["base_snapshot_match"] = report.base_snapshot_match;
    j["missing_elements"] = report.missing_elements;
    j["affected_layers"] = report.affected_layers;
    j["warnings"] = report.warnings;
    return j;
}

} // namespace arch_staging
