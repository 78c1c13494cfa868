#include <arch_staging/staging_area.hpp>
#include <arch_staging/change_apply.hpp>
#include <arch_staging/staging_errors.hpp>
#include <arch_storage/log.hpp>
#include <arch_storage/model_transaction.hpp>
#include <arch_model/errors.hpp>
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <random>
#include <set>
#include <stdexcept>

namespace arch_staging {

using arch_model::InvalidStateError;
using arch_model::NotFoundError;
using arch_storage::logger;

namespace {

const ChangeRecord* latest_for(const Changeset& cs, const std::string& element_id) {
    const auto records = cs.records_for(element_id);
    return records.empty() ? nullptr : records.back();
}

bool same_outcome(const ChangeRecord& a, const ChangeRecord& b) {
    if (a.type() != b.type()) return false;
    if (a.type() == ChangeType::Delete) return true;
    return a.after() == b.after();
}

nlohmann::json comparison_entries(const std::vector<ElementComparison>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        nlohmann::json j = {{"element_id", e.element_id}, {"layer", e.layer}};
        if (e.in_a) j["operation_a"] = change_type_name(*e.in_a);
        if (e.in_b) j["operation_b"] = change_type_name(*e.in_b);
        arr.push_back(std::move(j));
    }
    return arr;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

} // namespace

StagingAreaManager::StagingAreaManager(arch_storage::Model& model, Validator validator)
    : model_(model), storage_(model.fs(), model.changesets_dir()), validator_(std::move(validator)) {}

std::string StagingAreaManager::allocate_id() const {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm);

    static std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist(0, 0xffffff);
    for (;;) {
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "%06x", dist(rng));
        std::string id = model_.config().changeset_id_prefix + "-" + stamp + "-" + suffix;
        if (!storage_.exists(id)) return id;
    }
}

Changeset StagingAreaManager::create(const std::string& name, const std::string& description) {
    if (name.empty()) throw std::invalid_argument("changeset name must not be empty");
    for (const auto& id : storage_.list_ids()) {
        const auto existing = storage_.load(id);
        if (existing.is_open() && existing.name() == name)
            throw arch_model::DuplicateError("an open changeset named '" + name + "' already exists", id);
    }

    const auto snapshot = snapshots_.capture(model_);
    Changeset cs(allocate_id(), name, description, snapshot.hash);
    storage_.save(cs, snapshot_detail_to_json(snapshot));
    logger()->info("changeset_created id={} name={} base={}", cs.id(), cs.name(), cs.base_snapshot());
    return cs;
}

Changeset StagingAreaManager::load(const std::string& id_or_name) const {
    if (storage_.exists(id_or_name)) return storage_.load(id_or_name);

    std::vector<Changeset> matches;
    for (const auto& id : storage_.list_ids()) {
        auto cs = storage_.load(id);
        if (cs.name() == id_or_name) matches.push_back(std::move(cs));
    }
    if (matches.empty()) throw NotFoundError("changeset '" + id_or_name + "' not found", id_or_name);
    if (matches.size() == 1) return std::move(matches.front());

    // Several share the name; an open one wins if it is the only open one.
    std::vector<Changeset> open;
    for (auto& cs : matches) {
        if (cs.is_open()) open.push_back(std::move(cs));
    }
    if (open.size() == 1) return std::move(open.front());
    throw InvalidStateError("changeset name '" + id_or_name + "' is ambiguous; use the id");
}

std::vector<Changeset> StagingAreaManager::list(std::optional<ChangesetStatus> status) const {
    std::vector<Changeset> out;
    for (const auto& id : storage_.list_ids()) {
        auto cs = storage_.load(id);
        if (status && cs.status() != *status) continue;
        out.push_back(std::move(cs));
    }
    return out;
}

void StagingAreaManager::remove(const std::string& id_or_name) {
    const auto cs = load(id_or_name);
    if (active_id() == cs.id()) storage_.clear_active();
    storage_.remove(cs.id());
    logger()->info("changeset_removed id={}", cs.id());
}

void StagingAreaManager::set_active(const std::string& id_or_name) {
    const auto cs = load(id_or_name);
    if (!cs.is_open())
        throw InvalidStateError("changeset '" + cs.name() + "' is " + changeset_status_name(cs.status())
            + " and cannot be activated");
    storage_.write_active(cs.id());
    logger()->info("changeset_activated id={}", cs.id());
}

std::optional<std::string> StagingAreaManager::active_id() const {
    auto id = storage_.read_active();
    if (!id) return std::nullopt;
    if (!storage_.exists(*id)) {
        logger()->warn("active_pointer_stale id={}", *id);
        return std::nullopt;
    }
    return id;
}

std::optional<Changeset> StagingAreaManager::active() const {
    const auto id = active_id();
    if (!id) return std::nullopt;
    return storage_.load(*id);
}

void StagingAreaManager::clear_active() {
    storage_.clear_active();
}

Changeset StagingAreaManager::require_active() const {
    auto cs = active();
    if (!cs) throw InvalidStateError("no active changeset");
    return std::move(*cs);
}

ChangeRecord StagingAreaManager::stage(ChangeRecord record) {
    auto cs = require_active();
    const ChangeRecord staged = cs.append(std::move(record));
    // The extended log has to replay on the model before it is saved.
    VirtualProjectionEngine(model_.graph()).project_changes(cs);
    storage_.save(cs);
    logger()->debug("change_staged changeset={} seq={} type={} element={}",
        cs.id(), staged.sequence_number(), change_type_name(staged.type()), staged.element_id());
    return staged;
}

std::size_t StagingAreaManager::unstage(const std::string& element_id) {
    auto cs = require_active();
    const auto removed = cs.remove_element(element_id);
    if (removed == 0)
        throw NotFoundError("no staged changes for '" + element_id + "' in '" + cs.name() + "'", element_id);
    storage_.save(cs);
    logger()->debug("change_unstaged changeset={} element={} records={}", cs.id(), element_id, removed);
    return removed;
}

void StagingAreaManager::discard(const std::string& id_or_name) {
    auto cs = load(id_or_name);
    cs.mark_discarded();
    arch_storage::DocumentBatch batch(model_.fs());
    storage_.add_to_batch(batch, cs);
    if (active_id() == cs.id()) storage_.add_active_to_batch(batch, {});
    batch.commit();
    logger()->info("changeset_discarded id={}", cs.id());
}

ChangesetStatusReport StagingAreaManager::status(const std::string& id_or_name) const {
    auto cs = load(id_or_name);
    const bool is_active = active_id() == cs.id();
    std::optional<DriftReport> drift;
    if (cs.is_open()) {
        const auto detail_doc = storage_.load_snapshot_detail(cs.id());
        const auto detail = detail_doc ? snapshot_detail_from_json(*detail_doc) : std::nullopt;
        drift = snapshots_.detect_drift(cs.base_snapshot(), model_, detail ? &*detail : nullptr);
    }
    return ChangesetStatusReport{std::move(cs), is_active, std::move(drift)};
}

ProjectedModel StagingAreaManager::preview(const std::string& id_or_name) const {
    const auto cs = load(id_or_name);
    return VirtualProjectionEngine(model_.graph()).project_changes(cs);
}

ModelDiff StagingAreaManager::diff(const std::string& id_or_name) const {
    const auto cs = load(id_or_name);
    return VirtualProjectionEngine(model_.graph()).compute_diff(cs);
}

ChangesetComparison StagingAreaManager::compare(const std::string& a, const std::string& b) const {
    const auto cs_a = load(a);
    const auto cs_b = load(b);

    std::set<std::string> ids;
    for (const auto& id : cs_a.affected_elements()) ids.insert(id);
    for (const auto& id : cs_b.affected_elements()) ids.insert(id);

    ChangesetComparison out;
    out.changeset_a = cs_a.id();
    out.changeset_b = cs_b.id();
    for (const auto& id : ids) {
        const ChangeRecord* ra = latest_for(cs_a, id);
        const ChangeRecord* rb = latest_for(cs_b, id);
        ElementComparison entry;
        entry.element_id = id;
        entry.layer = ra ? ra->layer() : rb->layer();
        if (ra) entry.in_a = ra->type();
        if (rb) entry.in_b = rb->type();

        if (!rb) out.only_in_a.push_back(std::move(entry));
        else if (!ra) out.only_in_b.push_back(std::move(entry));
        else if (same_outcome(*ra, *rb)) out.same_in_both.push_back(std::move(entry));
        else out.conflicting.push_back(std::move(entry));
    }
    logger()->debug("changesets_compared a={} b={} conflicts={}", out.changeset_a, out.changeset_b,
        out.conflicting.size());
    return out;
}

StagingStatistics StagingAreaManager::statistics() const {
    StagingStatistics out;
    for (const auto& cs : list()) {
        ++out.changesets;
        switch (cs.status()) {
            case ChangesetStatus::Draft: ++out.draft; break;
            case ChangesetStatus::Staged: ++out.staged; break;
            case ChangesetStatus::Committed: ++out.committed; break;
            case ChangesetStatus::Discarded: ++out.discarded; break;
        }
        if (cs.is_open()) out.open_changes += cs.changes().size();
    }
    out.active = active_id();
    return out;
}

CommitResult StagingAreaManager::commit(const std::string& id_or_name, const CommitOptions& options) {
    auto log = logger();

    // 1. load, require staged
    auto cs = load(id_or_name);
    if (cs.status() != ChangesetStatus::Staged)
        throw InvalidStateError("changeset '" + cs.name() + "' is " + changeset_status_name(cs.status())
            + "; only staged changesets can be committed");

    CommitResult result;
    result.changeset_id = cs.id();
    result.dry_run = options.dry_run;
    result.applied = cs.stats();
    result.affected_layers = cs.affected_layers();
    result.base_hash = snapshots_.capture(model_).hash;

    // 2. drift
    if (!options.skip_drift_check) {
        const auto detail_doc = storage_.load_snapshot_detail(cs.id());
        const auto detail = detail_doc ? snapshot_detail_from_json(*detail_doc) : std::nullopt;
        auto report = snapshots_.detect_drift(cs.base_snapshot(), model_, detail ? &*detail : nullptr);
        if (report.drifted) {
            std::vector<std::string> ids;
            for (const auto& e : report.elements) ids.push_back(e.id);
            log->warn("commit_blocked reason=drift changeset={} layers=[{}] elements=[{}]",
                cs.id(), join(report.affected_layers), join(ids));
            throw DriftError("base model changed since changeset '" + cs.name() + "' was created; layers: ["
                + join(report.affected_layers) + "] elements: [" + join(ids) + "]", std::move(report));
        }
    } else {
        log->info("commit_drift_check_skipped changeset={}", cs.id());
    }

    // 3. validate the projected state
    VirtualProjectionEngine engine(model_.graph());
    const auto projected = engine.project_changes(cs);
    if (!options.skip_validation && validator_) {
        auto findings = validator_(projected);
        if (has_errors(findings)) {
            std::size_t errors = 0;
            for (const auto& v : findings) {
                if (v.severity == Severity::Error) ++errors;
            }
            log->warn("commit_blocked reason=validation changeset={} errors={}", cs.id(), errors);
            throw ValidationError("changeset '" + cs.name() + "' fails validation with " + std::to_string(errors)
                + " error(s)", std::move(findings));
        }
        result.findings = std::move(findings);
    }
    result.diff = engine.compute_diff(cs);

    // 4. dry run
    if (options.dry_run) {
        log->info("commit_dry_run changeset={} changes={}", cs.id(), cs.stats().total());
        return result;
    }

    // 5-6. apply and persist as one unit
    const bool was_active = active_id() == cs.id();
    Changeset committed = cs;
    committed.mark_committed();
    {
        arch_storage::ModelTransaction tx(model_);
        apply_changes(model_.graph(), cs.changes());
        model_.manifest().history.push_back(
            arch_model::HistoryEntry{cs.id(), cs.name(), utc_timestamp(), cs.changes().size()});

        arch_storage::PersistPlan plan;
        plan.layers.insert(result.affected_layers.begin(), result.affected_layers.end());
        plan.relationships = true;
        plan.manifest = true;
        tx.commit(plan, [&](arch_storage::DocumentBatch& batch) {
            storage_.add_to_batch(batch, committed);
            if (was_active) storage_.add_active_to_batch(batch, {});
        });
    }

    // 7. committed
    result.new_hash = snapshots_.capture(model_).hash;
    log->info("changeset_committed id={} additions={} modifications={} deletions={} hash={}",
        cs.id(), result.applied.additions, result.applied.modifications, result.applied.deletions, result.new_hash);
    return result;
}

Changeset StagingAreaManager::adopt(const std::string& name, const std::string& description,
    const std::string& base_snapshot, std::vector<ChangeRecord> records,
    const std::optional<nlohmann::json>& snapshot_detail)
{
    Changeset cs(allocate_id(), name, description, base_snapshot);
    for (auto& r : records) cs.append(std::move(r));
    if (snapshot_detail) storage_.save(cs, *snapshot_detail);
    else storage_.save(cs);
    logger()->info("changeset_adopted id={} name={} changes={}", cs.id(), cs.name(), cs.changes().size());
    return cs;
}

nlohmann::json changeset_comparison_to_json(const ChangesetComparison& comparison) {
    return {
        {"changeset_a", comparison.changeset_a},
        {"changeset_b", comparison.changeset_b},
        {"only_in_a", comparison_entries(comparison.only_in_a)},
        {"only_in_b", comparison_entries(comparison.only_in_b)},
        {"conflicting", comparison_entries(comparison.conflicting)},
        {"same_in_both", comparison_entries(comparison.same_in_both)},
        {"has_conflicts", comparison.has_conflicts()},
    };
}

nlohmann::json staging_statistics_to_json(const StagingStatistics& statistics) {
    nlohmann::json j = {
        {"changesets", statistics.changesets},
        {"draft", statistics.draft},
        {"staged", statistics.staged},
        {"committed", statistics.committed},
        {"discarded", statistics.discarded},
        {"open_changes", statistics.open_changes},
    };
    j["active"] = statistics.active ? nlohmann::json(*statistics.active) : nlohmann::json(nullptr);
    return j;
}

} // namespace arch_staging
