// PyBind11 bindings for the arbor core.
// Exposes units, atomizer, contexts, combiner, lineage store and engine to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DARBOR_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "atomizer/atomizer.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "engine/engine.hpp"
#include "engine/engine_config.hpp"
#include "interaction/interaction.hpp"
#include "memory/lineage_store.hpp"
#include "observer/combiner.hpp"
#include "observer/observer.hpp"
#include "pipeline/pipeline_manager.hpp"
#include "pipeline/processing_context.hpp"
#include "unit/information_unit.hpp"

namespace py = pybind11;

PYBIND11_MODULE(arbor_bindings, m) {
    m.doc() = "Arbor C++ Core Bindings";

    // ── Enums ──
    py::enum_<arbor::UnitKind>(m, "UnitKind")
        .value("TOKEN", arbor::UnitKind::TOKEN)
        .value("SENTENCE", arbor::UnitKind::SENTENCE)
        .value("FIELD", arbor::UnitKind::FIELD)
        .value("COMBINED", arbor::UnitKind::COMBINED);

    py::enum_<arbor::UnitState>(m, "UnitState")
        .value("POS", arbor::UnitState::POS)
        .value("NEG", arbor::UnitState::NEG)
        .value("NEUTRAL", arbor::UnitState::NEUTRAL)
        .value("UNRESOLVED", arbor::UnitState::UNRESOLVED)
        .value("CONTESTED", arbor::UnitState::CONTESTED);

    py::enum_<arbor::WeightReason>(m, "WeightReason")
        .value("REPETITION", arbor::WeightReason::REPETITION)
        .value("RELEVANCE", arbor::WeightReason::RELEVANCE)
        .value("MANUAL", arbor::WeightReason::MANUAL)
        .value("MERGE", arbor::WeightReason::MERGE)
        .value("AGREEMENT", arbor::WeightReason::AGREEMENT);

    py::enum_<arbor::EmitTarget>(m, "EmitTarget")
        .value("UNIT", arbor::EmitTarget::UNIT)
        .value("GROUP", arbor::EmitTarget::GROUP);

    py::enum_<arbor::CollapseCause>(m, "CollapseCause")
        .value("THRESHOLD", arbor::CollapseCause::THRESHOLD)
        .value("FORCED", arbor::CollapseCause::FORCED)
        .value("BUDGET", arbor::CollapseCause::BUDGET);

    py::enum_<arbor::Mode>(m, "Mode")
        .value("EXPLORATORY", arbor::Mode::EXPLORATORY)
        .value("RESOLVED", arbor::Mode::RESOLVED);

    m.def("set_log_level", [](const std::string& name) {
        arbor::LogLevel level;
        if (!arbor::parseLogLevel(name, level)) {
            throw arbor::ConfigError("unknown log level: " + name);
        }
        arbor::setLogLevel(level);
    });

    // ── Payloads ──
    py::class_<arbor::TokenValue>(m, "TokenValue")
        .def(py::init<>())
        .def(py::init([](std::string text) { return arbor::TokenValue{std::move(text)}; }))
        .def_readwrite("text", &arbor::TokenValue::text);

    py::class_<arbor::SentenceValue>(m, "SentenceValue")
        .def(py::init<>())
        .def_readwrite("text", &arbor::SentenceValue::text)
        .def_readwrite("token_count", &arbor::SentenceValue::token_count);

    py::class_<arbor::FieldValue>(m, "FieldValue")
        .def(py::init<>())
        .def(py::init([](std::string key, std::string value) {
            return arbor::FieldValue{std::move(key), std::move(value)};
        }))
        .def_readwrite("key", &arbor::FieldValue::key)
        .def_readwrite("value", &arbor::FieldValue::value);

    py::class_<arbor::CombinedValue>(m, "CombinedValue")
        .def(py::init<>())
        .def_readwrite("key", &arbor::CombinedValue::key)
        .def_readwrite("symbols", &arbor::CombinedValue::symbols)
        .def_readwrite("agreement", &arbor::CombinedValue::agreement);

    // ── InformationUnit ──
    py::class_<arbor::InformationUnit>(m, "InformationUnit")
        .def(py::init<>())
        .def_readonly("id", &arbor::InformationUnit::id)
        .def_readonly("payload", &arbor::InformationUnit::payload)
        .def_readonly("state", &arbor::InformationUnit::state)
        .def_readonly("weight", &arbor::InformationUnit::weight)
        .def_readonly("origin_seed", &arbor::InformationUnit::origin_seed)
        .def_readonly("sequence_index", &arbor::InformationUnit::sequence_index)
        .def_readonly("created_at", &arbor::InformationUnit::created_at)
        .def_property_readonly("kind", &arbor::InformationUnit::kind)
        .def_property_readonly("value", &arbor::InformationUnit::value)
        .def("identity_key", &arbor::InformationUnit::identityKey);

    // ── Atomizer ──
    py::class_<arbor::AtomizerConfig>(m, "AtomizerConfig")
        .def(py::init<>())
        .def_readwrite("strategy", &arbor::AtomizerConfig::strategy)
        .def_readwrite("base_weight", &arbor::AtomizerConfig::base_weight)
        .def_readwrite("max_units", &arbor::AtomizerConfig::max_units)
        .def_readwrite("max_input_bytes", &arbor::AtomizerConfig::max_input_bytes);

    py::class_<arbor::Atomizer>(m, "Atomizer")
        .def(py::init<arbor::AtomizerConfig>(), py::arg("config") = arbor::AtomizerConfig{})
        .def("atomize", &arbor::Atomizer::atomize,
             py::arg("raw"), py::arg("source_identity") = "");

    // ── Interactions ──
    py::class_<arbor::Link>(m, "Link")
        .def(py::init<>())
        .def(py::init([](std::vector<uint64_t> ids, double bond, uint64_t group_id) {
                 return arbor::Link{std::move(ids), bond, group_id};
             }),
             py::arg("unit_ids"), py::arg("bond_strength") = 1.0, py::arg("group_id") = 0)
        .def_readwrite("unit_ids", &arbor::Link::unit_ids)
        .def_readwrite("bond_strength", &arbor::Link::bond_strength)
        .def_readwrite("group_id", &arbor::Link::group_id);

    py::class_<arbor::Transform>(m, "Transform")
        .def(py::init<>())
        .def(py::init([](uint64_t id, arbor::UnitPayload payload,
                         std::optional<arbor::UnitState> state) {
                 return arbor::Transform{id, std::move(payload), state};
             }),
             py::arg("unit_id"), py::arg("payload"), py::arg("state") = py::none())
        .def_readwrite("unit_id", &arbor::Transform::unit_id)
        .def_readwrite("payload", &arbor::Transform::payload)
        .def_readwrite("state", &arbor::Transform::state);

    py::class_<arbor::Invalidate>(m, "Invalidate")
        .def(py::init<>())
        .def(py::init([](std::vector<uint64_t> ids, std::string reason) {
                 return arbor::Invalidate{std::move(ids), std::move(reason)};
             }),
             py::arg("unit_ids"), py::arg("reason") = "")
        .def_readwrite("unit_ids", &arbor::Invalidate::unit_ids)
        .def_readwrite("reason", &arbor::Invalidate::reason);

    py::class_<arbor::Weight>(m, "Weight")
        .def(py::init<>())
        .def(py::init([](uint64_t id, double delta, arbor::WeightReason reason) {
                 return arbor::Weight{id, delta, reason};
             }),
             py::arg("unit_id"), py::arg("delta"),
             py::arg("reason") = arbor::WeightReason::MANUAL)
        .def_readwrite("unit_id", &arbor::Weight::unit_id)
        .def_readwrite("delta", &arbor::Weight::delta)
        .def_readwrite("reason", &arbor::Weight::reason);

    py::class_<arbor::Emit>(m, "Emit")
        .def(py::init<>())
        .def(py::init([](arbor::EmitTarget target, uint64_t id) {
            return arbor::Emit{target, id};
        }))
        .def_readwrite("target", &arbor::Emit::target)
        .def_readwrite("target_id", &arbor::Emit::target_id);

    py::class_<arbor::WeightChange>(m, "WeightChange")
        .def_readonly("unit_id", &arbor::WeightChange::unit_id)
        .def_readonly("before", &arbor::WeightChange::before)
        .def_readonly("after", &arbor::WeightChange::after);

    py::class_<arbor::ContextDelta>(m, "ContextDelta")
        .def("empty", &arbor::ContextDelta::empty)
        .def_readonly("weight_changes", &arbor::ContextDelta::weight_changes)
        .def_readonly("group_id", &arbor::ContextDelta::group_id)
        .def_readonly("group_members_added", &arbor::ContextDelta::group_members_added)
        .def_readonly("emitted", &arbor::ContextDelta::emitted);

    py::class_<arbor::EmitRecord>(m, "EmitRecord")
        .def_readonly("context_id", &arbor::EmitRecord::context_id)
        .def_readonly("target", &arbor::EmitRecord::target)
        .def_readonly("target_id", &arbor::EmitRecord::target_id)
        .def_readonly("unit_ids", &arbor::EmitRecord::unit_ids)
        .def_readonly("units", &arbor::EmitRecord::units)
        .def_readonly("weight", &arbor::EmitRecord::weight)
        .def_readonly("cause", &arbor::EmitRecord::cause)
        .def("representative", &arbor::EmitRecord::representative,
             py::return_value_policy::copy);

    // ── Contexts ──
    py::class_<arbor::Signal>(m, "Signal")
        .def(py::init<>())
        .def_readwrite("repetition_count", &arbor::Signal::repetition_count)
        .def_readwrite("keyword_score", &arbor::Signal::keyword_score)
        .def_readwrite("urgency", &arbor::Signal::urgency)
        .def_readwrite("position", &arbor::Signal::position);

    py::class_<arbor::ProcessingContext, std::shared_ptr<arbor::ProcessingContext>>(
        m, "ProcessingContext")
        .def_property_readonly("id", &arbor::ProcessingContext::id)
        .def_property_readonly("mode", &arbor::ProcessingContext::mode)
        .def_property_readonly("resolved", &arbor::ProcessingContext::resolved)
        .def("units", [](const arbor::ProcessingContext& ctx) {
            std::vector<arbor::InformationUnit> out;
            for (const auto& [id, unit] : ctx.units()) out.push_back(unit);
            return out;
        })
        .def("ingest", &arbor::ProcessingContext::ingest)
        .def("ingest_and_observe", &arbor::ProcessingContext::ingestAndObserve,
             py::arg("units"), py::arg("cues") = arbor::Signal{})
        .def("apply", &arbor::ProcessingContext::apply)
        .def("revert", &arbor::ProcessingContext::revert)
        .def("step", &arbor::ProcessingContext::step)
        .def("resolve", &arbor::ProcessingContext::resolve, py::return_value_policy::copy)
        .def("group_weight", &arbor::ProcessingContext::groupWeight)
        .def("log_size", [](const arbor::ProcessingContext& ctx) { return ctx.log().size(); });

    py::class_<arbor::PipelineManager>(m, "PipelineManager")
        .def(py::init<>())
        .def("create", &arbor::PipelineManager::create, py::arg("parent_id") = py::none())
        .def("fork", &arbor::PipelineManager::fork)
        .def("acquire", &arbor::PipelineManager::acquire)
        .def("get_result", &arbor::PipelineManager::getResult)
        .def("archive", &arbor::PipelineManager::archive)
        .def("cancel", &arbor::PipelineManager::cancel)
        .def("merge", &arbor::PipelineManager::merge)
        .def("live_count", &arbor::PipelineManager::liveCount);

    // ── Observers ──
    py::class_<arbor::Observer, std::shared_ptr<arbor::Observer>>(m, "Observer")
        .def("name", &arbor::Observer::name)
        .def("alphabet", &arbor::Observer::alphabet)
        .def("observe", &arbor::Observer::observe);

    py::class_<arbor::FunctionObserver, arbor::Observer,
               std::shared_ptr<arbor::FunctionObserver>>(m, "FunctionObserver")
        .def(py::init<std::string, arbor::Alphabet, arbor::FunctionObserver::Fn>());

    py::class_<arbor::SeededObserver, arbor::Observer,
               std::shared_ptr<arbor::SeededObserver>>(m, "SeededObserver")
        .def(py::init<std::string, arbor::Alphabet, uint64_t>());

    py::class_<arbor::ContainsObserver, arbor::Observer,
               std::shared_ptr<arbor::ContainsObserver>>(m, "ContainsObserver")
        .def(py::init<std::string>());

    py::class_<arbor::CombinedKey>(m, "CombinedKey")
        .def_readonly("key", &arbor::CombinedKey::key)
        .def_readonly("symbols", &arbor::CombinedKey::symbols)
        .def_readonly("observer_names", &arbor::CombinedKey::observer_names)
        .def_readonly("agreement", &arbor::CombinedKey::agreement)
        .def_readonly("unit", &arbor::CombinedKey::unit);

    auto toObserverSet = [](const std::vector<std::shared_ptr<arbor::Observer>>& in) {
        return arbor::ObserverSet(in.begin(), in.end());
    };

    // Observers written in Python re-acquire the GIL on their worker thread.
    py::class_<arbor::Combiner>(m, "Combiner")
        .def(py::init<>())
        .def("combine",
             [toObserverSet](const arbor::Combiner& c, const arbor::InformationUnit& unit,
                             const std::vector<std::shared_ptr<arbor::Observer>>& observers) {
                 arbor::ObserverSet set = toObserverSet(observers);
                 py::gil_scoped_release release;
                 return c.combine(unit, set);
             });

    // ── Lineage Store ──
    py::class_<arbor::HistoryRecord>(m, "HistoryRecord")
        .def_readonly("timestamp", &arbor::HistoryRecord::timestamp)
        .def_readonly("text", &arbor::HistoryRecord::text);

    py::class_<arbor::MemoryEntry>(m, "MemoryEntry")
        .def_readonly("name", &arbor::MemoryEntry::name)
        .def_readonly("history", &arbor::MemoryEntry::history)
        .def_readonly("parent_name", &arbor::MemoryEntry::parent_name)
        .def_readonly("children_names", &arbor::MemoryEntry::children_names)
        .def_readonly("stability_label", &arbor::MemoryEntry::stability_label);

    py::class_<arbor::StoreConfig>(m, "StoreConfig")
        .def(py::init<>())
        .def_readwrite("log_path", &arbor::StoreConfig::log_path)
        .def_readwrite("snapshot_path", &arbor::StoreConfig::snapshot_path);

    py::class_<arbor::LineageStore>(m, "LineageStore")
        .def(py::init<arbor::StoreConfig>(), py::arg("config") = arbor::StoreConfig{})
        .def("open", &arbor::LineageStore::open)
        .def("put", &arbor::LineageStore::put,
             py::arg("name"), py::arg("text"), py::arg("parent") = py::none())
        .def("get", &arbor::LineageStore::get)
        .def("list_children", &arbor::LineageStore::listChildren)
        .def("with_prefix", &arbor::LineageStore::withPrefix)
        .def("set_stability_label", &arbor::LineageStore::setStabilityLabel)
        .def("serialize", &arbor::LineageStore::serialize, py::arg("indent") = 2)
        .def("save_snapshot", &arbor::LineageStore::saveSnapshot)
        .def("compact", &arbor::LineageStore::compact)
        .def("verify_integrity", &arbor::LineageStore::verifyIntegrity)
        .def("__len__", &arbor::LineageStore::size);

    // ── Engine ──
    py::class_<arbor::SubmitOptions>(m, "SubmitOptions")
        .def(py::init<>())
        .def_readwrite("name", &arbor::SubmitOptions::name)
        .def_readwrite("parent", &arbor::SubmitOptions::parent)
        .def_readwrite("source", &arbor::SubmitOptions::source)
        .def_readwrite("keywords", &arbor::SubmitOptions::keywords)
        .def_readwrite("urgency", &arbor::SubmitOptions::urgency);

    py::class_<arbor::SubmitResult>(m, "SubmitResult")
        .def_readonly("key", &arbor::SubmitResult::key)
        .def_readonly("name", &arbor::SubmitResult::name)
        .def_readonly("emit", &arbor::SubmitResult::emit);

    py::class_<arbor::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("atomizer", &arbor::EngineConfig::atomizer)
        .def_readwrite("store", &arbor::EngineConfig::store);

    m.def("load_engine_config", &arbor::loadEngineConfig);

    py::class_<arbor::Engine>(m, "Engine")
        .def(py::init<arbor::EngineConfig>(), py::arg("config") = arbor::EngineConfig{})
        .def("open", &arbor::Engine::open)
        .def("submit",
             [toObserverSet](arbor::Engine& e, const std::string& raw,
                             const std::vector<std::shared_ptr<arbor::Observer>>& observers,
                             const arbor::SubmitOptions& options) {
                 arbor::ObserverSet set = toObserverSet(observers);
                 py::gil_scoped_release release;
                 return e.submit(raw, set, options);
             },
             py::arg("raw_input"), py::arg("observers"),
             py::arg("options") = arbor::SubmitOptions{})
        .def("retrieve", &arbor::Engine::retrieve);
}
