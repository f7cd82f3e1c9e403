// PyBind11 bindings for the reasongraph core.
// Exposes the branch graph, evaluator and event log to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DREASONGRAPH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "evaluation/differential_evaluator.hpp"
#include "graph/branch_graph.hpp"
#include "graph/content_hash.hpp"
#include "graph/event_log.hpp"

namespace py = pybind11;

namespace {

// Library exceptions cross into Python as ValueError/KeyError/RuntimeError
// with the stable code name prefixed, e.g. "BRANCH_NOT_FOUND: ...".
std::string withCode(const reasongraph::Error& e) {
    return std::string(reasongraph::errorCodeName(e.code())) + ": " + e.what();
}

py::dict errorDict(const reasongraph::ErrorInfo& info) {
    py::dict d;
    d["code"] = reasongraph::errorCodeName(info.code);
    d["message"] = info.message;
    d["retryable"] = info.retryable;
    return d;
}

} // namespace

PYBIND11_MODULE(reasongraph_bindings, m) {
    m.doc() = "reasongraph C++ core bindings";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const reasongraph::ValidationError& e) {
            PyErr_SetString(PyExc_ValueError, withCode(e).c_str());
        } catch (const reasongraph::NotFoundError& e) {
            PyErr_SetString(PyExc_KeyError, withCode(e).c_str());
        } catch (const reasongraph::Error& e) {
            PyErr_SetString(PyExc_RuntimeError, withCode(e).c_str());
        }
    });

    // ── Enums ──
    py::enum_<reasongraph::BranchState>(m, "BranchState")
        .value("ACTIVE", reasongraph::BranchState::Active)
        .value("SUSPENDED", reasongraph::BranchState::Suspended)
        .value("COMPLETED", reasongraph::BranchState::Completed)
        .value("DEAD_END", reasongraph::BranchState::DeadEnd);

    py::enum_<reasongraph::CrossRefType>(m, "CrossRefType")
        .value("COMPLEMENTARY", reasongraph::CrossRefType::Complementary)
        .value("CONTRADICTORY", reasongraph::CrossRefType::Contradictory)
        .value("BUILDS_UPON", reasongraph::CrossRefType::BuildsUpon)
        .value("ALTERNATIVE", reasongraph::CrossRefType::Alternative)
        .value("SUPPORTS", reasongraph::CrossRefType::Supports);

    py::enum_<reasongraph::Quality>(m, "Quality")
        .value("EXCELLENT", reasongraph::Quality::Excellent)
        .value("GOOD", reasongraph::Quality::Good)
        .value("MODERATE", reasongraph::Quality::Moderate)
        .value("POOR", reasongraph::Quality::Poor);

    // ── Config ──
    py::class_<reasongraph::EvaluationConfig>(m, "EvaluationConfig")
        .def(py::init<>())
        .def_readwrite("window_size", &reasongraph::EvaluationConfig::window_size)
        .def_readwrite("goal_window", &reasongraph::EvaluationConfig::goal_window)
        .def_readwrite("similarity_threshold", &reasongraph::EvaluationConfig::similarity_threshold)
        .def_readwrite("use_embedding_goal_alignment",
                       &reasongraph::EvaluationConfig::use_embedding_goal_alignment);

    py::class_<reasongraph::BranchConfig>(m, "BranchConfig")
        .def(py::init<>())
        .def_readwrite("dead_end_threshold", &reasongraph::BranchConfig::dead_end_threshold)
        .def_readwrite("prune_threshold", &reasongraph::BranchConfig::prune_threshold)
        .def_readwrite("max_content_length", &reasongraph::BranchConfig::max_content_length);

    py::class_<reasongraph::Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("evaluation", &reasongraph::Config::evaluation)
        .def_readwrite("branch", &reasongraph::Config::branch)
        .def("validate", &reasongraph::Config::validate);

    // ── Inputs ──
    py::class_<reasongraph::CrossRefInput>(m, "CrossRefInput")
        .def(py::init<>())
        .def_readwrite("to_branch", &reasongraph::CrossRefInput::to_branch)
        .def_readwrite("type", &reasongraph::CrossRefInput::type)
        .def_readwrite("reason", &reasongraph::CrossRefInput::reason)
        .def_readwrite("strength", &reasongraph::CrossRefInput::strength);

    py::class_<reasongraph::ThoughtInput>(m, "ThoughtInput")
        .def(py::init<>())
        .def_readwrite("content", &reasongraph::ThoughtInput::content)
        .def_readwrite("branch_id", &reasongraph::ThoughtInput::branch_id)
        .def_readwrite("parent_branch_id", &reasongraph::ThoughtInput::parent_branch_id)
        .def_readwrite("kind", &reasongraph::ThoughtInput::kind)
        .def_readwrite("confidence", &reasongraph::ThoughtInput::confidence)
        .def_readwrite("key_points", &reasongraph::ThoughtInput::key_points)
        .def_readwrite("cross_refs", &reasongraph::ThoughtInput::cross_refs)
        .def_readwrite("references", &reasongraph::ThoughtInput::references);

    // ── Results ──
    py::class_<reasongraph::ContradictionCheck>(m, "ContradictionCheck")
        .def_readonly("potential_contradiction",
                      &reasongraph::ContradictionCheck::potential_contradiction)
        .def_property_readonly("types", [](const reasongraph::ContradictionCheck& c) {
            std::vector<std::string> names;
            for (auto t : c.types) names.push_back(reasongraph::contradictionTypeName(t));
            return names;
        });

    py::class_<reasongraph::OverlapWarning>(m, "OverlapWarning")
        .def_readonly("suggested_branch", &reasongraph::OverlapWarning::suggested_branch)
        .def_readonly("current_similarity", &reasongraph::OverlapWarning::current_similarity)
        .def_readonly("suggested_similarity", &reasongraph::OverlapWarning::suggested_similarity);

    py::class_<reasongraph::AddThoughtResult>(m, "AddThoughtResult")
        .def_readonly("thought_id", &reasongraph::AddThoughtResult::thought_id)
        .def_readonly("branch_id", &reasongraph::AddThoughtResult::branch_id)
        .def_readonly("added", &reasongraph::AddThoughtResult::added)
        .def_readonly("overlap_warning", &reasongraph::AddThoughtResult::overlap_warning)
        .def_readonly("contradiction", &reasongraph::AddThoughtResult::contradiction);

    py::class_<reasongraph::Thought>(m, "Thought")
        .def_readonly("id", &reasongraph::Thought::id)
        .def_readonly("content", &reasongraph::Thought::content)
        .def_readonly("branch_id", &reasongraph::Thought::branch_id)
        .def_readonly("kind", &reasongraph::Thought::kind)
        .def_readonly("confidence", &reasongraph::Thought::confidence)
        .def_readonly("key_points", &reasongraph::Thought::key_points)
        .def_readonly("created_at", &reasongraph::Thought::created_at);

    py::class_<reasongraph::Branch>(m, "Branch")
        .def_readonly("id", &reasongraph::Branch::id)
        .def_readonly("parent_id", &reasongraph::Branch::parent_id)
        .def_readonly("child_ids", &reasongraph::Branch::child_ids)
        .def_readonly("thought_ids", &reasongraph::Branch::thought_ids)
        .def_readonly("state", &reasongraph::Branch::state)
        .def_readonly("priority", &reasongraph::Branch::priority)
        .def_readonly("confidence", &reasongraph::Branch::confidence);

    py::class_<reasongraph::Event>(m, "Event")
        .def_readonly("index", &reasongraph::Event::index)
        .def_property_readonly("kind", [](const reasongraph::Event& e) {
            return std::string(reasongraph::eventKindName(e.kind));
        })
        .def_readonly("timestamp", &reasongraph::Event::timestamp)
        .def_readonly("branch_id", &reasongraph::Event::branch_id)
        .def_readonly("thought_id", &reasongraph::Event::thought_id)
        .def("to_json", &reasongraph::EventLog::toLine);

    py::class_<reasongraph::CircularPattern>(m, "CircularPattern")
        .def_property_readonly("type", [](const reasongraph::CircularPattern& p) {
            return std::string(reasongraph::circularTypeName(p.type));
        })
        .def_readonly("thought_ids", &reasongraph::CircularPattern::thought_ids)
        .def_readonly("description", &reasongraph::CircularPattern::description)
        .def_readonly("confidence", &reasongraph::CircularPattern::confidence);

    py::class_<reasongraph::MergeSuggestion>(m, "MergeSuggestion")
        .def_readonly("branch_a", &reasongraph::MergeSuggestion::branch_a)
        .def_readonly("branch_b", &reasongraph::MergeSuggestion::branch_b)
        .def_readonly("similarity", &reasongraph::MergeSuggestion::similarity)
        .def_readonly("shared_keywords", &reasongraph::MergeSuggestion::shared_keywords);

    py::class_<reasongraph::GraphStatistics>(m, "GraphStatistics")
        .def_readonly("total_branches", &reasongraph::GraphStatistics::total_branches)
        .def_readonly("total_thoughts", &reasongraph::GraphStatistics::total_thoughts)
        .def_readonly("active_branches", &reasongraph::GraphStatistics::active_branches)
        .def_readonly("average_thoughts_per_branch",
                      &reasongraph::GraphStatistics::average_thoughts_per_branch)
        .def_readonly("state_distribution", &reasongraph::GraphStatistics::state_distribution)
        .def_readonly("total_events", &reasongraph::GraphStatistics::total_events);

    py::class_<reasongraph::EvaluationResult>(m, "EvaluationResult")
        .def_readonly("coherence", &reasongraph::EvaluationResult::coherence)
        .def_readonly("contradiction", &reasongraph::EvaluationResult::contradiction)
        .def_readonly("information_gain", &reasongraph::EvaluationResult::information_gain)
        .def_readonly("redundancy", &reasongraph::EvaluationResult::redundancy)
        .def_readonly("goal_alignment", &reasongraph::EvaluationResult::goal_alignment)
        .def_readonly("confidence_gradient", &reasongraph::EvaluationResult::confidence_gradient)
        .def_readonly("overall_score", &reasongraph::EvaluationResult::overall_score)
        .def_readonly("thoughts_evaluated", &reasongraph::EvaluationResult::thoughts_evaluated)
        .def_readonly("stale", &reasongraph::EvaluationResult::stale);

    py::class_<reasongraph::EvaluationFeedback>(m, "EvaluationFeedback")
        .def_readonly("score", &reasongraph::EvaluationFeedback::score)
        .def_readonly("quality", &reasongraph::EvaluationFeedback::quality)
        .def_readonly("issues", &reasongraph::EvaluationFeedback::issues)
        .def_readonly("suggestions", &reasongraph::EvaluationFeedback::suggestions)
        .def_readonly("should_pivot", &reasongraph::EvaluationFeedback::should_pivot);

    // ── BranchGraph ──
    py::class_<reasongraph::BranchGraph>(m, "BranchGraph")
        .def(py::init([](const reasongraph::Config& config) {
            return std::make_unique<reasongraph::BranchGraph>(config);
        }), py::arg("config") = reasongraph::Config{})
        .def("add_thought", &reasongraph::BranchGraph::addThought,
             py::call_guard<py::gil_scoped_release>())
        .def("create_branch", &reasongraph::BranchGraph::createBranch,
             py::arg("parent_id") = std::nullopt)
        .def("create_branch_with_id", &reasongraph::BranchGraph::createBranchWithId,
             py::arg("branch_id"), py::arg("parent_id") = std::nullopt)
        .def("set_branch_state", &reasongraph::BranchGraph::setBranchState)
        .def("get_thought", &reasongraph::BranchGraph::getThought)
        .def("get_branch", &reasongraph::BranchGraph::getBranch)
        .def("get_all_branches", &reasongraph::BranchGraph::getAllBranches)
        .def("get_recent_thoughts", &reasongraph::BranchGraph::getRecentThoughts)
        .def("get_events_since", &reasongraph::BranchGraph::getEventsSince,
             py::arg("cursor") = 0)
        .def("breadth_first_search", &reasongraph::BranchGraph::breadthFirstSearch,
             py::arg("start_branch"), py::arg("max_depth") = 3)
        .def("search_thoughts", &reasongraph::BranchGraph::searchThoughts)
        .def("find_thoughts_by_kind", &reasongraph::BranchGraph::findThoughtsByKind)
        .def("find_branches_by_state", &reasongraph::BranchGraph::findBranchesByState)
        .def("calculate_similarity", &reasongraph::BranchGraph::calculateSimilarity)
        .def("most_similar", &reasongraph::BranchGraph::mostSimilar,
             py::arg("thought_id"), py::arg("k") = 5)
        .def("clusters", &reasongraph::BranchGraph::clusters,
             py::arg("min_similarity") = std::nullopt)
        .def("detect_circular_reasoning", &reasongraph::BranchGraph::detectCircularReasoning)
        .def("detect_drift", &reasongraph::BranchGraph::detectDrift)
        .def("suggest_merges", &reasongraph::BranchGraph::suggestMerges,
             py::arg("threshold") = 0.85)
        .def("statistics", &reasongraph::BranchGraph::getStatistics)
        .def("export_events", [](const reasongraph::BranchGraph& g, const std::string& path) {
            reasongraph::EventLog::exportToFile(g.getEventsSince(0), path);
        })
        .def("import_events", [](reasongraph::BranchGraph& g, const std::string& path) {
            g.replay(reasongraph::EventLog::importFromFile(path));
        });

    // ── DifferentialEvaluator ──
    py::class_<reasongraph::DifferentialEvaluator>(m, "DifferentialEvaluator")
        .def(py::init([](reasongraph::BranchGraph& graph) {
            return std::make_unique<reasongraph::DifferentialEvaluator>(graph);
        }), py::keep_alive<1, 2>())
        .def("evaluate_incremental", &reasongraph::DifferentialEvaluator::evaluateIncremental,
             py::call_guard<py::gil_scoped_release>())
        .def("evaluate_batch", &reasongraph::DifferentialEvaluator::evaluateBatch,
             py::call_guard<py::gil_scoped_release>())
        .def("set_goal", &reasongraph::DifferentialEvaluator::setGoal)
        .def("goal", &reasongraph::DifferentialEvaluator::goal)
        .def("clear_caches", &reasongraph::DifferentialEvaluator::clearCaches)
        .def("feedback", &reasongraph::DifferentialEvaluator::feedback)
        .def("recommended_state", &reasongraph::DifferentialEvaluator::recommendedState)
        .def("prune_low_scoring_branches",
             &reasongraph::DifferentialEvaluator::pruneLowScoringBranches,
             py::arg("threshold") = std::nullopt);

    m.def("content_hash", &reasongraph::contentHash,
          py::arg("content"), py::arg("length") = 16);

    // Structured form for callers that want {ok, value | error} instead of
    // exceptions.
    m.def("try_add_thought", [](reasongraph::BranchGraph& graph,
                                const reasongraph::ThoughtInput& input) {
        auto outcome = reasongraph::capture([&] { return graph.addThought(input); });
        py::dict d;
        d["ok"] = outcome.ok();
        if (outcome.ok()) d["value"] = py::cast(outcome.value());
        else d["error"] = errorDict(outcome.error());
        return d;
    }, py::arg("graph"), py::arg("input"));
}
