// PyBind11 bindings for the REBUT argumentation engine.
// Exposes the engine facade, the AF, and the semantics calculator to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DREBUT_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <exception>

#include "framework/argumentation_framework.hpp"
#include "semantics/extension.hpp"
#include "semantics/extension_calculator.hpp"
#include "attack/counter_argument.hpp"
#include "attack/attack_graph_builder.hpp"
#include "validation/validation_result.hpp"
#include "validation/validator.hpp"
#include "validation/strength_assessor.hpp"
#include "validation/heuristic_fallback.hpp"
#include "engine/engine_config.hpp"
#include "engine/argumentation_engine.hpp"
#include "logging/logger.hpp"

namespace py = pybind11;

PYBIND11_MODULE(rebut_bindings, m) {
    m.doc() = "REBUT abstract-argumentation engine bindings";

    // Raised instances carry .kind (ErrorKind) and .node so callers can
    // branch on TOO_LARGE without parsing the message.
    static py::exception<rebut::ArgumentationError> argumentation_error(
        m, "ArgumentationError", PyExc_RuntimeError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const rebut::ArgumentationError& e) {
            py::object instance = argumentation_error(e.what());
            instance.attr("kind") = e.kind();
            instance.attr("node") = e.node();
            PyErr_SetObject(argumentation_error.ptr(), instance.ptr());
        }
    });

    // ── Enums ──
    py::enum_<rebut::ErrorKind>(m, "ErrorKind")
        .value("DUPLICATE_NODE", rebut::ErrorKind::DUPLICATE_NODE)
        .value("UNKNOWN_NODE", rebut::ErrorKind::UNKNOWN_NODE)
        .value("TOO_LARGE", rebut::ErrorKind::TOO_LARGE);

    py::enum_<rebut::CounterArgumentType>(m, "CounterArgumentType")
        .value("DIRECT_REFUTATION", rebut::CounterArgumentType::DIRECT_REFUTATION)
        .value("COUNTER_EXAMPLE", rebut::CounterArgumentType::COUNTER_EXAMPLE)
        .value("ALTERNATIVE_EXPLANATION", rebut::CounterArgumentType::ALTERNATIVE_EXPLANATION)
        .value("PREMISE_CHALLENGE", rebut::CounterArgumentType::PREMISE_CHALLENGE)
        .value("REDUCTIO_AD_ABSURDUM", rebut::CounterArgumentType::REDUCTIO_AD_ABSURDUM);

    py::enum_<rebut::ArgumentStrength>(m, "ArgumentStrength")
        .value("WEAK", rebut::ArgumentStrength::WEAK)
        .value("MODERATE", rebut::ArgumentStrength::MODERATE)
        .value("STRONG", rebut::ArgumentStrength::STRONG)
        .value("DECISIVE", rebut::ArgumentStrength::DECISIVE);

    py::enum_<rebut::EvaluationMode>(m, "EvaluationMode")
        .value("FORMAL", rebut::EvaluationMode::FORMAL)
        .value("GROUNDED_ONLY", rebut::EvaluationMode::GROUNDED_ONLY)
        .value("FALLBACK", rebut::EvaluationMode::FALLBACK);

    py::enum_<rebut::ExtensionKind>(m, "ExtensionKind")
        .value("CONFLICT_FREE", rebut::ExtensionKind::CONFLICT_FREE)
        .value("ADMISSIBLE", rebut::ExtensionKind::ADMISSIBLE)
        .value("COMPLETE", rebut::ExtensionKind::COMPLETE)
        .value("GROUNDED", rebut::ExtensionKind::GROUNDED);

    py::enum_<rebut::Label>(m, "Label")
        .value("IN", rebut::Label::IN)
        .value("OUT", rebut::Label::OUT)
        .value("UNDEC", rebut::Label::UNDEC);

    py::enum_<spdlog::level::level_enum>(m, "LogLevel")
        .value("TRACE", spdlog::level::trace)
        .value("DEBUG", spdlog::level::debug)
        .value("INFO", spdlog::level::info)
        .value("WARN", spdlog::level::warn)
        .value("ERROR", spdlog::level::err)
        .value("CRITICAL", spdlog::level::critical)
        .value("OFF", spdlog::level::off);

    m.def("parse_counter_argument_type", &rebut::parseCounterArgumentType);
    m.def("parse_argument_strength", &rebut::parseArgumentStrength);

    // ── ArgumentationFramework ──
    py::class_<rebut::ArgumentationFramework>(m, "ArgumentationFramework")
        .def(py::init<>())
        .def("add_node", &rebut::ArgumentationFramework::addNode,
             py::arg("ref"), py::arg("label") = "")
        .def("ensure_node", &rebut::ArgumentationFramework::ensureNode,
             py::arg("ref"), py::arg("label") = "")
        .def("add_attack", &rebut::ArgumentationFramework::addAttack)
        .def("contains", &rebut::ArgumentationFramework::contains)
        .def("nodes", &rebut::ArgumentationFramework::nodes)
        .def("node_count", &rebut::ArgumentationFramework::nodeCount)
        .def("attack_count", &rebut::ArgumentationFramework::attackCount)
        .def("attackers_of", &rebut::ArgumentationFramework::attackersOf)
        .def("attacked_by", &rebut::ArgumentationFramework::attackedBy)
        .def("label", &rebut::ArgumentationFramework::label);

    // ── Extension ──
    py::class_<rebut::Extension>(m, "Extension")
        .def(py::init<>())
        .def_readwrite("kind", &rebut::Extension::kind)
        .def_readwrite("members", &rebut::Extension::members)
        .def("contains", &rebut::Extension::contains)
        .def("__len__", &rebut::Extension::size);

    // ── Labelling ──
    py::class_<rebut::Labelling>(m, "Labelling")
        .def(py::init<>())
        .def_static("from_extension", &rebut::Labelling::fromExtension,
                    py::arg("framework"), py::arg("extension"))
        .def("set", &rebut::Labelling::set)
        .def("get", &rebut::Labelling::get)
        .def("in_set", &rebut::Labelling::inSet)
        .def("out_set", &rebut::Labelling::outSet)
        .def("undec_set", &rebut::Labelling::undecSet)
        .def("is_legal", &rebut::Labelling::isLegal)
        .def("to_extension", &rebut::Labelling::toExtension,
             py::arg("kind") = rebut::ExtensionKind::COMPLETE)
        .def("__len__", &rebut::Labelling::size);

    // ── CalculatorConfig ──
    py::class_<rebut::CalculatorConfig>(m, "CalculatorConfig")
        .def(py::init<>())
        .def_readwrite("max_enumeration_nodes", &rebut::CalculatorConfig::max_enumeration_nodes)
        .def_readwrite("max_search_steps", &rebut::CalculatorConfig::max_search_steps)
        .def_readwrite("budget_seconds", &rebut::CalculatorConfig::budget_seconds);

    // ── ExtensionCalculator ──
    // keep_alive: the calculator borrows the framework
    py::class_<rebut::ExtensionCalculator>(m, "ExtensionCalculator")
        .def(py::init<const rebut::ArgumentationFramework&, rebut::CalculatorConfig>(),
             py::arg("framework"), py::arg("config") = rebut::CalculatorConfig{},
             py::keep_alive<1, 2>())
        .def("characteristic", &rebut::ExtensionCalculator::characteristic)
        .def("grounded", &rebut::ExtensionCalculator::grounded)
        .def("grounded_labelling", &rebut::ExtensionCalculator::groundedLabelling)
        .def("complete_extensions", &rebut::ExtensionCalculator::completeExtensions)
        .def("try_complete_extensions", &rebut::ExtensionCalculator::tryCompleteExtensions)
        .def("can_enumerate", &rebut::ExtensionCalculator::canEnumerate)
        .def("is_conflict_free", &rebut::ExtensionCalculator::isConflictFree)
        .def("is_admissible", &rebut::ExtensionCalculator::isAdmissible)
        .def("is_complete", &rebut::ExtensionCalculator::isComplete)
        .def("is_credulously_accepted", &rebut::ExtensionCalculator::isCredulouslyAccepted)
        .def("is_skeptically_accepted", &rebut::ExtensionCalculator::isSkepticallyAccepted);

    // ── Results ──
    py::class_<rebut::ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readwrite("is_valid_attack", &rebut::ValidationResult::is_valid_attack)
        .def_readwrite("original_survives", &rebut::ValidationResult::original_survives)
        .def_readwrite("counter_succeeds", &rebut::ValidationResult::counter_succeeds)
        .def_readwrite("logical_consistency", &rebut::ValidationResult::logical_consistency)
        .def_readwrite("formal_representation", &rebut::ValidationResult::formal_representation)
        .def_readwrite("grounded_extension", &rebut::ValidationResult::grounded_extension)
        .def_readwrite("complete_extensions", &rebut::ValidationResult::complete_extensions)
        .def_readwrite("mode", &rebut::ValidationResult::mode);

    py::class_<rebut::StrengthReport>(m, "StrengthReport")
        .def(py::init<>())
        .def_readwrite("score", &rebut::StrengthReport::score)
        .def_readwrite("mode", &rebut::StrengthReport::mode);

    // ── Engine ──
    py::class_<rebut::CounterArgument>(m, "CounterArgument")
        .def(py::init<>())
        .def(py::init<rebut::CounterArgumentType, rebut::ArgumentStrength>(),
             py::arg("type"), py::arg("strength") = rebut::ArgumentStrength::MODERATE)
        .def_readwrite("type", &rebut::CounterArgument::type)
        .def_readwrite("strength", &rebut::CounterArgument::strength);

    py::class_<rebut::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("calculator", &rebut::EngineConfig::calculator)
        .def_readwrite("formal_validation", &rebut::EngineConfig::formal_validation)
        .def_readwrite("include_formal_representation",
                       &rebut::EngineConfig::include_formal_representation);

    py::class_<rebut::ArgumentationEngine>(m, "ArgumentationEngine")
        .def(py::init<rebut::EngineConfig>(), py::arg("config") = rebut::EngineConfig{})
        .def("validate_counter_argument", &rebut::ArgumentationEngine::validateCounterArgument)
        .def("assess_argument_strength", &rebut::ArgumentationEngine::assessArgumentStrength)
        .def("generate_attack_graph", &rebut::ArgumentationEngine::generateAttackGraph);

    m.def("set_log_level", &rebut::setLogLevel, py::arg("level"));
    m.def("set_log_level", [](const std::string& level) {
        rebut::setLogLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
