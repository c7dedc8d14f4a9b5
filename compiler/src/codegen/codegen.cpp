//! # Code Generator
//!
//! The shared traversal. Walks the program once, renders conditions and
//! values through the backend, and stops at the first error so no partial
//! output escapes.

#include "codegen/codegen.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <type_traits>
#include <variant>

namespace talkpp::codegen {

namespace {

// Visits every action statement, including those inside conditionals
template <typename F> void for_each_action(const parser::Program& program, F&& visit) {
    for (const auto& stmt : program.statements) {
        if (stmt.is<parser::ActionStatement>()) {
            visit(stmt.as<parser::ActionStatement>());
        } else if (stmt.is<parser::ConditionalStatement>()) {
            const auto& cond = stmt.as<parser::ConditionalStatement>();
            for (const auto& action : cond.then_actions) {
                visit(action);
            }
            if (cond.else_actions) {
                for (const auto& action : *cond.else_actions) {
                    visit(action);
                }
            }
        }
    }
}

// "send" -> "Send"
auto capitalize(std::string word) -> std::string {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}

} // anonymous namespace

// ============================================================================
// Free Functions
// ============================================================================

auto collect_services(const parser::Program& program) -> std::vector<const ServiceTemplate*> {
    auto registry = service_registry();
    std::vector<bool> used(registry.size(), false);

    for_each_action(program, [&](const parser::ActionStatement& action) {
        if (!action.service) {
            return;
        }
        if (const auto* service = lookup_service(action.service->name)) {
            used[service_index(*service)] = true;
        }
    });

    std::vector<const ServiceTemplate*> services;
    for (size_t i = 0; i < registry.size(); ++i) {
        if (used[i]) {
            services.push_back(&registry[i]);
        }
    }
    return services;
}

auto unregistered_services(const parser::Program& program)
    -> std::vector<const parser::ActionStatement*> {
    std::vector<const parser::ActionStatement*> actions;
    for_each_action(program, [&](const parser::ActionStatement& action) {
        if (action.service && !lookup_service(action.service->name)) {
            actions.push_back(&action);
        }
    });
    return actions;
}

auto event_tag(const parser::EventCondition& event) -> std::string {
    std::string tag = event.subject;
    std::replace(tag.begin(), tag.end(), ' ', '_');
    return tag + "_" + event.action;
}

auto generate(const parser::Program& program, const CodegenConfig& config)
    -> Result<std::string, CompilerError> {
    return CodeGen(config).generate(program);
}

// ============================================================================
// CodeGen
// ============================================================================

CodeGen::CodeGen(CodegenConfig config)
    : config_(config), backend_(create_backend(config.target_language)) {}

auto CodeGen::generate(const parser::Program& program) const
    -> Result<std::string, CompilerError> {
    TALKPP_LOG_DEBUG("codegen", "Generating " << target_language_name(config_.target_language)
                                              << " for " << program.statements.size()
                                              << " statements");

    CodeWriter out(backend_->indent_unit());
    backend_->emit_prelude(out, config_);

    for (const auto* service : collect_services(program)) {
        backend_->emit_service_stub(out, *service);
    }

    backend_->emit_handler_open(out, config_);
    BoundNames bound;
    for (const auto& stmt : program.statements) {
        if (auto err = emit_statement(out, bound, stmt)) {
            TALKPP_LOG_DEBUG("codegen", "Generation failed: " << to_string(*err));
            return *err;
        }
    }
    backend_->emit_handler_close(out);
    backend_->emit_epilogue(out, config_);

    return out.str();
}

auto CodeGen::emit_statement(CodeWriter& out, BoundNames& bound,
                             const parser::Stmt& stmt) const
    -> std::optional<CompilerError> {
    return std::visit(
        [&](const auto& s) -> std::optional<CompilerError> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, parser::ActionStatement>) {
                return emit_action(out, s);
            } else if constexpr (std::is_same_v<T, parser::ConditionalStatement>) {
                return emit_conditional(out, s);
            } else if constexpr (std::is_same_v<T, parser::AssignmentStatement>) {
                return emit_assignment(out, bound, s);
            } else {
                out.line(backend_->comment(s.text));
                return std::nullopt;
            }
        },
        stmt.kind);
}

auto CodeGen::emit_conditional(CodeWriter& out, const parser::ConditionalStatement& cond) const
    -> std::optional<CompilerError> {
    auto condition = render_condition(cond.condition);
    if (is_err(condition)) {
        return unwrap_err(condition);
    }

    out.line(backend_->if_open(unwrap(condition)));
    out.indent();
    if (auto err = emit_block(out, cond.then_actions)) {
        return err;
    }
    out.dedent();

    if (cond.else_actions) {
        out.line(backend_->else_line());
        out.indent();
        if (auto err = emit_block(out, *cond.else_actions)) {
            return err;
        }
        out.dedent();
    }

    if (auto close = backend_->block_close()) {
        out.line(*close);
    }
    return std::nullopt;
}

auto CodeGen::emit_block(CodeWriter& out,
                         const std::vector<parser::ActionStatement>& actions) const
    -> std::optional<CompilerError> {
    if (actions.empty()) {
        if (auto empty = backend_->empty_statement()) {
            out.line(*empty);
        }
        return std::nullopt;
    }

    for (const auto& action : actions) {
        if (auto err = emit_action(out, action)) {
            return err;
        }
    }
    return std::nullopt;
}

auto CodeGen::emit_action(CodeWriter& out, const parser::ActionStatement& action) const
    -> std::optional<CompilerError> {
    std::optional<std::string> target;
    if (action.target) {
        auto text = render_target_text(*action.target);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        target = std::move(unwrap(text));
    }

    if (action.service) {
        const auto& name = action.service->name;
        if (const auto* service = lookup_service(name)) {
            auto argument = backend_->string_literal(target.value_or(""));
            backend_->emit_service_call(out, *service, argument);
        } else {
            TALKPP_LOG_WARN("codegen", "Service '" << name << "' is not registered");
            backend_->emit_unknown_service(out, name);
        }
        return std::nullopt;
    }

    std::string text;
    if (action.action.kind == parser::ActionKind::Custom) {
        text = "Custom action: " + action.action.custom_name;
    } else {
        text = capitalize(action.action.name()) + " action";
    }
    if (target) {
        text += ": " + *target;
    }
    backend_->emit_placeholder(out, text);
    return std::nullopt;
}

auto CodeGen::emit_assignment(CodeWriter& out, BoundNames& bound,
                              const parser::AssignmentStatement& assign) const
    -> std::optional<CompilerError> {
    auto name = backend_->identifier(assign.variable);

    if (assign.value.is<parser::IdentExpr>()) {
        out.line(backend_->comment("unresolved reference: " +
                                   assign.value.as<parser::IdentExpr>().name));
        bool declared = !bound.insert(name).second;
        out.line(declared ? backend_->empty_rebinding(name) : backend_->empty_binding(name));
        return std::nullopt;
    }

    auto value = render_literal(assign.value);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    bool declared = !bound.insert(name).second;
    out.line(declared ? backend_->rebinding(name, unwrap(value))
                      : backend_->binding(name, unwrap(value)));
    return std::nullopt;
}

// ============================================================================
// Conditions and values
// ============================================================================

auto CodeGen::render_condition(const parser::Condition& cond) const
    -> Result<std::string, CompilerError> {
    if (cond.is<parser::EventCondition>()) {
        return backend_->event_test(event_tag(cond.as<parser::EventCondition>()));
    }

    if (cond.is<parser::ComparisonCondition>()) {
        const auto& cmp = cond.as<parser::ComparisonCondition>();
        auto left = render_operand(*cmp.left);
        if (is_err(left)) {
            return left;
        }
        auto right = render_operand(*cmp.right);
        if (is_err(right)) {
            return right;
        }
        return backend_->comparison(unwrap(left), cmp.op, unwrap(right));
    }

    const auto& logical = cond.as<parser::LogicalCondition>();
    auto left = render_condition(*logical.left);
    if (is_err(left)) {
        return left;
    }
    auto right = render_condition(*logical.right);
    if (is_err(right)) {
        return right;
    }
    return backend_->logical(unwrap(left), logical.op, unwrap(right));
}

auto CodeGen::render_operand(const parser::Expr& expr) const
    -> Result<std::string, CompilerError> {
    if (expr.is<parser::IdentExpr>()) {
        return backend_->variable_reference(expr.as<parser::IdentExpr>().name);
    }
    return render_literal(expr);
}

auto CodeGen::render_literal(const parser::Expr& expr) const
    -> Result<std::string, CompilerError> {
    return std::visit(
        [&](const auto& e) -> Result<std::string, CompilerError> {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, parser::StringExpr>) {
                return backend_->string_literal(e.value);
            } else if constexpr (std::is_same_v<T, parser::IntExpr>) {
                return backend_->int_literal(e.value);
            } else if constexpr (std::is_same_v<T, parser::FloatExpr>) {
                if (!std::isfinite(e.value)) {
                    return CompilerError{CodeGenError{"Float literal is not finite"}};
                }
                return backend_->float_literal(e.value);
            } else if constexpr (std::is_same_v<T, parser::BoolExpr>) {
                return backend_->bool_literal(e.value);
            } else if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return backend_->variable_reference(e.name);
            } else if constexpr (std::is_same_v<T, parser::PropertyExpr>) {
                return CompilerError{UnsupportedFeature{"property access"}};
            } else {
                return CompilerError{UnsupportedFeature{"function call"}};
            }
        },
        expr.kind);
}

// Plain text of an action target, passed to the stub as a string
auto CodeGen::render_target_text(const parser::Expr& expr) const
    -> Result<std::string, CompilerError> {
    return std::visit(
        [&](const auto& e) -> Result<std::string, CompilerError> {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return e.name;
            } else if constexpr (std::is_same_v<T, parser::StringExpr>) {
                return e.value;
            } else if constexpr (std::is_same_v<T, parser::IntExpr>) {
                return std::to_string(e.value);
            } else if constexpr (std::is_same_v<T, parser::FloatExpr>) {
                return format_float(e.value);
            } else if constexpr (std::is_same_v<T, parser::BoolExpr>) {
                return std::string(e.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, parser::PropertyExpr>) {
                return CompilerError{UnsupportedFeature{"property access"}};
            } else {
                return CompilerError{UnsupportedFeature{"function call"}};
            }
        },
        expr.kind);
}

} // namespace talkpp::codegen
