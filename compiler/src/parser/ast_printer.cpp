//! # AST Printer
//!
//! Renders a program as an indented outline for `talkppc parse` and tests.
//! Each node is one line; children are indented two spaces deeper.

#include "parser/ast.hpp"

#include <sstream>

namespace talkpp::parser {

namespace {

class AstPrinter {
public:
    explicit AstPrinter(std::ostream& out) : out_(out) {}

    void print(const Program& program) {
        auto count = program.statements.size();
        line() << "Program (" << count << (count == 1 ? " statement)" : " statements)") << "\n";
        ++indent_;
        for (const auto& stmt : program.statements) {
            print_stmt(stmt);
        }
        --indent_;
    }

private:
    std::ostream& out_;
    int indent_ = 0;

    auto line() -> std::ostream& {
        for (int i = 0; i < indent_; ++i) {
            out_ << "  ";
        }
        return out_;
    }

    void print_stmt(const Stmt& stmt) {
        if (stmt.is<ActionStatement>()) {
            print_action(stmt.as<ActionStatement>());
        } else if (stmt.is<ConditionalStatement>()) {
            const auto& cond = stmt.as<ConditionalStatement>();
            line() << "Conditional\n";
            ++indent_;
            print_condition(cond.condition);
            print_block("Then", cond.then_actions);
            if (cond.else_actions) {
                print_block("Else", *cond.else_actions);
            }
            --indent_;
        } else if (stmt.is<AssignmentStatement>()) {
            const auto& assign = stmt.as<AssignmentStatement>();
            line() << "Assignment " << assign.variable << " = " << describe(assign.value) << "\n";
        } else {
            line() << "Comment \"" << stmt.as<CommentStatement>().text << "\"\n";
        }
    }

    void print_block(std::string_view label, const std::vector<ActionStatement>& actions) {
        line() << label << "\n";
        ++indent_;
        for (const auto& action : actions) {
            print_action(action);
        }
        --indent_;
    }

    void print_action(const ActionStatement& stmt) {
        line() << "Action " << stmt.action.name()
               << (stmt.action.kind == ActionKind::Custom ? " (custom)" : "") << "\n";
        ++indent_;
        if (stmt.target) {
            line() << "Target " << describe(*stmt.target) << "\n";
        }
        if (stmt.service) {
            line() << "Service " << stmt.service->name;
            if (stmt.service->method) {
                out_ << "." << *stmt.service->method;
            }
            out_ << "\n";
        }
        for (const auto& [key, value] : stmt.parameters) {
            line() << "Param " << key << " = " << describe(value) << "\n";
        }
        --indent_;
    }

    void print_condition(const Condition& condition) {
        if (condition.is<EventCondition>()) {
            const auto& event = condition.as<EventCondition>();
            line() << "Event subject=\"" << event.subject << "\" action=\"" << event.action
                   << "\"";
            if (event.context) {
                out_ << " context=\"" << *event.context << "\"";
            }
            out_ << "\n";
        } else if (condition.is<ComparisonCondition>()) {
            const auto& cmp = condition.as<ComparisonCondition>();
            line() << "Comparison " << describe(*cmp.left) << " " << comparison_op_symbol(cmp.op)
                   << " " << describe(*cmp.right) << "\n";
        } else {
            const auto& logical = condition.as<LogicalCondition>();
            line() << "Logical " << logical_op_name(logical.op) << "\n";
            ++indent_;
            print_condition(*logical.left);
            print_condition(*logical.right);
            --indent_;
        }
    }

    static auto describe(const Expr& expr) -> std::string {
        std::ostringstream oss;
        if (expr.is<IdentExpr>()) {
            oss << "Ident \"" << expr.as<IdentExpr>().name << "\"";
        } else if (expr.is<StringExpr>()) {
            oss << "String \"" << expr.as<StringExpr>().value << "\"";
        } else if (expr.is<IntExpr>()) {
            oss << "Int " << expr.as<IntExpr>().value;
        } else if (expr.is<FloatExpr>()) {
            oss << "Float " << expr.as<FloatExpr>().value;
        } else if (expr.is<BoolExpr>()) {
            oss << "Bool " << (expr.as<BoolExpr>().value ? "true" : "false");
        } else if (expr.is<PropertyExpr>()) {
            const auto& prop = expr.as<PropertyExpr>();
            oss << "Property (" << describe(*prop.object) << ")." << prop.property;
        } else {
            const auto& call = expr.as<FunctionCallExpr>();
            oss << "Call " << call.name << "(";
            for (size_t i = 0; i < call.args.size(); ++i) {
                oss << (i > 0 ? ", " : "") << describe(*call.args[i]);
            }
            oss << ")";
        }
        return oss.str();
    }
};

} // anonymous namespace

void print_program(std::ostream& out, const Program& program) {
    AstPrinter(out).print(program);
}

auto program_to_string(const Program& program) -> std::string {
    std::ostringstream oss;
    print_program(oss, program);
    return oss.str();
}

} // namespace talkpp::parser
