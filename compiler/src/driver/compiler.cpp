#include "driver/compiler.hpp"

#include "codegen/codegen.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

namespace talkpp {

Compiler::Compiler(codegen::CodegenConfig config) : config_(config) {}

auto Compiler::parse(std::string_view source) const -> Result<parser::Program, CompilerError> {
    auto tokens = lexer::tokenize(source);
    if (is_err(tokens)) {
        return unwrap_err(tokens);
    }
    return parser::parse(std::move(unwrap(tokens)));
}

auto Compiler::generate(const parser::Program& program) const
    -> Result<std::string, CompilerError> {
    TALKPP_LOG_DEBUG("driver", "Compiling " << program.statements.size() << " statements for "
                                            << codegen::target_language_name(
                                                   config_.target_language));
    return codegen::generate(program, config_);
}

auto Compiler::check(const parser::Program& program) const -> Result<size_t, CompilerError> {
    auto output = generate(program);
    if (is_err(output)) {
        return unwrap_err(output);
    }
    return program.statements.size();
}

auto Compiler::compile(std::string_view source) const -> Result<std::string, CompilerError> {
    auto program = parse(source);
    if (is_err(program)) {
        return unwrap_err(program);
    }
    return generate(unwrap(program));
}

auto Compiler::check(std::string_view source) const -> Result<size_t, CompilerError> {
    auto program = parse(source);
    if (is_err(program)) {
        return unwrap_err(program);
    }
    return check(unwrap(program));
}

} // namespace talkpp
