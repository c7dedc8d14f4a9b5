//! # Debug Commands
//!
//! This file implements the `talkppc lex`, `talkppc parse`, and
//! `talkppc check` commands.
//!
//! ## Usage
//!
//! ```bash
//! talkppc lex rules.tpp      # Show tokens
//! talkppc parse rules.tpp    # Show the syntax tree
//! talkppc check rules.tpp    # Validate without writing output
//! ```

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "driver/compiler.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <iostream>

namespace talkpp::cli {

int run_lex(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return EXIT_COMPILATION_ERROR;
    }

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();
    if (is_err(tokens)) {
        get_diagnostic_emitter().emit_compiler_error(path, CompilerError{unwrap_err(tokens)});
        return EXIT_COMPILATION_ERROR;
    }

    for (const auto& token : unwrap(tokens)) {
        std::cout << token.span.start.line << ":" << token.span.start.column << " "
                  << lexer::token_kind_to_string(token.kind);
        if (lexer::is_literal(token.kind) || token.kind == lexer::TokenKind::Identifier ||
            token.kind == lexer::TokenKind::Service) {
            std::cout << " `" << token.lexeme << "`";
        }
        std::cout << "\n";
    }

    TALKPP_LOG_INFO("lexer", "Lexed " << unwrap(tokens).size() << " tokens from " << path);
    return EXIT_SUCCESS_CODE;
}

int run_parse(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return EXIT_COMPILATION_ERROR;
    }

    auto program = Compiler().parse(source->content());
    if (is_err(program)) {
        get_diagnostic_emitter().emit_compiler_error(path, unwrap_err(program));
        return EXIT_COMPILATION_ERROR;
    }

    parser::print_program(std::cout, unwrap(program));
    TALKPP_LOG_INFO("parser", "Parsed " << unwrap(program).statements.size()
                                        << " statements from " << path);
    return EXIT_SUCCESS_CODE;
}

int run_check(const BuildOptions& options) {
    auto source = load_source(options.input);
    if (!source) {
        return EXIT_COMPILATION_ERROR;
    }

    Compiler compiler(options.config);
    auto program = compiler.parse(source->content());
    if (is_err(program)) {
        get_diagnostic_emitter().emit_compiler_error(options.input, unwrap_err(program));
        std::cout << "check failed: " << options.input << "\n";
        return EXIT_COMPILATION_ERROR;
    }
    warn_unregistered_services(options.input, unwrap(program));

    auto result = compiler.check(unwrap(program));
    if (is_err(result)) {
        get_diagnostic_emitter().emit_compiler_error(options.input, unwrap_err(result));
        std::cout << "check failed: " << options.input << "\n";
        return EXIT_COMPILATION_ERROR;
    }

    std::cout << "check passed: " << options.input << " (" << unwrap(result)
              << " statements)\n";
    return EXIT_SUCCESS_CODE;
}

} // namespace talkpp::cli
