#include "utils.hpp"

#include "codegen/codegen.hpp"
#include "codegen/services.hpp"
#include "diagnostic.hpp"
#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace talkpp::cli {

std::string output_extension(codegen::TargetLanguage language) {
    switch (language) {
    case codegen::TargetLanguage::Rust:
        return "rs";
    case codegen::TargetLanguage::Python:
        return "py";
    case codegen::TargetLanguage::JavaScript:
        return "js";
    case codegen::TargetLanguage::TypeScript:
        return "ts";
    case codegen::TargetLanguage::Bash:
        return "sh";
    }
    return "out";
}

std::string default_output_path(const std::string& input, codegen::TargetLanguage language) {
    fs::path path(input);
    path.replace_extension(output_extension(language));
    return path.string();
}

std::optional<lexer::Source> load_source(const std::string& path) {
    auto result = lexer::Source::from_file(path);
    if (is_err(result)) {
        get_diagnostic_emitter().emit_compiler_error(path, unwrap_err(result));
        return std::nullopt;
    }

    auto& source = unwrap(result);
    get_diagnostic_emitter().set_source_content(path, std::string(source.content()));
    TALKPP_LOG_DEBUG("cli", "Read " << source.length() << " bytes from " << path);
    return std::move(source);
}

std::optional<IoError> write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return IoError{.path = path, .message = std::strerror(errno)};
    }
    file << content;
    if (!file) {
        return IoError{.path = path, .message = "write failed"};
    }
    return std::nullopt;
}

void warn_unregistered_services(const std::string& path, const parser::Program& program) {
    for (const auto* action : codegen::unregistered_services(program)) {
        const auto& service = *action->service;
        get_diagnostic_emitter().warning(
            ErrorCodes::UNREGISTERED_SERVICE,
            "Service '" + service.name + "' is not registered", path, service.span,
            {"the generated handler logs a warning here instead of calling a stub"});
    }
}

void print_usage() {
    std::cout << "Talk++ Compiler " << VERSION << "\n\n";
    std::cout << "Usage: talkppc <command> [options] <file>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build     Compile a .tpp file to the target language\n";
    std::cout << "  check     Validate a file without writing output\n";
    std::cout << "  lex       Tokenize a file (debug)\n";
    std::cout << "  parse     Parse a file and print the syntax tree (debug)\n";
    std::cout << "  info      List targets and integrated services\n";
    std::cout << "\nBuild options:\n";
    std::cout << "  --target=<lang>            rust, python, javascript, typescript, bash\n";
    std::cout << "  --output=<path>, -o <path> Output file (default: input with target extension)\n";
    std::cout << "  --optimization=<level>     debug, release, size\n";
    std::cout << "  --debug                    Emit a runnable bootstrap (Rust)\n";
    std::cout << "  --no-debug                 Emit the handler only\n";
    std::cout << "\nLogging options:\n";
    std::cout << "  --log-level=<level>        trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>        Per-module levels, e.g. codegen=debug\n";
    std::cout << "  --log-file=<path>          Also write logs to a file\n";
    std::cout << "  --log-format=<fmt>         text or json\n";
    std::cout << "  -q, -v, -vv, -vvv          Quieter or more verbose output\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h       Show this help\n";
    std::cout << "  --version, -V    Show version\n";
}

void print_version() {
    std::cout << "talkppc " << VERSION << "\n";
}

void print_info() {
    std::cout << "Talk++ Compiler " << VERSION << "\n\n";
    std::cout << "Targets:\n";
    for (auto language : codegen::ALL_TARGET_LANGUAGES) {
        std::cout << "  " << codegen::target_language_name(language) << " (."
                  << output_extension(language) << ")\n";
    }
    std::cout << "\nServices:\n";
    for (const auto& service : codegen::service_registry()) {
        std::cout << "  " << service.display_name << " - " << service.banner << "\n";
    }
}

} // namespace talkpp::cli
