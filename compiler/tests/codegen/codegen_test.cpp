//! # Code Generator Tests
//!
//! Statement mapping across all five targets, service registry lookup,
//! value rendering and the failure paths for expression forms the generator
//! does not handle.

#include "codegen/codegen.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace talkpp;
using namespace talkpp::codegen;
using talkpp::parser::Program;

namespace {

auto parse_program(const std::string& code) -> Program {
    auto tokens = lexer::tokenize(code);
    EXPECT_TRUE(is_ok(tokens));
    if (is_err(tokens)) {
        return {};
    }
    auto program = parser::parse(std::move(unwrap(tokens)));
    EXPECT_TRUE(is_ok(program));
    if (is_err(program)) {
        return {};
    }
    return std::move(unwrap(program));
}

auto config_for(TargetLanguage language, bool debug_mode = true) -> CodegenConfig {
    return CodegenConfig{.target_language = language,
                         .optimization_level = OptimizationLevel::Debug,
                         .debug_mode = debug_mode};
}

auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

class CodeGenTest : public ::testing::Test {
protected:
    auto gen(const std::string& code, TargetLanguage language, bool debug_mode = true)
        -> std::string {
        auto program = parse_program(code);
        auto result = generate(program, config_for(language, debug_mode));
        EXPECT_TRUE(is_ok(result)) << to_string(unwrap_err(result));
        if (is_err(result)) {
            return {};
        }
        return unwrap(result);
    }

    auto gen_error(const Program& program, TargetLanguage language = TargetLanguage::Rust)
        -> CompilerError {
        auto result = generate(program, config_for(language));
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return InternalError{"generation succeeded"};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Every Target
// ============================================================================

class AllTargetsTest : public CodeGenTest,
                       public ::testing::WithParamInterface<TargetLanguage> {};

TEST_P(AllTargetsTest, SendGridActionHasHandlerAndStub) {
    auto output = gen("if new user registers then validate email using SendGrid", GetParam());
    ASSERT_FALSE(output.empty());
    EXPECT_TRUE(contains(output, "handler")) << output;
    EXPECT_TRUE(contains(output, "async")) << output;
    EXPECT_TRUE(contains(output, "send_email_sendgrid")) << output;
    EXPECT_TRUE(contains(output, "new_user_registers")) << output;
    EXPECT_TRUE(contains(output, "SendGrid email integration")) << output;
}

TEST_P(AllTargetsTest, UnregisteredServiceFallsBackToWarning) {
    auto output = gen("send report using Mailchimp", GetParam());
    EXPECT_TRUE(contains(output, "WARNING: service 'Mailchimp' is not registered")) << output;
    EXPECT_FALSE(contains(output, "send_email_sendgrid"));
}

TEST_P(AllTargetsTest, BindingsKeepHandlerNamesIntact) {
    auto output = gen("x: 1\nx: 2\nevent: 5\nif user registers then send hi", GetParam());
    EXPECT_FALSE(contains(output, "event = 5")) << output;
    EXPECT_TRUE(contains(output, "user_registers")) << output;
}

TEST_P(AllTargetsTest, OutputIsDeterministic) {
    auto code = "if a b and c d then send x using Twilio else store y using Postgres\n"
                "limit: 10\nname: \"n\"\nratio: 2.5\nref: other\nnotify team";
    auto first = gen(code, GetParam());
    auto second = gen(code, GetParam());
    EXPECT_EQ(first, second);
}

TEST_P(AllTargetsTest, BannerNamesTarget) {
    auto output = gen("", GetParam());
    EXPECT_TRUE(contains(output, "Generated by Talk++ 0.2.0 (target: " +
                                     std::string(target_language_name(GetParam())) + ")"))
        << output;
}

TEST_P(AllTargetsTest, EveryStatementKindGenerates) {
    auto output = gen("when payment fails from gateway then send alert using Twilio, "
                      "notify ops else store order using PostgreSQL\n"
                      "retries: 3\nowner: team\ntrigger",
                      GetParam());
    EXPECT_TRUE(contains(output, "send_sms_twilio"));
    EXPECT_TRUE(contains(output, "execute_postgres_query"));
    EXPECT_TRUE(contains(output, "Custom action: notify"));
    EXPECT_TRUE(contains(output, "Trigger action"));
    EXPECT_TRUE(contains(output, "unresolved reference: team"));
    EXPECT_TRUE(contains(output, "payment_fails"));
}

TEST_P(AllTargetsTest, StubsFollowRegistryOrder) {
    auto output = gen("store row using PostgreSQL\nsend text using Twilio\nsend mail using SendGrid",
                      GetParam());
    auto sendgrid = output.find("SendGrid email integration");
    auto twilio = output.find("Twilio SMS integration");
    auto postgres = output.find("PostgreSQL database integration");
    ASSERT_NE(sendgrid, std::string::npos);
    ASSERT_NE(twilio, std::string::npos);
    ASSERT_NE(postgres, std::string::npos);
    EXPECT_LT(sendgrid, twilio);
    EXPECT_LT(twilio, postgres);
}

TEST_P(AllTargetsTest, PropertyValueIsUnsupported) {
    Program program;
    SourceSpan span{};
    auto object = parser::make_ident_expr("user", span);
    program.statements.push_back(parser::make_assignment_stmt(
        "email", parser::make_property_expr(std::move(object), "email", span), span));

    auto error = gen_error(program, GetParam());
    ASSERT_TRUE(error.is<UnsupportedFeature>());
    EXPECT_EQ(error.as<UnsupportedFeature>().feature, "property access");
}

INSTANTIATE_TEST_SUITE_P(Targets, AllTargetsTest, ::testing::ValuesIn(ALL_TARGET_LANGUAGES),
                         [](const ::testing::TestParamInfo<TargetLanguage>& info) {
                             return std::string(target_language_name(info.param));
                         });

// ============================================================================
// Rust
// ============================================================================

TEST_F(CodeGenTest, RustConditionalWithServiceCall) {
    auto output = gen("if new user registers then validate email using SendGrid",
                      TargetLanguage::Rust);

    EXPECT_TRUE(contains(output, "async fn send_email_sendgrid(target: &str) -> Result<(), String> {"));
    EXPECT_TRUE(contains(output, "pub async fn handler(event: Event) -> Response {\n"
                                 "    tracing::info!(\"Handler invoked with event: {:?}\", event);\n"));
    EXPECT_TRUE(contains(output,
                         "    if event.data.get(\"type\").and_then(|v| v.as_str()) == "
                         "Some(\"new_user_registers\") {\n"
                         "        // SendGrid email integration\n"
                         "        tracing::info!(\"Sending email via SendGrid\");\n"
                         "        if let Err(e) = send_email_sendgrid(\"email\").await {\n"
                         "            tracing::error!(\"Failed to send email: {}\", e);\n"
                         "            return Response::error(\"Failed to send email\");\n"
                         "        }\n"
                         "    }\n"));
    EXPECT_TRUE(contains(output, "Response::success(serde_json::json!({\"status\": \"completed\"}))"));
}

TEST_F(CodeGenTest, RustDebugModeAddsBootstrap) {
    auto debug = gen("send x", TargetLanguage::Rust, true);
    auto release = gen("send x", TargetLanguage::Rust, false);

    EXPECT_TRUE(contains(debug, "#[tokio::main]"));
    EXPECT_TRUE(contains(debug, "tracing_subscriber::fmt::init();"));
    EXPECT_FALSE(contains(release, "#[tokio::main]"));
    EXPECT_FALSE(contains(release, "Handler invoked with event"));
    EXPECT_TRUE(contains(release, "pub async fn handler(event: Event) -> Response {"));
}

TEST_F(CodeGenTest, DebugModeOnlyAffectsRust) {
    for (auto language : {TargetLanguage::Python, TargetLanguage::JavaScript,
                          TargetLanguage::TypeScript, TargetLanguage::Bash}) {
        EXPECT_EQ(gen("send x using Twilio", language, true),
                  gen("send x using Twilio", language, false))
            << target_language_name(language);
    }
}

TEST_F(CodeGenTest, RustElseBlockAndLogical) {
    auto output = gen("if a b or c d then send x else store y", TargetLanguage::Rust);
    EXPECT_TRUE(contains(output, "if (event.data.get(\"type\").and_then(|v| v.as_str()) == "
                                 "Some(\"a_b\")) || (event.data.get(\"type\").and_then(|v| "
                                 "v.as_str()) == Some(\"c_d\")) {"));
    EXPECT_TRUE(contains(output, "        // Send action: x\n    } else {\n        // Store action: y\n    }\n"));
}

TEST_F(CodeGenTest, RustAssignments) {
    auto output = gen("count: 42\nname: \"Ada\"\nratio: 3.0\ntype: 1\nref: other",
                      TargetLanguage::Rust);
    EXPECT_TRUE(contains(output, "    let count = 42_i64;\n"));
    EXPECT_TRUE(contains(output, "    let name = \"Ada\";\n"));
    EXPECT_TRUE(contains(output, "    let ratio = 3.0;\n"));
    EXPECT_TRUE(contains(output, "    let r#type = 1_i64;\n"));
    EXPECT_TRUE(contains(output, "    // unresolved reference: other\n"
                                 "    let r#ref: Option<Value> = None;\n"));
}

TEST_F(CodeGenTest, RustEmptyThenBlock) {
    auto output = gen("if user registers then", TargetLanguage::Rust);
    EXPECT_TRUE(contains(output, "Some(\"user_registers\") {\n    }\n"));
}

// ============================================================================
// Python
// ============================================================================

TEST_F(CodeGenTest, PythonServiceCall) {
    auto output = gen("send welcome message using Twilio", TargetLanguage::Python);
    EXPECT_TRUE(contains(output, "async def send_sms_twilio(target: str) -> None:"));
    EXPECT_TRUE(contains(output, "async def handler(event: Event) -> Response:"));
    EXPECT_TRUE(contains(output, "    # Twilio SMS integration\n"
                                 "    logger.info(\"Sending SMS via Twilio\")\n"
                                 "    try:\n"
                                 "        await send_sms_twilio(\"welcome message\")\n"
                                 "    except Exception as e:\n"
                                 "        logger.error(\"Failed to send SMS: %s\", e)\n"
                                 "        return Response.error(\"Failed to send SMS\")\n"));
    EXPECT_TRUE(contains(output, "return Response.ok({\"status\": \"completed\"})"));
    EXPECT_TRUE(contains(output, "if __name__ == \"__main__\":"));
}

TEST_F(CodeGenTest, PythonEmptyBlocksUsePass) {
    auto output = gen("if user registers then else", TargetLanguage::Python);
    EXPECT_TRUE(contains(output, "    if event.data.get(\"type\") == \"user_registers\":\n"
                                 "        pass\n"
                                 "    else:\n"
                                 "        pass\n"));
}

TEST_F(CodeGenTest, PythonPlaceholderAndValues) {
    auto output = gen("validate input\nclass: \"gold\"\nlimit: 7", TargetLanguage::Python);
    EXPECT_TRUE(contains(output, "    # Validate action: input\n    pass\n"));
    EXPECT_TRUE(contains(output, "    class_ = \"gold\"\n"));
    EXPECT_TRUE(contains(output, "    limit = 7\n"));
}

TEST_F(CodeGenTest, PythonLogicalUsesKeywords) {
    auto output = gen("if a b and c d then trigger", TargetLanguage::Python);
    EXPECT_TRUE(contains(output, "if (event.data.get(\"type\") == \"a_b\") and "
                                 "(event.data.get(\"type\") == \"c_d\"):"));
}

// ============================================================================
// JavaScript and TypeScript
// ============================================================================

TEST_F(CodeGenTest, JavaScriptHandler) {
    auto output = gen("if order ships then store order using Postgres", TargetLanguage::JavaScript);
    EXPECT_TRUE(contains(output, "'use strict';"));
    EXPECT_TRUE(contains(output, "async function execute_postgres_query(target) {"));
    EXPECT_TRUE(contains(output, "async function handler(event) {"));
    EXPECT_TRUE(contains(output, "  if ((event.data || {}).type === \"order_ships\") {\n"
                                 "    // PostgreSQL database integration\n"
                                 "    console.info(\"Executing database operation\");\n"
                                 "    try {\n"
                                 "      await execute_postgres_query(\"order\");\n"
                                 "    } catch (e) {\n"));
    EXPECT_TRUE(contains(output, "return Response.error(\"Database operation failed\");"));
    EXPECT_TRUE(contains(output, "module.exports = { Event, Response, handler };"));
}

TEST_F(CodeGenTest, JavaScriptLargeIntegersBecomeBigInt) {
    auto output = gen("small: 9007199254740991\nbig: 9007199254740992", TargetLanguage::JavaScript);
    EXPECT_TRUE(contains(output, "let small = 9007199254740991;"));
    EXPECT_TRUE(contains(output, "let big = 9007199254740992n;"));
}

TEST_F(CodeGenTest, JavaScriptReservedWords) {
    auto output = gen("new: 1\nthis: other", TargetLanguage::JavaScript);
    EXPECT_TRUE(contains(output, "let new_ = 1;"));
    EXPECT_TRUE(contains(output, "let this_ = null;"));
}

// ============================================================================
// Bindings
// ============================================================================

TEST_F(CodeGenTest, RebindingReassignsInsteadOfRedeclaring) {
    const std::string code = "x: 1\nx: 2\ny: other\ny: other";

    EXPECT_TRUE(contains(gen(code, TargetLanguage::JavaScript),
                         "  let x = 1;\n  x = 2;\n"
                         "  // unresolved reference: other\n  let y = null;\n"
                         "  // unresolved reference: other\n  y = null;\n"));
    EXPECT_TRUE(contains(gen(code, TargetLanguage::TypeScript),
                         "  let x = 1;\n  x = 2;\n"
                         "  // unresolved reference: other\n  let y: unknown = null;\n"
                         "  // unresolved reference: other\n  y = null;\n"));
    EXPECT_TRUE(contains(gen(code, TargetLanguage::Python),
                         "    x = 1\n    x = 2\n"
                         "    # unresolved reference: other\n    y = None\n"
                         "    # unresolved reference: other\n    y = None\n"));
    EXPECT_TRUE(contains(gen(code, TargetLanguage::Rust),
                         "    let x = 1_i64;\n    let x = 2_i64;\n"));
    EXPECT_TRUE(contains(gen(code, TargetLanguage::Bash), "    local x=1\n    local x=2\n"));
}

TEST_F(CodeGenTest, RebindingIsTrackedPerGeneration) {
    auto program = parse_program("x: 1");
    CodeGen codegen(config_for(TargetLanguage::JavaScript));
    auto first = codegen.generate(program);
    auto second = codegen.generate(program);
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_TRUE(contains(unwrap(second), "  let x = 1;\n"));
}

TEST_F(CodeGenTest, HandlerNamesAreEscaped) {
    auto rust = gen("event: 5\nhandler: 1\nsend_sms_twilio: 2", TargetLanguage::Rust);
    EXPECT_TRUE(contains(rust, "    let event_ = 5_i64;\n"));
    EXPECT_TRUE(contains(rust, "    let handler_ = 1_i64;\n"));
    EXPECT_TRUE(contains(rust, "    let send_sms_twilio_ = 2_i64;\n"));

    auto python = gen("event: 5\nlogger: 1\ne: 2\nexecute_postgres_query: 3",
                      TargetLanguage::Python);
    EXPECT_TRUE(contains(python, "    event_ = 5\n"));
    EXPECT_TRUE(contains(python, "    logger_ = 1\n"));
    EXPECT_TRUE(contains(python, "    e_ = 2\n"));
    EXPECT_TRUE(contains(python, "    execute_postgres_query_ = 3\n"));
    EXPECT_TRUE(contains(python, "    logger.info(\"Handler invoked with event: %s\", event)\n"));

    for (auto language : {TargetLanguage::JavaScript, TargetLanguage::TypeScript}) {
        auto output = gen("event: 5\nconsole: 1\nsend_email_sendgrid: 2", language);
        EXPECT_TRUE(contains(output, "  let event_ = 5;\n")) << output;
        EXPECT_TRUE(contains(output, "  let console_ = 1;\n")) << output;
        EXPECT_TRUE(contains(output, "  let send_email_sendgrid_ = 2;\n")) << output;
    }

    auto bash = gen("respond: 1\nevent_type: 2", TargetLanguage::Bash);
    EXPECT_TRUE(contains(bash, "    local respond_=1\n"));
    EXPECT_TRUE(contains(bash, "    local event_type_=2\n"));
}

TEST_F(CodeGenTest, EscapedNameIsReboundUnderItsEscapedForm) {
    auto output = gen("event: 1\nevent: 2", TargetLanguage::JavaScript);
    EXPECT_TRUE(contains(output, "  let event_ = 1;\n  event_ = 2;\n"));
}

TEST_F(CodeGenTest, TypeScriptTypesAndExports) {
    auto output = gen("send welcome using SendGrid\nlater: pending", TargetLanguage::TypeScript);
    EXPECT_TRUE(contains(output, "export interface Event"));
    EXPECT_TRUE(contains(output, "async function send_email_sendgrid(target: string): Promise<void> {"));
    EXPECT_TRUE(contains(output, "export async function handler(event: Event): Promise<Response> {"));
    EXPECT_TRUE(contains(output, "let later: unknown = null;"));
    EXPECT_FALSE(contains(output, "module.exports"));
}

TEST_F(CodeGenTest, TypeScriptEventTest) {
    auto output = gen("if user registers then trigger", TargetLanguage::TypeScript);
    EXPECT_TRUE(contains(output, "if (event.data[\"type\"] === \"user_registers\") {"));
}

// ============================================================================
// Bash
// ============================================================================

TEST_F(CodeGenTest, BashScriptLayout) {
    auto output = gen("if new user registers then validate email using SendGrid",
                      TargetLanguage::Bash);
    EXPECT_EQ(output.rfind("#!/usr/bin/env bash\n", 0), 0u);
    EXPECT_TRUE(contains(output, "set -euo pipefail"));
    EXPECT_TRUE(contains(output, "send_email_sendgrid() {"));
    EXPECT_TRUE(contains(output, "# async handler entry point\nhandler() {"));
    EXPECT_TRUE(contains(output, "    if [[ \"$(event_type)\" == 'new_user_registers' ]]; then\n"
                                 "        # SendGrid email integration\n"
                                 "        echo 'INFO: Sending email via SendGrid' >&2\n"
                                 "        if ! send_email_sendgrid 'email'; then\n"));
    EXPECT_TRUE(contains(output, "respond false 'Failed to send email'"));
    EXPECT_TRUE(contains(output, "respond true 'Function executed successfully'"));
}

TEST_F(CodeGenTest, BashQuotingAndEmptyBlocks) {
    auto output = gen("note: \"it's\"\nline: \"a\\nb\"\nif a b then", TargetLanguage::Bash);
    EXPECT_TRUE(contains(output, "    local note='it'\\''s'\n"));
    EXPECT_TRUE(contains(output, "    local line=$'a\\nb'\n"));
    EXPECT_TRUE(contains(output, "then\n        :\n    fi\n"));
}

TEST_F(CodeGenTest, BashUnknownServiceWarnsOnStderr) {
    auto output = gen("send report using Mailchimp", TargetLanguage::Bash);
    EXPECT_TRUE(contains(output, "echo 'WARN: Service Mailchimp not implemented' >&2"));
}

// ============================================================================
// Hand-built Trees
// ============================================================================

TEST_F(CodeGenTest, ComparisonConditionsUseNativeOperators) {
    SourceSpan span{};
    auto make_program = [&] {
        Program program;
        parser::ConditionalStatement cond{
            .condition = parser::make_comparison_condition(parser::make_ident_expr("count", span),
                                                           parser::ComparisonOp::GreaterThan,
                                                           parser::make_int_expr(5, span), span),
            .then_actions = {},
            .else_actions = std::nullopt,
            .span = span};
        program.statements.push_back(parser::make_conditional_stmt(std::move(cond)));
        return program;
    };

    auto rust = generate(make_program(), config_for(TargetLanguage::Rust));
    ASSERT_TRUE(is_ok(rust));
    EXPECT_TRUE(contains(unwrap(rust), "if count > 5_i64 {"));

    auto bash = generate(make_program(), config_for(TargetLanguage::Bash));
    ASSERT_TRUE(is_ok(bash));
    EXPECT_TRUE(contains(unwrap(bash), "if [[ \"${count}\" -gt 5 ]]; then"));
}

TEST_F(CodeGenTest, EqualityUsesStrictOperatorInJavaScript) {
    SourceSpan span{};
    Program program;
    parser::ConditionalStatement cond{
        .condition = parser::make_comparison_condition(parser::make_ident_expr("status", span),
                                                       parser::ComparisonOp::NotEqual,
                                                       parser::make_string_expr("done", span),
                                                       span),
        .then_actions = {},
        .else_actions = std::nullopt,
        .span = span};
    program.statements.push_back(parser::make_conditional_stmt(std::move(cond)));

    auto result = generate(program, config_for(TargetLanguage::JavaScript));
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(contains(unwrap(result), "if (status !== \"done\") {"));
}

TEST_F(CodeGenTest, BoolAssignmentAndComment) {
    SourceSpan span{};
    Program program;
    program.statements.push_back(parser::make_comment_stmt("first line\nsecond", span));
    program.statements.push_back(
        parser::make_assignment_stmt("active", parser::make_bool_expr(true, span), span));

    auto python = generate(program, config_for(TargetLanguage::Python));
    ASSERT_TRUE(is_ok(python));
    EXPECT_TRUE(contains(unwrap(python), "    # first line second\n    active = True\n"));
}

TEST_F(CodeGenTest, FunctionCallTargetIsUnsupported) {
    SourceSpan span{};
    Program program;
    parser::ActionStatement action{.action = parser::Action{.kind = parser::ActionKind::Send},
                                   .target = parser::make_function_call_expr("build", {}, span),
                                   .service = std::nullopt,
                                   .parameters = {},
                                   .span = span};
    program.statements.push_back(parser::make_action_stmt(std::move(action)));

    auto error = gen_error(program, TargetLanguage::Python);
    ASSERT_TRUE(error.is<UnsupportedFeature>());
    EXPECT_EQ(error.as<UnsupportedFeature>().feature, "function call");
    EXPECT_EQ(to_string(error), "Unsupported feature: function call");
}

TEST_F(CodeGenTest, UnsupportedInsideConditionStopsGeneration) {
    SourceSpan span{};
    Program program;
    std::vector<parser::Expr> args;
    args.push_back(parser::make_int_expr(1, span));
    parser::ConditionalStatement cond{
        .condition = parser::make_comparison_condition(
            parser::make_function_call_expr("len", std::move(args), span),
            parser::ComparisonOp::Equal, parser::make_int_expr(0, span), span),
        .then_actions = {},
        .else_actions = std::nullopt,
        .span = span};
    program.statements.push_back(parser::make_conditional_stmt(std::move(cond)));

    auto error = gen_error(program);
    EXPECT_TRUE(error.is<UnsupportedFeature>());
}

TEST_F(CodeGenTest, NonFiniteFloatIsCodeGenError) {
    SourceSpan span{};
    Program program;
    program.statements.push_back(parser::make_assignment_stmt(
        "x", parser::make_float_expr(std::numeric_limits<double>::infinity(), span), span));

    auto error = gen_error(program);
    ASSERT_TRUE(error.is<CodeGenError>());
    EXPECT_EQ(error.message(), "Float literal is not finite");
}

// ============================================================================
// Warnings
// ============================================================================

class CodeGenLogTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<log::LogRecord>> records_;

    void SetUp() override {
        auto sink = std::make_unique<log::MemorySink>();
        records_ = sink->storage();
        log::Logger::instance().reset();
        log::Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        log::Logger::instance().reset();
    }
};

TEST_F(CodeGenLogTest, UnregisteredServiceLogsWarning) {
    auto program = parse_program("send report using Mailchimp");
    auto result = generate(program, config_for(TargetLanguage::Rust));
    ASSERT_TRUE(is_ok(result));

    ASSERT_EQ(records_->size(), 1u);
    EXPECT_EQ((*records_)[0].level, log::LogLevel::Warn);
    EXPECT_EQ((*records_)[0].module, "codegen");
    EXPECT_EQ((*records_)[0].message, "Service 'Mailchimp' is not registered");
}

TEST_F(CodeGenLogTest, RegisteredServiceLogsNothingAtWarn) {
    auto program = parse_program("send report using SendGrid");
    auto result = generate(program, config_for(TargetLanguage::Rust));
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(records_->empty());
}

// ============================================================================
// Registry and Helpers
// ============================================================================

TEST(ServiceRegistryTest, LookupIsCaseInsensitive) {
    const auto* service = lookup_service("SendGrid");
    ASSERT_NE(service, nullptr);
    EXPECT_EQ(service->stub, "send_email_sendgrid");
    EXPECT_EQ(lookup_service("SENDGRID"), service);
    EXPECT_EQ(lookup_service("sendgrid"), service);
}

TEST(ServiceRegistryTest, PostgresAlias) {
    const auto* full = lookup_service("PostgreSQL");
    ASSERT_NE(full, nullptr);
    EXPECT_EQ(lookup_service("Postgres"), full);
    EXPECT_EQ(full->stub, "execute_postgres_query");
}

TEST(ServiceRegistryTest, UnknownService) {
    EXPECT_EQ(lookup_service("Mailchimp"), nullptr);
    EXPECT_EQ(lookup_service(""), nullptr);
}

TEST(ServiceRegistryTest, Order) {
    auto registry = service_registry();
    ASSERT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry[0].key, "sendgrid");
    EXPECT_EQ(registry[1].key, "twilio");
    EXPECT_EQ(registry[2].key, "postgresql");
    EXPECT_EQ(service_index(registry[2]), 2u);
}

TEST(CollectServicesTest, DeduplicatesAcrossBlocks) {
    auto program = parse_program("send a using Twilio\n"
                                 "if x y then send b using SendGrid else send c using Twilio2\n"
                                 "if p q then send d using TWILIO");
    auto services = collect_services(program);
    ASSERT_EQ(services.size(), 2u);
    EXPECT_EQ(services[0]->key, "sendgrid");
    EXPECT_EQ(services[1]->key, "twilio");
}

TEST(UnregisteredServicesTest, ListsActionsInProgramOrder) {
    auto program = parse_program("send a using Mailchimp\n"
                                 "if x y then send b using SendGrid else store c using Redis\n"
                                 "send d using Twilio");
    auto actions = unregistered_services(program);
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0]->service->name, "Mailchimp");
    EXPECT_EQ(actions[1]->service->name, "Redis");
}

TEST(ServiceRegistryTest, StubNames) {
    EXPECT_TRUE(is_service_stub("send_sms_twilio"));
    EXPECT_TRUE(is_service_stub("execute_postgres_query"));
    EXPECT_FALSE(is_service_stub("twilio"));
}

TEST(EventTagTest, JoinsSubjectWords) {
    auto condition = parser::make_event_condition("new user", "registers", std::string("web"), {});
    EXPECT_EQ(event_tag(condition.as<parser::EventCondition>()), "new_user_registers");
}

TEST(FormatFloatTest, ShortestRoundTrip) {
    EXPECT_EQ(format_float(0.5), "0.5");
    EXPECT_EQ(format_float(3.0), "3.0");
    EXPECT_EQ(format_float(-2.0), "-2.0");
    EXPECT_EQ(format_float(0.1), "0.1");
    EXPECT_EQ(format_float(1e300), "1e+300");
}

TEST(TargetTest, ParseNames) {
    EXPECT_EQ(parse_target_language("rust"), TargetLanguage::Rust);
    EXPECT_EQ(parse_target_language("PY"), TargetLanguage::Python);
    EXPECT_EQ(parse_target_language("js"), TargetLanguage::JavaScript);
    EXPECT_EQ(parse_target_language("TypeScript"), TargetLanguage::TypeScript);
    EXPECT_EQ(parse_target_language("sh"), TargetLanguage::Bash);
    EXPECT_FALSE(parse_target_language("cobol").has_value());
}

TEST(TargetTest, OptimizationLevels) {
    EXPECT_EQ(parse_optimization_level("release"), OptimizationLevel::Release);
    EXPECT_EQ(parse_optimization_level("SIZE"), OptimizationLevel::Size);
    EXPECT_FALSE(parse_optimization_level("fast").has_value());
    EXPECT_EQ(optimization_level_name(OptimizationLevel::Debug), "debug");
}

TEST(TargetTest, OptimizationLevelDoesNotChangeOutput) {
    auto program = parse_program("send x using SendGrid");
    auto debug = generate(program, CodegenConfig{.target_language = TargetLanguage::Rust,
                                                 .optimization_level = OptimizationLevel::Debug});
    auto size = generate(program, CodegenConfig{.target_language = TargetLanguage::Rust,
                                                .optimization_level = OptimizationLevel::Size});
    ASSERT_TRUE(is_ok(debug));
    ASSERT_TRUE(is_ok(size));
    EXPECT_EQ(unwrap(debug), unwrap(size));
}

TEST(CodeWriterTest, IndentsNonEmptyLines) {
    CodeWriter out("  ");
    out.line("a");
    out.indent();
    out.block("b\n\nc");
    out.dedent();
    out.dedent();
    out.line("d");
    EXPECT_EQ(out.str(), "a\n  b\n\n  c\nd\n");
}
