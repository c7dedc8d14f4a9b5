//! # Service Registry
//!
//! The fixed table of integrations the generator knows how to call. Each
//! entry names a stub function that every target defines with the same name,
//! so generated programs differ only in surface syntax.
//!
//! | Service key               | Stub                     | Purpose        |
//! |---------------------------|--------------------------|----------------|
//! | `sendgrid`                | `send_email_sendgrid`    | Email delivery |
//! | `twilio`                  | `send_sms_twilio`        | SMS delivery   |
//! | `postgresql`, `postgres`  | `execute_postgres_query` | Database query |
//!
//! Lookup lower-cases the name, so `SendGrid` and `SENDGRID` both match.

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace talkpp::codegen {

/// One registry entry.
struct ServiceTemplate {
    std::string_view key;             ///< Lowercase registry key, e.g. "sendgrid".
    std::string_view display_name;    ///< "SendGrid".
    std::string_view stub;            ///< Stub function name shared by all targets.
    std::string_view banner;          ///< Comment above each use and definition.
    std::string_view start_message;   ///< Info log before the call.
    std::string_view failure_message; ///< Error response text when the call fails.
};

/// Registry in emission order.
auto service_registry() -> std::span<const ServiceTemplate>;

/// Finds a service by name, case-insensitively, including aliases.
auto lookup_service(std::string_view name) -> const ServiceTemplate*;

/// Position of an entry in the registry.
auto service_index(const ServiceTemplate& service) -> size_t;

/// Returns true if `name` is the stub function of any registry entry.
auto is_service_stub(std::string_view name) -> bool;

} // namespace talkpp::codegen
