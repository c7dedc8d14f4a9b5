#include "codegen/services.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace talkpp::codegen {

namespace {

constexpr std::array<ServiceTemplate, 3> SERVICES = {{
    {.key = "sendgrid",
     .display_name = "SendGrid",
     .stub = "send_email_sendgrid",
     .banner = "SendGrid email integration",
     .start_message = "Sending email via SendGrid",
     .failure_message = "Failed to send email"},
    {.key = "twilio",
     .display_name = "Twilio",
     .stub = "send_sms_twilio",
     .banner = "Twilio SMS integration",
     .start_message = "Sending SMS via Twilio",
     .failure_message = "Failed to send SMS"},
    {.key = "postgresql",
     .display_name = "PostgreSQL",
     .stub = "execute_postgres_query",
     .banner = "PostgreSQL database integration",
     .start_message = "Executing database operation",
     .failure_message = "Database operation failed"},
}};

// Alternate spellings mapped to registry keys
constexpr std::array<std::pair<std::string_view, std::string_view>, 1> ALIASES = {{
    {"postgres", "postgresql"},
}};

} // anonymous namespace

auto service_registry() -> std::span<const ServiceTemplate> {
    return SERVICES;
}

auto lookup_service(std::string_view name) -> const ServiceTemplate* {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [alias, target] : ALIASES) {
        if (key == alias) {
            key = std::string(target);
            break;
        }
    }

    for (const auto& service : SERVICES) {
        if (service.key == key) {
            return &service;
        }
    }
    return nullptr;
}

auto service_index(const ServiceTemplate& service) -> size_t {
    return static_cast<size_t>(&service - SERVICES.data());
}

auto is_service_stub(std::string_view name) -> bool {
    return std::any_of(SERVICES.begin(), SERVICES.end(),
                       [name](const ServiceTemplate& service) { return service.stub == name; });
}

} // namespace talkpp::codegen
