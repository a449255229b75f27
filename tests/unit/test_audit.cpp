// Audit Pipeline Tests (events, backends, logger, middleware)

#include <catch2/catch_test_macros.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "audit/audit_backend.hpp"
#include "audit/audit_event.hpp"
#include "audit/audit_logger.hpp"
#include "audit/audit_middleware.hpp"
#include "auth/principal.hpp"
#include "control/config.hpp"
#include "core/request_context.hpp"

using namespace warden;
using namespace warden::audit;
using json = nlohmann::json;

namespace {

// Backend that rejects every write
class FailingBackend final : public AuditBackend {
public:
    core::Status write(const StructuredAuditEvent&) override {
        ++attempts;
        return core::Status::failure(core::ErrorKind::AuditDelivery, "sink unavailable");
    }
    core::Status close() override { return core::Status::failure(core::ErrorKind::AuditDelivery, "close failed"); }
    std::string_view name() const noexcept override { return "failing"; }

    int attempts = 0;
};

struct LoggerFixture {
    LoggerFixture() {
        auto backend = std::make_unique<MemoryAuditBackend>();
        memory = backend.get();
        logger = std::make_shared<AuditLogger>();
        logger->add_backend(std::move(backend));
    }

    MemoryAuditBackend* memory = nullptr;
    std::shared_ptr<AuditLogger> logger;
};

core::RequestContext authenticated_context() {
    core::RequestContext ctx;
    ctx.set_request_id("req-42");
    ctx.set_trace_id("trace-1");
    ctx.set_span_id("span-1");

    auto auth_ctx = std::make_shared<auth::AuthContext>();
    auth_ctx->principal.id = "lee";
    auth_ctx->principal.roles = {"user", "editor"};
    auth_ctx->client_ip = "198.51.100.4";
    auth_ctx->user_agent = "cli/2.0";
    auth_ctx->session_id = "sess-9";
    (void)ctx.attach_auth(auth_ctx);
    return ctx;
}

std::filesystem::path temp_audit_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "warden_audit_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    std::filesystem::remove(path);
    return path;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

// ============================================================================
// Events
// ============================================================================

TEST_CASE("RFC 3339 timestamps", "[audit][event]") {
    using namespace std::chrono;
    system_clock::time_point tp{seconds{1735787045} + nanoseconds{500000000}};
    REQUIRE(format_rfc3339_nano(tp) == "2025-01-02T03:04:05.5Z");
    REQUIRE(format_rfc3339_nano(system_clock::time_point{seconds{1735787045}}) ==
            "2025-01-02T03:04:05Z");

    auto parsed = parse_rfc3339_nano("2025-01-02T03:04:05.5Z");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == tp);

    auto offset = parse_rfc3339_nano("2025-01-02T05:04:05+02:00");
    REQUIRE(offset.has_value());
    REQUIRE(*offset == system_clock::time_point{seconds{1735787045}});

    REQUIRE_FALSE(parse_rfc3339_nano("yesterday").has_value());
}

TEST_CASE("StructuredAuditEvent JSON omits empty fields", "[audit][event]") {
    StructuredAuditEvent event;
    event.id = "evt-1";
    event.type = std::string(event_type::kAuthSuccess);
    event.result = "success";

    json j = event;
    REQUIRE(j["id"] == "evt-1");
    REQUIRE(j["type"] == "auth.success");
    REQUIRE_FALSE(j.contains("principal"));
    REQUIRE_FALSE(j.contains("client_info"));
    REQUIRE_FALSE(j.contains("error"));
    REQUIRE_FALSE(j.contains("metadata"));
    REQUIRE_FALSE(j.contains("duration_ns"));

    event.principal = PrincipalInfo{"lee", "user", {"user"}};
    event.duration_ns = 1500;
    event.metadata["args_count"] = 2;
    json full = event;
    REQUIRE(full["principal"]["id"] == "lee");
    REQUIRE(full["duration_ns"] == 1500);

    auto decoded = full.get<StructuredAuditEvent>();
    REQUIRE(decoded.principal.has_value());
    REQUIRE(decoded.principal->roles == std::vector<std::string>{"user"});
    REQUIRE(decoded.metadata["args_count"] == 2);
}

// ============================================================================
// Backends
// ============================================================================

TEST_CASE("MemoryAuditBackend keeps snapshots", "[audit][backend]") {
    MemoryAuditBackend backend;
    StructuredAuditEvent event;
    event.id = "a";
    REQUIRE(backend.write(event));
    event.id = "b";
    REQUIRE(backend.write(event));

    auto events = backend.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].id == "a");

    backend.clear();
    REQUIRE(backend.size() == 0);
    REQUIRE(events.size() == 2);
}

TEST_CASE("MemoryAuditBackend events survive a JSON round trip", "[audit][backend]") {
    MemoryAuditBackend backend;
    StructuredAuditEvent event;
    event.id = "rt-1";
    event.timestamp = std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
    event.type = std::string(event_type::kToolCall);
    event.resource = "search";
    event.action = "execute";
    event.result = "success";
    REQUIRE(backend.write(event));

    auto stored = backend.events();
    REQUIRE(stored.size() == 1);

    json j = stored[0];
    auto decoded = json::parse(j.dump()).get<StructuredAuditEvent>();
    REQUIRE(decoded.timestamp == event.timestamp);
    REQUIRE(decoded.resource == "search");
    REQUIRE(decoded.action == "execute");
    REQUIRE(decoded.result == "success");
}

TEST_CASE("FileAuditBackend appends JSON lines", "[audit][backend]") {
    auto path = temp_audit_path("audit.log");
    core::Status status;

    SECTION("Writes one document per line with owner-only permissions") {
        auto backend = FileAuditBackend::open(path.string(), status);
        REQUIRE(backend);
        REQUIRE(status);

        StructuredAuditEvent event;
        event.id = "first";
        event.type = std::string(event_type::kToolCall);
        REQUIRE(backend->write(event));
        event.id = "second";
        REQUIRE(backend->write(event));
        REQUIRE(backend->close());

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 2);
        REQUIRE(json::parse(lines[0])["id"] == "first");
        REQUIRE(json::parse(lines[1])["id"] == "second");

        struct stat st {};
        REQUIRE(::stat(path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("Invalid UTF-8 in caller-supplied fields is still recorded") {
        auto backend = FileAuditBackend::open(path.string(), status);
        REQUIRE(backend);

        StructuredAuditEvent event;
        event.id = "bad-agent";
        event.type = std::string(event_type::kAuthFailure);
        event.client_info = ClientInfo{"203.0.113.9", "curl\xff"};
        REQUIRE(backend->write(event));
        REQUIRE(backend->close());

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        auto parsed = json::parse(lines[0]);
        REQUIRE(parsed["id"] == "bad-agent");
        REQUIRE(parsed["client_info"]["user_agent"] == "curl\xEF\xBF\xBD");
    }

    SECTION("Write after close fails") {
        auto backend = FileAuditBackend::open(path.string(), status);
        REQUIRE(backend);
        REQUIRE(backend->close());
        auto result = backend->write(StructuredAuditEvent{});
        REQUIRE_FALSE(result);
        REQUIRE(result.error == "backend is closed");
    }

    SECTION("Traversal paths are refused") {
        auto backend = FileAuditBackend::open("../warden-audit.log", status);
        REQUIRE(backend == nullptr);
        REQUIRE_FALSE(status);
    }

    SECTION("Empty path is refused") {
        REQUIRE(FileAuditBackend::open("", status) == nullptr);
        REQUIRE_FALSE(status);
    }
}

// ============================================================================
// Logger
// ============================================================================

TEST_CASE("AuditLogger enriches events from the request context", "[audit][logger]") {
    LoggerFixture f;
    auto ctx = authenticated_context();

    f.logger->log_auth_attempt(ctx, true);

    auto events = f.memory->events();
    REQUIRE(events.size() == 1);
    const auto& event = events[0];
    REQUIRE(event.type == "auth.success");
    REQUIRE(event.resource == "authentication");
    REQUIRE(event.action == "authenticate");
    REQUIRE(event.result == "success");
    REQUIRE(event.id.size() == 36);
    REQUIRE(event.timestamp != std::chrono::system_clock::time_point{});
    REQUIRE(event.request_id == "req-42");
    REQUIRE(event.trace_id == "trace-1");
    REQUIRE(event.span_id == "span-1");
    REQUIRE(event.principal.has_value());
    REQUIRE(event.principal->id == "lee");
    REQUIRE(event.principal->type == "user");
    REQUIRE(event.principal->roles == std::vector<std::string>{"user", "editor"});
    REQUIRE(event.client_info.has_value());
    REQUIRE(event.client_info->ip_address == "198.51.100.4");
}

TEST_CASE("AuditLogger never records tool argument values", "[audit][logger]") {
    LoggerFixture f;
    core::RequestContext ctx;

    json args = {{"zeta", "sk-live-secret-value"}, {"alpha", 1}, {"password", "hunter2"}};
    f.logger->log_tool_execution(ctx, "deploy", args, core::Status::success());

    auto events = f.memory->events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == "tool.result");
    REQUIRE(events[0].result == "success");
    REQUIRE(events[0].metadata["args_count"] == 3);
    REQUIRE(events[0].metadata["args_keys"] == json::array({"alpha", "password", "zeta"}));

    std::string serialized = json(events[0]).dump();
    REQUIRE(serialized.find("sk-live-secret-value") == std::string::npos);
    REQUIRE(serialized.find("hunter2") == std::string::npos);
}

TEST_CASE("AuditLogger typed events", "[audit][logger]") {
    LoggerFixture f;
    auto ctx = authenticated_context();

    SECTION("Tool failure is an error event with a sanitized message") {
        f.logger->log_tool_execution(
            ctx, "fetch", json::object(),
            core::Status::failure(core::ErrorKind::Internal, "connect to 10.1.2.3 refused"));
        auto event = f.memory->events().at(0);
        REQUIRE(event.type == "error");
        REQUIRE(event.result == "failure");
        REQUIRE(event.error == "connect to [IP_ADDRESS] refused");
    }

    SECTION("Auth failure") {
        f.logger->log_auth_attempt(ctx, false, "invalid authentication token");
        auto event = f.memory->events().at(0);
        REQUIRE(event.type == "auth.failure");
        REQUIRE(event.result == "failure");
        REQUIRE(event.error == "invalid authentication token");
    }

    SECTION("Authorization decisions") {
        f.logger->log_authorization_check(ctx, "repo", auth::Permission::Write, false);
        f.logger->log_authorization_check(ctx, "repo", auth::Permission::Read, true);
        auto events = f.memory->events();
        REQUIRE(events[0].type == "authz.denied");
        REQUIRE(events[0].result == "denied");
        REQUIRE(events[0].action == "write");
        REQUIRE(events[1].type == "authz.allowed");
        REQUIRE(events[1].result == "allowed");
    }

    SECTION("Rate limit") {
        f.logger->log_rate_limit_exceeded(ctx, "search", "client-7");
        auto event = f.memory->events().at(0);
        REQUIRE(event.type == "ratelimit.exceeded");
        REQUIRE(event.action == "rate_limit");
        REQUIRE(event.result == "exceeded");
        REQUIRE(event.metadata["client_id"] == "client-7");
    }

    SECTION("Validation error") {
        f.logger->log_validation_error(ctx, "search", "query too long");
        auto event = f.memory->events().at(0);
        REQUIRE(event.type == "validation.error");
        REQUIRE(event.action == "validate");
        REQUIRE(event.result == "failure");
    }

    SECTION("Explicit event keeps its own identifiers") {
        StructuredAuditEvent event;
        event.type = "custom";
        event.request_id = "explicit";
        f.logger->log(ctx, event);
        auto logged = f.memory->events().at(0);
        REQUIRE(logged.request_id == "explicit");
        REQUIRE_FALSE(logged.id.empty());
        REQUIRE(logged.trace_id == "trace-1");
    }
}

TEST_CASE("AuditLogger legacy records", "[audit][logger]") {
    LoggerFixture f;
    auto ctx = authenticated_context();

    f.logger->log(make_tool_execution_record(ctx, "build", json{{"a", 1}}, core::Status::success()));
    f.logger->log(make_auth_attempt_record(false, "bad key"));
    f.logger->log(make_authorization_record(ctx, "repo", auth::Permission::Admin, true));

    auto events = f.memory->events();
    REQUIRE(events.size() == 3);

    REQUIRE(events[0].type == "tool.execution");
    REQUIRE(events[0].action == "execute");
    REQUIRE(events[0].principal->id == "lee");
    REQUIRE(events[0].client_info->user_agent == "cli/2.0");
    REQUIRE(events[0].metadata["args_count"] == 1);
    REQUIRE(events[0].metadata["session_id"] == "sess-9");

    REQUIRE(events[1].type == "auth.attempt");
    REQUIRE(events[1].resource == "system");
    REQUIRE(events[1].result == "failure");
    REQUIRE(events[1].error == "bad key");

    REQUIRE(events[2].type == "auth.authorization");
    REQUIRE(events[2].action == "admin");
    REQUIRE(events[2].result == "allowed");
}

TEST_CASE("AuditLogger isolates failing backends", "[audit][logger]") {
    auto failing = std::make_unique<FailingBackend>();
    FailingBackend* failing_ptr = failing.get();
    auto memory = std::make_unique<MemoryAuditBackend>();
    MemoryAuditBackend* memory_ptr = memory.get();

    std::vector<std::unique_ptr<AuditBackend>> backends;
    backends.push_back(std::move(failing));
    backends.push_back(std::move(memory));
    AuditLogger logger(std::move(backends));
    REQUIRE(logger.backend_count() == 2);

    core::RequestContext ctx;
    logger.log_validation_error(ctx, "x", "boom");

    REQUIRE(failing_ptr->attempts == 1);
    REQUIRE(memory_ptr->size() == 1);

    auto closed = logger.close();
    REQUIRE_FALSE(closed);
    REQUIRE(closed.error == "close failed");
}

// ============================================================================
// Middleware
// ============================================================================

TEST_CASE("AuditMiddleware records each tool call", "[audit][middleware]") {
    LoggerFixture f;
    AuditMiddleware middleware(f.logger);
    REQUIRE(middleware.logger() == f.logger);

    SECTION("Success passes the result through") {
        auto handler = middleware.wrap_handler("echo", [](core::RequestContext&, const json& args) {
            return ToolResult{core::Status::success(), args};
        });

        core::RequestContext ctx;
        auto result = handler(ctx, json{{"msg", "hi"}});
        REQUIRE(result.status);
        REQUIRE(result.value["msg"] == "hi");
        REQUIRE_FALSE(ctx.request_id().empty());

        auto events = f.memory->events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == "tool.call");
        REQUIRE(events[0].resource == "echo");
        REQUIRE(events[0].action == "execute");
        REQUIRE(events[0].result == "success");
        REQUIRE(events[0].duration_ns >= 0);
        REQUIRE(events[0].request_id == ctx.request_id());
        REQUIRE(events[0].metadata["args_count"] == 1);
    }

    SECTION("Failure is recorded and returned untouched") {
        auto handler = middleware.wrap_handler("fail", [](core::RequestContext&, const json&) {
            return ToolResult{core::Status::failure(core::ErrorKind::Internal,
                                                    "upstream 192.168.0.9 down"),
                              nullptr};
        });

        core::RequestContext ctx;
        auto result = handler(ctx, json::object());
        REQUIRE_FALSE(result.status);
        REQUIRE(result.status.error == "upstream 192.168.0.9 down");

        auto event = f.memory->events().at(0);
        REQUIRE(event.result == "failure");
        REQUIRE(event.error == "upstream [IP_ADDRESS] down");
    }

    SECTION("Exceptions are recorded and rethrown") {
        auto handler = middleware.wrap_handler("throws", [](core::RequestContext&, const json&) -> ToolResult {
            throw std::runtime_error("exploded");
        });

        core::RequestContext ctx;
        REQUIRE_THROWS_AS(handler(ctx, json::object()), std::runtime_error);
        auto event = f.memory->events().at(0);
        REQUIRE(event.result == "failure");
        REQUIRE(event.error == "exploded");
    }
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("create_audit_logger selects backends", "[audit][factory]") {
    control::AuditConfig config;
    core::Status status;

    SECTION("Disabled has no backends") {
        config.enabled = false;
        auto logger = create_audit_logger(config, status);
        REQUIRE(logger);
        REQUIRE(logger->backend_count() == 0);
    }

    SECTION("Memory") {
        config.enabled = true;
        config.backend = "memory";
        auto logger = create_audit_logger(config, status);
        REQUIRE(logger);
        REQUIRE(logger->backend_count() == 1);
    }

    SECTION("File") {
        config.enabled = true;
        config.backend = "file";
        config.file_path = temp_audit_path("factory.log").string();
        auto logger = create_audit_logger(config, status);
        REQUIRE(logger);
        REQUIRE(logger->close());
    }

    SECTION("SIEM backend without siem section") {
        config.enabled = true;
        config.backend = "splunk";
        REQUIRE(create_audit_logger(config, status) == nullptr);
        REQUIRE_FALSE(status);
    }

    SECTION("SIEM URL pointing at a private address is refused") {
        config.enabled = true;
        config.backend = "webhook";
        control::SiemConfig siem;
        control::WebhookConfig webhook;
        webhook.url = "http://10.0.0.5/hook";
        siem.webhook = webhook;
        config.siem = siem;
        REQUIRE(create_audit_logger(config, status) == nullptr);
        REQUIRE(status.kind == core::ErrorKind::SsrfBlocked);
    }

    SECTION("Unknown backend") {
        config.enabled = true;
        config.backend = "carrier-pigeon";
        REQUIRE(create_audit_logger(config, status) == nullptr);
    }
}
