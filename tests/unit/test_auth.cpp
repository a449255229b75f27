// Authentication and Authorization Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "auth/api_key_store.hpp"
#include "auth/auth_extractor.hpp"
#include "auth/authenticator.hpp"
#include "auth/authorizer.hpp"
#include "control/config.hpp"
#include "core/request_context.hpp"

using namespace warden;
using namespace warden::auth;

namespace {

Principal make_principal(std::string id, std::vector<std::string> roles,
                         std::vector<Permission> permissions = {}) {
    Principal p;
    p.id = id;
    p.name = std::move(id);
    p.roles = std::move(roles);
    p.permissions = std::move(permissions);
    return p;
}

std::filesystem::path write_key_file(const std::string& name, const std::string& content,
                                     std::filesystem::perms perms) {
    auto dir = std::filesystem::temp_directory_path() / "warden_auth_tests";
    std::filesystem::create_directories(dir);
    auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace);
    return path;
}

constexpr auto kOwnerOnly = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;

control::SecurityConfig builtin_config(const std::string& key_file) {
    control::SecurityConfig config;
    config.environment = control::kEnvDevelopment;
    config.auth_mode = "builtin";
    control::ApiKeyConfig keys;
    keys.source = "file";
    keys.file_path = key_file;
    control::BuiltinAuthConfig builtin;
    builtin.method = "api_key";
    builtin.api_keys = keys;
    config.builtin_auth = builtin;
    return config;
}

}  // namespace

// ============================================================================
// ApiKeyAuthenticator
// ============================================================================

TEST_CASE("ApiKeyAuthenticator lookups", "[auth][api_key]") {
    ApiKeyAuthenticator authenticator;
    authenticator.add_key("sk-alice-0123456789", make_principal("alice", {"user"}));
    authenticator.add_key("sk-bob-0123456789", make_principal("bob", {"admin"}));

    SECTION("Known key yields its principal") {
        auto result = authenticator.authenticate("sk-bob-0123456789");
        REQUIRE(result);
        REQUIRE(result.principal.id == "bob");
        REQUIRE(result.principal.has_role("admin"));
    }

    SECTION("Empty credential") {
        auto result = authenticator.authenticate("");
        REQUIRE_FALSE(result);
        REQUIRE(result.error == "missing authentication token");
    }

    SECTION("Unknown key") {
        auto result = authenticator.authenticate("sk-alice-012345678X");
        REQUIRE_FALSE(result);
        REQUIRE(result.error == "invalid authentication token");
    }

    SECTION("Prefix of a valid key is rejected") {
        REQUIRE_FALSE(authenticator.authenticate("sk-alice"));
    }

    SECTION("add_key replaces an existing binding") {
        authenticator.add_key("sk-alice-0123456789", make_principal("alice2", {"user"}));
        REQUIRE(authenticator.key_count() == 2);
        REQUIRE(authenticator.authenticate("sk-alice-0123456789").principal.id == "alice2");
    }
}

// ============================================================================
// RbacAuthorizer
// ============================================================================

TEST_CASE("RbacAuthorizer decisions", "[auth][rbac]") {
    RbacAuthorizer authorizer;

    SECTION("Null principal is denied") {
        auto status = authorizer.authorize(nullptr, "tool", Permission::Read);
        REQUIRE_FALSE(status);
        REQUIRE(status.kind == core::ErrorKind::Authorization);
        REQUIRE(status.error == "no principal provided");
    }

    SECTION("Seeded roles") {
        auto user = make_principal("u", {"user"});
        REQUIRE(authorizer.authorize(&user, "tool", Permission::Read));
        REQUIRE(authorizer.authorize(&user, "tool", Permission::Execute));
        auto denied = authorizer.authorize(&user, "tool", Permission::Write);
        REQUIRE_FALSE(denied);
        REQUIRE(denied.error == "access denied: insufficient permissions");

        auto readonly = make_principal("r", {"readonly"});
        REQUIRE(authorizer.authorize(&readonly, "tool", Permission::Read));
        REQUIRE_FALSE(authorizer.authorize(&readonly, "tool", Permission::Execute));
    }

    SECTION("Admin role grants everything") {
        auto admin = make_principal("a", {"admin"});
        for (auto p : {Permission::Read, Permission::Write, Permission::Execute, Permission::Admin}) {
            REQUIRE(authorizer.authorize(&admin, "anything", p));
        }
    }

    SECTION("Direct admin permission overrides missing roles") {
        auto p = make_principal("d", {}, {Permission::Admin});
        REQUIRE(authorizer.authorize(&p, "tool", Permission::Write));
    }

    SECTION("Direct permission without role") {
        auto p = make_principal("d", {"unknown-role"}, {Permission::Write});
        REQUIRE(authorizer.authorize(&p, "tool", Permission::Write));
        REQUIRE_FALSE(authorizer.authorize(&p, "tool", Permission::Read));
    }

    SECTION("Custom role permissions are idempotent") {
        authorizer.add_role_permission("deployer", Permission::Write);
        authorizer.add_role_permission("deployer", Permission::Write);
        REQUIRE(authorizer.role_permissions("deployer").size() == 1);

        auto p = make_principal("x", {"deployer"});
        REQUIRE(authorizer.authorize(&p, "deploy", Permission::Write));
    }

    SECTION("Unknown role has no permissions") {
        REQUIRE(authorizer.role_permissions("nope").empty());
    }
}

TEST_CASE("AllowAllAuthorizer still requires a principal", "[auth][rbac]") {
    AllowAllAuthorizer authorizer;
    auto p = make_principal("x", {});
    REQUIRE(authorizer.authorize(&p, "tool", Permission::Admin));
    REQUIRE_FALSE(authorizer.authorize(nullptr, "tool", Permission::Read));
}

// ============================================================================
// API key sources
// ============================================================================

TEST_CASE("API keys from the environment", "[auth][api_key]") {
    ::setenv("WARDEN_TEST_KEY_carol", "sk-carol-secret", 1);
    ::setenv("WARDEN_TEST_KEY_", "orphan", 1);

    auto entries = load_api_keys_from_environment("WARDEN_TEST_KEY_");
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].key == "sk-carol-secret");
    REQUIRE(entries[0].principal.id == "carol");
    REQUIRE(entries[0].principal.has_role("user"));
    REQUIRE(entries[0].principal.has_permission(Permission::Execute));
    REQUIRE(entries[0].principal.metadata_value("source") == "environment");

    ::unsetenv("WARDEN_TEST_KEY_carol");
    ::unsetenv("WARDEN_TEST_KEY_");
}

TEST_CASE("API keys from a file", "[auth][api_key]") {
    std::vector<ApiKeyEntry> entries;

    SECTION("Line format with comments") {
        auto path = write_key_file("keys.txt", "# keys\n\nalice = sk-a1\nbroken line\nbob=sk-b2\n",
                                   kOwnerOnly);
        auto status = load_api_keys_from_file(path.string(), entries);
        REQUIRE(status);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].principal.id == "alice");
        REQUIRE(entries[0].key == "sk-a1");
        REQUIRE(entries[0].principal.metadata_value("line") == "3");
        REQUIRE(entries[1].principal.metadata_value("source") == "file");
    }

    SECTION("JSON object format") {
        auto path = write_key_file("keys.json", R"({"svc":"sk-svc","bad":42})", kOwnerOnly);
        REQUIRE(load_api_keys_from_file(path.string(), entries));
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].principal.id == "svc");
    }

    SECTION("World-readable file is refused") {
        auto path = write_key_file("open.txt", "alice=sk-a1\n",
                                   kOwnerOnly | std::filesystem::perms::others_read);
        auto status = load_api_keys_from_file(path.string(), entries);
        REQUIRE_FALSE(status);
        REQUIRE(status.error.find("insecure file permissions") != std::string::npos);
        REQUIRE(entries.empty());
    }

    SECTION("File without usable keys") {
        auto path = write_key_file("empty.txt", "# nothing here\n", kOwnerOnly);
        auto status = load_api_keys_from_file(path.string(), entries);
        REQUIRE_FALSE(status);
        REQUIRE(status.error == "no valid API keys found in file");
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(load_api_keys_from_file("/nonexistent/warden/keys", entries));
    }
}

// ============================================================================
// Extractors
// ============================================================================

TEST_CASE("AuthRequest headers are case-insensitive", "[auth][extractor]") {
    AuthRequest request;
    request.set_header("Authorization", "Bearer x");
    REQUIRE(request.has_header("authorization"));
    REQUIRE(request.header("AUTHORIZATION") == "Bearer x");
    REQUIRE(request.header("X-Missing").empty());
}

TEST_CASE("DisabledAuthExtractor yields a read-only anonymous principal", "[auth][extractor]") {
    DisabledAuthExtractor extractor;
    auto result = extractor.extract(AuthRequest{});
    REQUIRE(result);
    REQUIRE(result.principal.id == "anonymous");
    REQUIRE(result.principal.has_permission(Permission::Read));
    REQUIRE_FALSE(result.principal.has_permission(Permission::Admin));
    REQUIRE_FALSE(result.principal.has_role("admin"));
}

TEST_CASE("BuiltinAuthExtractor parses the Authorization header", "[auth][extractor]") {
    auto authenticator = std::make_shared<ApiKeyAuthenticator>();
    authenticator->add_key("sk-valid-key", make_principal("alice", {"user"}));
    BuiltinAuthExtractor extractor("api_key", authenticator);

    AuthRequest request;

    SECTION("Valid bearer key") {
        request.set_header("Authorization", "Bearer sk-valid-key");
        auto result = extractor.extract(request);
        REQUIRE(result);
        REQUIRE(result.principal.id == "alice");
        REQUIRE(result.principal.metadata_value("auth_mode") == "builtin");
        REQUIRE(result.principal.metadata_value("auth_method") == "api_key");
    }

    SECTION("Scheme is case-insensitive") {
        request.set_header("Authorization", "bearer sk-valid-key");
        REQUIRE(extractor.extract(request));
    }

    SECTION("Missing header") {
        REQUIRE(extractor.extract(request).error == "missing Authorization header");
    }

    SECTION("No scheme separator") {
        request.set_header("Authorization", "sk-valid-key");
        REQUIRE(extractor.extract(request).error == "invalid Authorization header format");
    }

    SECTION("Wrong scheme") {
        request.set_header("Authorization", "Basic dXNlcjpwYXNz");
        REQUIRE(extractor.extract(request).error == "unsupported authentication scheme: basic");
    }

    SECTION("Wrong key") {
        request.set_header("Authorization", "Bearer sk-wrong");
        REQUIRE(extractor.extract(request).error ==
                "authentication failed: invalid authentication token");
    }
}

TEST_CASE("DelegatedAuthExtractor trusts proxy headers", "[auth][extractor]") {
    control::DelegatedAuthConfig config;
    config.identity_header = "X-User";
    config.header_mapping = {{"roles", "X-Roles"}, {"name", "X-Name"}};
    DelegatedAuthExtractor extractor(config, nullptr);

    AuthRequest request;

    SECTION("Missing identity header") {
        auto result = extractor.extract(request);
        REQUIRE_FALSE(result);
        REQUIRE(result.error == "missing identity header: X-User");
    }

    SECTION("Roles are sanitized and name mapped") {
        request.set_header("X-User", "dana@example.com");
        request.set_header("X-Roles", " Admin ,viewer,bad role!,admin");
        request.set_header("X-Name", "Dana");

        auto result = extractor.extract(request);
        REQUIRE(result);
        REQUIRE(result.principal.id == "dana@example.com");
        REQUIRE(result.principal.name == "Dana");
        REQUIRE(result.principal.roles == std::vector<std::string>{"admin", "viewer"});
        REQUIRE(result.principal.metadata_value("auth_mode") == "delegated");
    }

    SECTION("Default roles when none are mapped") {
        request.set_header("X-User", "erin");
        auto result = extractor.extract(request);
        REQUIRE(result);
        REQUIRE(result.principal.roles == std::vector<std::string>{"user"});
    }
}

TEST_CASE("DelegatedAuthExtractor IAP path requires an assertion", "[auth][extractor]") {
    control::DelegatedAuthConfig config;
    config.iap.enabled = true;
    config.iap.verify_jwt = true;
    config.iap.audience = "/projects/1/global/backendServices/2";
    DelegatedAuthExtractor extractor(config, nullptr);

    AuthRequest request;
    request.set_header(kIapIdentityHeader, "accounts.google.com:frank@example.com");
    auto result = extractor.extract(request);
    REQUIRE_FALSE(result);
    REQUIRE(result.error == "missing IAP JWT assertion");
}

TEST_CASE("DelegatedAuthExtractor IAP without verification strips the issuer prefix",
          "[auth][extractor]") {
    control::DelegatedAuthConfig config;
    config.iap.enabled = true;
    config.iap.verify_jwt = false;
    DelegatedAuthExtractor extractor(config, nullptr);

    AuthRequest request;
    request.set_header(kIapIdentityHeader, "accounts.google.com:frank@example.com");
    auto result = extractor.extract(request);
    REQUIRE(result);
    REQUIRE(result.principal.id == "frank@example.com");
    REQUIRE(result.principal.metadata_value("auth_mode") == "delegated_iap");
    REQUIRE(result.principal.metadata_value("email") == "frank@example.com");
}

TEST_CASE("HybridAuthExtractor falls back to builtin", "[auth][extractor]") {
    control::DelegatedAuthConfig delegated_config;
    delegated_config.identity_header = "X-User";
    auto authenticator = std::make_shared<ApiKeyAuthenticator>();
    authenticator->add_key("sk-hybrid", make_principal("svc", {"user"}));

    HybridAuthExtractor extractor(std::make_unique<DelegatedAuthExtractor>(delegated_config, nullptr),
                                  std::make_unique<BuiltinAuthExtractor>("api_key", authenticator));

    SECTION("Delegated wins when present") {
        AuthRequest request;
        request.set_header("X-User", "gina");
        request.set_header("Authorization", "Bearer sk-hybrid");
        auto result = extractor.extract(request);
        REQUIRE(result);
        REQUIRE(result.principal.id == "gina");
        REQUIRE(result.principal.metadata_value("auth_mode") == "hybrid");
        REQUIRE(result.principal.metadata_value("auth_submode") == "delegated");
    }

    SECTION("Builtin fallback") {
        AuthRequest request;
        request.set_header("Authorization", "Bearer sk-hybrid");
        auto result = extractor.extract(request);
        REQUIRE(result);
        REQUIRE(result.principal.id == "svc");
        REQUIRE(result.principal.metadata_value("auth_submode") == "builtin");
    }

    SECTION("Both fail") {
        auto result = extractor.extract(AuthRequest{});
        REQUIRE_FALSE(result);
        REQUIRE(result.error == "both delegated and builtin auth failed");
    }
}

// ============================================================================
// Factory and request authentication
// ============================================================================

TEST_CASE("create_auth_extractor honours mode and environment", "[auth][factory]") {
    control::SecurityConfig config;

    SECTION("Disabled is refused in production") {
        config.environment = control::kEnvProduction;
        config.auth_mode = "disabled";
        auto result = create_auth_extractor(config);
        REQUIRE_FALSE(result);
        REQUIRE(result.status.error.find("not allowed in production") != std::string::npos);
    }

    SECTION("Disabled is allowed in development") {
        config.environment = control::kEnvDevelopment;
        config.auth_mode = "disabled";
        auto result = create_auth_extractor(config);
        REQUIRE(result);
        REQUIRE(result.extractor->mode() == "disabled");
    }

    SECTION("Unknown mode") {
        config.auth_mode = "magic";
        REQUIRE_FALSE(create_auth_extractor(config));
    }

    SECTION("Builtin without configuration") {
        config.auth_mode = "builtin";
        config.builtin_auth.reset();
        auto result = create_auth_extractor(config);
        REQUIRE_FALSE(result);
        REQUIRE(result.status.error == "auth_mode=builtin requires builtin_auth configuration");
    }

    SECTION("Hybrid requires both sections") {
        config.auth_mode = "hybrid";
        config.delegated_auth = control::DelegatedAuthConfig{};
        config.builtin_auth.reset();
        REQUIRE_FALSE(create_auth_extractor(config));
    }

    SECTION("Builtin from a key file") {
        auto path = write_key_file("factory.txt", "henry=sk-henry-key\n", kOwnerOnly);
        auto result = create_auth_extractor(builtin_config(path.string()));
        REQUIRE(result);
        REQUIRE(result.extractor->mode() == "builtin");

        AuthRequest request;
        request.set_header("Authorization", "Bearer sk-henry-key");
        REQUIRE(result.extractor->extract(request).principal.id == "henry");
    }

    SECTION("Builtin with an unreadable key file fails") {
        auto result = create_auth_extractor(builtin_config("/nonexistent/warden/keys"));
        REQUIRE_FALSE(result);
        REQUIRE(result.status.error.find("failed to create API key authenticator") == 0);
    }
}

TEST_CASE("authenticate_request attaches the AuthContext", "[auth][context]") {
    auto authenticator = std::make_shared<ApiKeyAuthenticator>();
    authenticator->add_key("sk-ctx", make_principal("ivy", {"user"}));
    BuiltinAuthExtractor extractor("api_key", authenticator);

    AuthRequest request;
    request.remote_addr = "203.0.113.7";
    request.user_agent = "warden-test/1.0";

    core::RequestContext ctx;

    SECTION("Success") {
        request.set_header("Authorization", "Bearer sk-ctx");
        REQUIRE(authenticate_request(extractor, request, ctx));
        REQUIRE_FALSE(ctx.request_id().empty());
        REQUIRE(ctx.auth() != nullptr);
        REQUIRE(ctx.auth()->principal.id == "ivy");
        REQUIRE(ctx.auth()->client_ip == "203.0.113.7");
        REQUIRE(ctx.auth()->user_agent == "warden-test/1.0");
    }

    SECTION("Failure leaves the context unauthenticated") {
        request.set_header("Authorization", "Bearer wrong");
        auto status = authenticate_request(extractor, request, ctx);
        REQUIRE_FALSE(status);
        REQUIRE(status.kind == core::ErrorKind::Authentication);
        REQUIRE(ctx.auth() == nullptr);
    }
}
