/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


// Warden SIEM Backends - Implementation

#include "siem_backend.hpp"

#include <fmt/format.h>
#include <httplib.h>
#include <unistd.h>

#include <cstdio>
#include <system_error>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "../http/url.hpp"

namespace warden::audit {

using core::ErrorKind;
using core::Status;

namespace {

void report_batch_failure(std::string_view backend, size_t count, std::string_view error) {
    fmt::print(stderr, "AUDIT_FALLBACK: SIEM batch delivery failed (backend={}, events={}): {}\n",
               backend, count, error);
    WARDEN_LOG_ERROR("SIEM batch delivery failed: backend={}, events={}, error={}", backend, count,
                     error);
}

std::chrono::milliseconds flush_interval_of(const control::SiemConfig& siem) {
    return std::chrono::milliseconds(siem.flush_interval_ms > 0 ? siem.flush_interval_ms : 5000);
}

uint32_t batch_size_of(const control::SiemConfig& siem) {
    return siem.batch_size > 0 ? siem.batch_size : 100;
}

void warn_tls_disabled(std::string_view backend) {
    WARDEN_LOG_WARNING(
        "{} TLS certificate verification is disabled (tls_verify=false). Connections are "
        "vulnerable to man-in-the-middle attacks; never use this in production",
        backend);
}

std::string status_error(std::string_view what, const httplib::Result& res) {
    return fmt::format("{} request failed: {}", what, httplib::to_string(res.error()));
}

}  // namespace

// ============================================================================
// SiemBatcher
// ============================================================================

SiemBatcher::SiemBatcher(std::string backend_name, uint32_t batch_size,
                         std::chrono::milliseconds flush_interval, SendBatch send)
    : backend_name_(std::move(backend_name)),
      batch_size_(batch_size > 0 ? batch_size : 1),
      flush_interval_(flush_interval),
      send_(std::move(send)) {
    buffer_.reserve(batch_size_);
    flush_thread_ = std::thread(&SiemBatcher::flush_loop, this);
}

SiemBatcher::~SiemBatcher() {
    (void)close();
}

Status SiemBatcher::write(const StructuredAuditEvent& event) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return Status::failure(ErrorKind::AuditDelivery, "backend is closed");
    }

    buffer_.push_back(event);
    if (buffer_.size() >= batch_size_) {
        flush_locked();
    }
    return Status::success();
}

void SiemBatcher::flush() {
    std::lock_guard lock(mutex_);
    if (!closed_) {
        flush_locked();
    }
}

void SiemBatcher::flush_locked() {
    if (buffer_.empty()) {
        return;
    }

    auto events = std::make_shared<std::vector<StructuredAuditEvent>>(std::move(buffer_));
    buffer_.clear();
    buffer_.reserve(batch_size_);

    ++in_flight_;
    try {
        std::thread([this, events] {
            deliver(*events);
            std::lock_guard lock(mutex_);
            --in_flight_;
            cv_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        --in_flight_;
        WARDEN_LOG_WARNING("SIEM worker spawn failed ({}), delivering inline", e.what());
        deliver(*events);
    }
}

void SiemBatcher::deliver(const std::vector<StructuredAuditEvent>& events) {
    Status status;
    try {
        status = send_(events);
    } catch (const std::exception& e) {
        status = Status::failure(ErrorKind::AuditDelivery, e.what());
    }

    if (status) {
        delivered_batches_.fetch_add(1, std::memory_order_relaxed);
        WARDEN_LOG_DEBUG("SIEM batch delivered: backend={}, events={}", backend_name_, events.size());
    } else {
        failed_batches_.fetch_add(1, std::memory_order_relaxed);
        report_batch_failure(backend_name_, events.size(), status.error);
    }
}

void SiemBatcher::flush_loop() {
    std::unique_lock lock(mutex_);
    while (!closed_) {
        cv_.wait_for(lock, flush_interval_, [this] { return closed_; });
        if (closed_) {
            break;
        }
        flush_locked();
    }
}

Status SiemBatcher::close() {
    std::vector<StructuredAuditEvent> remaining;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return Status::success();
        }
        closed_ = true;
        remaining.swap(buffer_);
    }
    cv_.notify_all();

    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    Status status;
    if (!remaining.empty()) {
        try {
            status = send_(remaining);
        } catch (const std::exception& e) {
            status = Status::failure(ErrorKind::AuditDelivery, e.what());
        }
        if (status) {
            delivered_batches_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_batches_.fetch_add(1, std::memory_order_relaxed);
            report_batch_failure(backend_name_, remaining.size(), status.error);
        }
    }

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return in_flight_ == 0; });
    return status;
}

size_t SiemBatcher::buffered() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

// ============================================================================
// URL validation
// ============================================================================

Status validate_siem_url(std::string_view url) {
    security::SsrfConfig config;
    config.allow_localhost = false;
    return security::SsrfValidator(std::move(config)).validate_url(url);
}

// ============================================================================
// SiemBackend
// ============================================================================

SiemBackend::SiemBackend(bool validate_urls, bool tls_verify) : tls_verify_(tls_verify) {
    if (validate_urls) {
        security::SsrfConfig config;
        config.allow_localhost = false;
        validator_.emplace(std::move(config));
    }
}

void SiemBackend::start_batcher(std::string_view name, const control::SiemConfig& siem) {
    batcher_ = std::make_unique<SiemBatcher>(
        std::string(name), batch_size_of(siem), flush_interval_of(siem),
        [this](const std::vector<StructuredAuditEvent>& events) { return send_batch(events); });
}

void SiemBackend::stop_batcher() {
    if (batcher_) {
        (void)batcher_->close();
    }
}

Status SiemBackend::write(const StructuredAuditEvent& event) {
    return batcher_->write(event);
}

Status SiemBackend::close() {
    return batcher_->close();
}

std::unique_ptr<httplib::Client> SiemBackend::make_client(const std::string& url,
                                                          Status& status) const {
    std::unique_ptr<httplib::Client> client;
    if (validator_) {
        // Re-validated per send; pins the connection to the checked address
        client = validator_->create_secure_client(url, status);
        if (!client) {
            return nullptr;
        }
    } else {
        auto parsed = http::url::parse(url);
        if (!parsed || parsed->host.empty()) {
            status = Status::failure(ErrorKind::Validation, "invalid URL: " + url);
            return nullptr;
        }
        client = std::make_unique<httplib::Client>(parsed->origin());
        client->set_connection_timeout(std::chrono::seconds(10));
        status = Status::success();
    }

    client->set_read_timeout(kSiemRequestTimeout);
    client->set_write_timeout(kSiemRequestTimeout);
    client->enable_server_certificate_verification(tls_verify_);
    return client;
}

// ============================================================================
// Elasticsearch
// ============================================================================

ElasticsearchBackend::ElasticsearchBackend(control::ElasticsearchConfig config,
                                           const control::SiemConfig& siem, bool validate_urls)
    : SiemBackend(validate_urls, config.tls_verify), config_(std::move(config)) {
    if (config_.index.empty()) {
        config_.index = "audit-logs";
    }
    start_batcher(name(), siem);
}

ElasticsearchBackend::~ElasticsearchBackend() {
    stop_batcher();
}

std::unique_ptr<ElasticsearchBackend> ElasticsearchBackend::create(
    const control::ElasticsearchConfig& config, const control::SiemConfig& siem, Status& status) {
    if (config.urls.empty()) {
        status = Status::failure(ErrorKind::Validation,
                                 "elasticsearch configuration with at least one URL is required");
        return nullptr;
    }
    for (const auto& url : config.urls) {
        if (auto valid = validate_siem_url(url); !valid) {
            status = Status::failure(ErrorKind::SsrfBlocked,
                                     "invalid elasticsearch URL " + url + ": " + valid.error);
            return nullptr;
        }
    }
    status = Status::success();
    return std::unique_ptr<ElasticsearchBackend>(new ElasticsearchBackend(config, siem, true));
}

std::unique_ptr<ElasticsearchBackend> ElasticsearchBackend::create_unchecked(
    const control::ElasticsearchConfig& config, const control::SiemConfig& siem, Status& status) {
    if (config.urls.empty()) {
        status = Status::failure(ErrorKind::Validation,
                                 "elasticsearch configuration with at least one URL is required");
        return nullptr;
    }
    status = Status::success();
    return std::unique_ptr<ElasticsearchBackend>(new ElasticsearchBackend(config, siem, false));
}

std::string ElasticsearchBackend::build_bulk_body(
    const std::vector<StructuredAuditEvent>& events) const {
    std::string body;
    nlohmann::json action = {{"index", {{"_index", config_.index}}}};
    std::string action_line = action.dump();

    for (const auto& event : events) {
        std::string doc;
        try {
            nlohmann::json j = event;
            doc = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const nlohmann::json::exception& e) {
            WARDEN_LOG_WARNING("Skipping unserializable audit event {}: {}", event.id, e.what());
            continue;
        }
        body += action_line;
        body += '\n';
        body += doc;
        body += '\n';
    }
    return body;
}

Status ElasticsearchBackend::send_batch(const std::vector<StructuredAuditEvent>& events) {
    if (events.empty()) {
        return Status::success();
    }

    std::string body = build_bulk_body(events);
    std::string last_error;

    for (const auto& url : config_.urls) {
        Status status;
        auto client = make_client(url, status);
        if (!client) {
            last_error = status.error;
            continue;
        }
        if (!config_.username.empty()) {
            client->set_basic_auth(config_.username, config_.password);
        }

        auto parsed = http::url::parse(url);
        std::string path = http::url::join_path(parsed->path, "/_bulk");

        auto res = client->Post(path, body, "application/x-ndjson");
        if (!res) {
            last_error = status_error("elasticsearch", res);
            continue;
        }
        if (res->status >= 200 && res->status < 300) {
            return Status::success();
        }
        last_error = fmt::format("elasticsearch returned status {}", res->status);
    }

    return Status::failure(ErrorKind::AuditDelivery, "all elasticsearch URLs failed: " + last_error);
}

// ============================================================================
// Splunk HEC
// ============================================================================

SplunkBackend::SplunkBackend(control::SplunkConfig config, const control::SiemConfig& siem,
                             bool validate_urls)
    : SiemBackend(validate_urls, config.tls_verify), config_(std::move(config)) {
    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) {
        hostname_ = host;
    }
    start_batcher(name(), siem);
}

SplunkBackend::~SplunkBackend() {
    stop_batcher();
}

namespace {

Status check_splunk_config(const control::SplunkConfig& config) {
    if (config.url.empty()) {
        return Status::failure(ErrorKind::Validation, "splunk configuration with URL is required");
    }
    if (config.token.empty()) {
        return Status::failure(ErrorKind::Validation, "splunk HEC token is required");
    }
    return Status::success();
}

}  // namespace

std::unique_ptr<SplunkBackend> SplunkBackend::create(const control::SplunkConfig& config,
                                                     const control::SiemConfig& siem,
                                                     Status& status) {
    status = check_splunk_config(config);
    if (!status) {
        return nullptr;
    }
    if (auto valid = validate_siem_url(config.url); !valid) {
        status = Status::failure(ErrorKind::SsrfBlocked, "invalid splunk URL: " + valid.error);
        return nullptr;
    }
    return std::unique_ptr<SplunkBackend>(new SplunkBackend(config, siem, true));
}

std::unique_ptr<SplunkBackend> SplunkBackend::create_unchecked(const control::SplunkConfig& config,
                                                               const control::SiemConfig& siem,
                                                               Status& status) {
    status = check_splunk_config(config);
    if (!status) {
        return nullptr;
    }
    return std::unique_ptr<SplunkBackend>(new SplunkBackend(config, siem, false));
}

std::string SplunkBackend::build_hec_body(const std::vector<StructuredAuditEvent>& events) const {
    std::string body;
    for (const auto& event : events) {
        try {
            nlohmann::json hec = {
                {"time", std::chrono::duration_cast<std::chrono::seconds>(
                             event.timestamp.time_since_epoch())
                             .count()},
                {"host", hostname_},
                {"source", config_.source},
                {"index", config_.index},
                {"event", event}};
            body += hec.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } catch (const nlohmann::json::exception& e) {
            WARDEN_LOG_WARNING("Skipping unserializable audit event {}: {}", event.id, e.what());
        }
    }
    return body;
}

Status SplunkBackend::send_batch(const std::vector<StructuredAuditEvent>& events) {
    if (events.empty()) {
        return Status::success();
    }

    Status status;
    auto client = make_client(config_.url, status);
    if (!client) {
        return Status::failure(ErrorKind::AuditDelivery, "splunk request failed: " + status.error);
    }

    auto parsed = http::url::parse(config_.url);
    httplib::Headers headers = {{"Authorization", "Splunk " + config_.token}};
    auto res = client->Post(parsed->path, headers, build_hec_body(events), "application/json");
    if (!res) {
        return Status::failure(ErrorKind::AuditDelivery, status_error("splunk", res));
    }
    if (res->status >= 200 && res->status < 300) {
        return Status::success();
    }
    return Status::failure(ErrorKind::AuditDelivery,
                           fmt::format("splunk returned status {}", res->status));
}

// ============================================================================
// Webhook
// ============================================================================

WebhookBackend::WebhookBackend(control::WebhookConfig config, const control::SiemConfig& siem,
                               bool validate_urls)
    : SiemBackend(validate_urls, config.tls_verify), config_(std::move(config)) {
    start_batcher(name(), siem);
}

WebhookBackend::~WebhookBackend() {
    stop_batcher();
}

namespace {

Status check_webhook_config(const control::WebhookConfig& config) {
    if (config.url.empty()) {
        return Status::failure(ErrorKind::Validation, "webhook configuration with URL is required");
    }
    if (config.method != "POST" && config.method != "PUT" && config.method != "PATCH") {
        return Status::failure(ErrorKind::Validation,
                               "unsupported webhook method: " + config.method);
    }
    return Status::success();
}

}  // namespace

std::unique_ptr<WebhookBackend> WebhookBackend::create(const control::WebhookConfig& config,
                                                       const control::SiemConfig& siem,
                                                       Status& status) {
    status = check_webhook_config(config);
    if (!status) {
        return nullptr;
    }
    if (auto valid = validate_siem_url(config.url); !valid) {
        status = Status::failure(ErrorKind::SsrfBlocked, "invalid webhook URL: " + valid.error);
        return nullptr;
    }
    return std::unique_ptr<WebhookBackend>(new WebhookBackend(config, siem, true));
}

std::unique_ptr<WebhookBackend> WebhookBackend::create_unchecked(
    const control::WebhookConfig& config, const control::SiemConfig& siem, Status& status) {
    status = check_webhook_config(config);
    if (!status) {
        return nullptr;
    }
    return std::unique_ptr<WebhookBackend>(new WebhookBackend(config, siem, false));
}

Status WebhookBackend::send_batch(const std::vector<StructuredAuditEvent>& events) {
    if (events.empty()) {
        return Status::success();
    }

    std::string body;
    try {
        nlohmann::json payload = {{"events", events},
                                  {"timestamp", format_rfc3339_nano(std::chrono::system_clock::now())},
                                  {"count", events.size()}};
        body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return Status::failure(ErrorKind::AuditDelivery,
                               std::string("failed to marshal payload: ") + e.what());
    }

    Status status;
    auto client = make_client(config_.url, status);
    if (!client) {
        return Status::failure(ErrorKind::AuditDelivery, "webhook request failed: " + status.error);
    }

    httplib::Headers headers;
    for (const auto& [name, value] : config_.headers) {
        headers.emplace(name, value);
    }

    auto parsed = http::url::parse(config_.url);
    httplib::Result res = config_.method == "PUT"
                              ? client->Put(parsed->path, headers, body, "application/json")
                          : config_.method == "PATCH"
                              ? client->Patch(parsed->path, headers, body, "application/json")
                              : client->Post(parsed->path, headers, body, "application/json");
    if (!res) {
        return Status::failure(ErrorKind::AuditDelivery, status_error("webhook", res));
    }
    if (res->status >= 200 && res->status < 300) {
        return Status::success();
    }
    return Status::failure(ErrorKind::AuditDelivery,
                           fmt::format("webhook returned status {}", res->status));
}

}  // namespace warden::audit
