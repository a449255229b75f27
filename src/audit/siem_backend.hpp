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


// Warden SIEM Backends - Header
// Batched, asynchronously flushed delivery to Elasticsearch, Splunk HEC and webhooks

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../control/config.hpp"
#include "../core/status.hpp"
#include "../security/ssrf_validator.hpp"
#include "audit_backend.hpp"

namespace httplib {
class Client;
}

namespace warden::audit {

/// Per-request timeout for SIEM deliveries
inline constexpr std::chrono::seconds kSiemRequestTimeout{30};

/// Batching core shared by the SIEM backends.
///
/// Events accumulate in a buffer under one mutex. The buffer is flushed when
/// it reaches batch_size or when the flush thread ticks (every
/// flush_interval). Each flush swaps the buffer out under the lock and sends
/// it on a detached worker; close() stops the flush thread, sends what is
/// left synchronously and waits for in-flight sends.
class SiemBatcher {
public:
    using SendBatch = std::function<core::Status(const std::vector<StructuredAuditEvent>&)>;

    SiemBatcher(std::string backend_name, uint32_t batch_size,
                std::chrono::milliseconds flush_interval, SendBatch send);
    ~SiemBatcher();

    SiemBatcher(const SiemBatcher&) = delete;
    SiemBatcher& operator=(const SiemBatcher&) = delete;

    /// Buffer one event. Fails with "backend is closed" after close().
    [[nodiscard]] core::Status write(const StructuredAuditEvent& event);

    /// Send the current buffer on a worker now
    void flush();

    [[nodiscard]] core::Status close();

    [[nodiscard]] size_t buffered() const;

    /// Batches whose delivery failed (reported on the fallback channel)
    [[nodiscard]] uint64_t failed_batches() const noexcept { return failed_batches_.load(); }

    [[nodiscard]] uint64_t delivered_batches() const noexcept { return delivered_batches_.load(); }

private:
    // Caller holds mutex_
    void flush_locked();

    void flush_loop();

    void deliver(const std::vector<StructuredAuditEvent>& events);

    std::string backend_name_;
    const uint32_t batch_size_;
    const std::chrono::milliseconds flush_interval_;
    SendBatch send_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<StructuredAuditEvent> buffer_;
    bool closed_ = false;
    size_t in_flight_ = 0;

    std::atomic<uint64_t> failed_batches_{0};
    std::atomic<uint64_t> delivered_batches_{0};

    std::thread flush_thread_;
};

/// Validation applied to every SIEM URL by the production factories:
/// http/https only, hostname required, and no private, loopback,
/// link-local, multicast or reserved addresses
[[nodiscard]] core::Status validate_siem_url(std::string_view url);

/// Common base: owns the batcher and the outbound HTTP policy
class SiemBackend : public AuditBackend {
public:
    [[nodiscard]] core::Status write(const StructuredAuditEvent& event) override;
    [[nodiscard]] core::Status close() override;

    void flush() { batcher_->flush(); }

    [[nodiscard]] const SiemBatcher& batcher() const noexcept { return *batcher_; }

protected:
    /// `validate_urls` pins every connection to an SSRF-checked address
    SiemBackend(bool validate_urls, bool tls_verify);

    /// Must be called at the end of the derived constructor
    void start_batcher(std::string_view name, const control::SiemConfig& siem);

    /// Stops the batcher (derived destructors call this first)
    void stop_batcher();

    /// Client for `url`, pinned when URL validation is on
    [[nodiscard]] std::unique_ptr<httplib::Client> make_client(const std::string& url,
                                                               core::Status& status) const;

    [[nodiscard]] virtual core::Status send_batch(
        const std::vector<StructuredAuditEvent>& events) = 0;

private:
    std::optional<security::SsrfValidator> validator_;
    bool tls_verify_;
    std::unique_ptr<SiemBatcher> batcher_;
};

/// Elasticsearch _bulk API (NDJSON), each URL tried in turn
class ElasticsearchBackend final : public SiemBackend {
public:
    /// SSRF-validates every URL; nullptr and `status` on rejection
    [[nodiscard]] static std::unique_ptr<ElasticsearchBackend> create(
        const control::ElasticsearchConfig& config, const control::SiemConfig& siem,
        core::Status& status);

    /// No URL validation (tests against a local collector only)
    [[nodiscard]] static std::unique_ptr<ElasticsearchBackend> create_unchecked(
        const control::ElasticsearchConfig& config, const control::SiemConfig& siem,
        core::Status& status);

    ~ElasticsearchBackend() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "elasticsearch"; }

    /// NDJSON body for one batch
    [[nodiscard]] std::string build_bulk_body(const std::vector<StructuredAuditEvent>& events) const;

protected:
    [[nodiscard]] core::Status send_batch(const std::vector<StructuredAuditEvent>& events) override;

private:
    ElasticsearchBackend(control::ElasticsearchConfig config, const control::SiemConfig& siem,
                         bool validate_urls);

    control::ElasticsearchConfig config_;
};

/// Splunk HTTP Event Collector
class SplunkBackend final : public SiemBackend {
public:
    [[nodiscard]] static std::unique_ptr<SplunkBackend> create(const control::SplunkConfig& config,
                                                               const control::SiemConfig& siem,
                                                               core::Status& status);

    [[nodiscard]] static std::unique_ptr<SplunkBackend> create_unchecked(
        const control::SplunkConfig& config, const control::SiemConfig& siem, core::Status& status);

    ~SplunkBackend() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "splunk"; }

    /// Concatenated HEC event objects for one batch
    [[nodiscard]] std::string build_hec_body(const std::vector<StructuredAuditEvent>& events) const;

protected:
    [[nodiscard]] core::Status send_batch(const std::vector<StructuredAuditEvent>& events) override;

private:
    SplunkBackend(control::SplunkConfig config, const control::SiemConfig& siem, bool validate_urls);

    control::SplunkConfig config_;
    std::string hostname_;
};

/// Generic JSON webhook ({"events":[...],"timestamp":...,"count":N})
class WebhookBackend final : public SiemBackend {
public:
    [[nodiscard]] static std::unique_ptr<WebhookBackend> create(const control::WebhookConfig& config,
                                                                const control::SiemConfig& siem,
                                                                core::Status& status);

    [[nodiscard]] static std::unique_ptr<WebhookBackend> create_unchecked(
        const control::WebhookConfig& config, const control::SiemConfig& siem, core::Status& status);

    ~WebhookBackend() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "webhook"; }

protected:
    [[nodiscard]] core::Status send_batch(const std::vector<StructuredAuditEvent>& events) override;

private:
    WebhookBackend(control::WebhookConfig config, const control::SiemConfig& siem,
                   bool validate_urls);

    control::WebhookConfig config_;
};

}  // namespace warden::audit
