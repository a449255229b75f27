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


// Warden Audit Backends - Header
// Delivery targets for audit events (memory, local file or stream)

#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/status.hpp"
#include "audit_event.hpp"

namespace warden::audit {

/// Audit delivery target. Implementations are safe to call from any thread.
class AuditBackend {
public:
    virtual ~AuditBackend() = default;

    [[nodiscard]] virtual core::Status write(const StructuredAuditEvent& event) = 0;

    /// Flush and release resources. Further writes fail.
    [[nodiscard]] virtual core::Status close() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Keeps every event in memory (tests and development)
class MemoryAuditBackend final : public AuditBackend {
public:
    [[nodiscard]] core::Status write(const StructuredAuditEvent& event) override;
    [[nodiscard]] core::Status close() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

    /// Snapshot copy
    [[nodiscard]] std::vector<StructuredAuditEvent> events() const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<StructuredAuditEvent> events_;
};

/// One JSON document per line, appended to a file descriptor
class FileAuditBackend final : public AuditBackend {
public:
    /// Validate `path` (no traversal, no NUL) and open it
    /// O_APPEND|O_CREAT|O_WRONLY with mode 0600. Returns nullptr on failure.
    [[nodiscard]] static std::unique_ptr<FileAuditBackend> open(const std::string& path,
                                                                core::Status& status);

    /// Write to an already open descriptor (stdout for backend=json)
    [[nodiscard]] static std::unique_ptr<FileAuditBackend> from_fd(int fd, bool owned);

    ~FileAuditBackend() override;

    FileAuditBackend(const FileAuditBackend&) = delete;
    FileAuditBackend& operator=(const FileAuditBackend&) = delete;

    [[nodiscard]] core::Status write(const StructuredAuditEvent& event) override;
    [[nodiscard]] core::Status close() override;
    [[nodiscard]] std::string_view name() const noexcept override { return "file"; }

private:
    FileAuditBackend(int fd, bool owned) noexcept;

    std::mutex mutex_;
    int fd_ = -1;
    bool owned_ = false;
    bool closed_ = false;
};

}  // namespace warden::audit
