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


// Warden Audit Backends - Implementation

#include "audit_backend.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../security/validation.hpp"

namespace warden::audit {

using core::ErrorKind;
using core::Status;

// ============================================================================
// MemoryAuditBackend
// ============================================================================

Status MemoryAuditBackend::write(const StructuredAuditEvent& event) {
    std::unique_lock lock(mutex_);
    events_.push_back(event);
    return Status::success();
}

Status MemoryAuditBackend::close() {
    return Status::success();
}

std::vector<StructuredAuditEvent> MemoryAuditBackend::events() const {
    std::shared_lock lock(mutex_);
    return events_;
}

size_t MemoryAuditBackend::size() const {
    std::shared_lock lock(mutex_);
    return events_.size();
}

void MemoryAuditBackend::clear() {
    std::unique_lock lock(mutex_);
    events_.clear();
}

// ============================================================================
// FileAuditBackend
// ============================================================================

FileAuditBackend::FileAuditBackend(int fd, bool owned) noexcept : fd_(fd), owned_(owned) {}

FileAuditBackend::~FileAuditBackend() {
    (void)close();
}

std::unique_ptr<FileAuditBackend> FileAuditBackend::open(const std::string& path, Status& status) {
    if (auto valid = security::validate_file_path(path); !valid) {
        status = Status::failure(ErrorKind::Validation, "invalid audit file path: " + valid.error);
        return nullptr;
    }

    int fd = ::open(path.c_str(), O_APPEND | O_CREAT | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        status = Status::failure(ErrorKind::AuditDelivery,
                                 std::string("failed to open audit file: ") + std::strerror(errno));
        return nullptr;
    }

    status = Status::success();
    return std::unique_ptr<FileAuditBackend>(new FileAuditBackend(fd, true));
}

std::unique_ptr<FileAuditBackend> FileAuditBackend::from_fd(int fd, bool owned) {
    return std::unique_ptr<FileAuditBackend>(new FileAuditBackend(fd, owned));
}

Status FileAuditBackend::write(const StructuredAuditEvent& event) {
    std::string line;
    try {
        nlohmann::json j = event;
        line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return Status::failure(ErrorKind::AuditDelivery,
                               std::string("failed to marshal audit event: ") + e.what());
    }
    line += '\n';

    std::lock_guard lock(mutex_);
    if (closed_) {
        return Status::failure(ErrorKind::AuditDelivery, "backend is closed");
    }

    // Single write per event under the lock keeps lines whole
    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status::failure(ErrorKind::AuditDelivery,
                                   std::string("failed to write audit event: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    return Status::success();
}

Status FileAuditBackend::close() {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return Status::success();
    }
    closed_ = true;

    if (owned_ && fd_ >= 0) {
        if (::close(fd_) != 0) {
            fd_ = -1;
            return Status::failure(ErrorKind::AuditDelivery,
                                   std::string("failed to close audit file: ") + std::strerror(errno));
        }
    }
    fd_ = -1;
    return Status::success();
}

}  // namespace warden::audit
