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


// Warden Audit Event - Implementation

#include "audit_event.hpp"

#include <fmt/format.h>

#include <cctype>
#include <ctime>

namespace warden::audit {

using std::chrono::system_clock;

namespace {

bool read_digits(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // namespace

std::string format_rfc3339_nano(system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", utc.tm_year + 1900,
                                  utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec);
    if (nanos > 0) {
        std::string frac = fmt::format("{:09}", nanos);
        while (!frac.empty() && frac.back() == '0') {
            frac.pop_back();
        }
        out += '.';
        out += frac;
    }
    out += 'Z';
    return out;
}

std::optional<system_clock::time_point> parse_rfc3339_nano(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (text.size() < 20 || !read_digits(text, 0, 4, year) || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't') || !read_digits(text, 11, 2, hour) ||
        text[13] != ':' || !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos >= text.size()) {
        return std::nullopt;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int off_h = 0, off_m = 0;
        if (!read_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, off_m)) {
            return std::nullopt;
        }
        offset_seconds = (off_h * 3600 + off_m * 60) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm utc{};
    utc.tm_year = year - 1900;
    utc.tm_mon = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min = minute;
    utc.tm_sec = second;
    std::time_t t = timegm(&utc);

    auto tp = system_clock::time_point(std::chrono::duration_cast<system_clock::duration>(
        std::chrono::seconds(static_cast<int64_t>(t) - offset_seconds) +
        std::chrono::nanoseconds(nanos)));
    return tp;
}

void to_json(nlohmann::json& j, const PrincipalInfo& p) {
    j = nlohmann::json{{"id", p.id}, {"type", p.type}};
    if (!p.roles.empty()) {
        j["roles"] = p.roles;
    }
}

void from_json(const nlohmann::json& j, PrincipalInfo& p) {
    p.id = j.value("id", std::string());
    p.type = j.value("type", std::string());
    p.roles = j.value("roles", std::vector<std::string>{});
}

void to_json(nlohmann::json& j, const ClientInfo& c) {
    j = nlohmann::json::object();
    if (!c.ip_address.empty()) {
        j["ip_address"] = c.ip_address;
    }
    if (!c.user_agent.empty()) {
        j["user_agent"] = c.user_agent;
    }
}

void from_json(const nlohmann::json& j, ClientInfo& c) {
    c.ip_address = j.value("ip_address", std::string());
    c.user_agent = j.value("user_agent", std::string());
}

void to_json(nlohmann::json& j, const StructuredAuditEvent& e) {
    j = nlohmann::json{{"id", e.id}, {"timestamp", format_rfc3339_nano(e.timestamp)}, {"type", e.type}};

    if (!e.request_id.empty()) j["request_id"] = e.request_id;
    if (!e.trace_id.empty()) j["trace_id"] = e.trace_id;
    if (!e.span_id.empty()) j["span_id"] = e.span_id;
    if (e.principal) j["principal"] = *e.principal;
    if (!e.resource.empty()) j["resource"] = e.resource;
    if (!e.action.empty()) j["action"] = e.action;
    j["result"] = e.result;
    if (!e.error.empty()) j["error"] = e.error;
    if (e.duration_ns != 0) j["duration_ns"] = e.duration_ns;
    if (e.metadata.is_object() && !e.metadata.empty()) j["metadata"] = e.metadata;
    if (e.client_info) j["client_info"] = *e.client_info;
}

void from_json(const nlohmann::json& j, StructuredAuditEvent& e) {
    e.id = j.value("id", std::string());
    if (auto ts = parse_rfc3339_nano(j.value("timestamp", std::string()))) {
        e.timestamp = *ts;
    }
    e.type = j.value("type", std::string());
    e.request_id = j.value("request_id", std::string());
    e.trace_id = j.value("trace_id", std::string());
    e.span_id = j.value("span_id", std::string());
    if (j.contains("principal") && j.at("principal").is_object()) {
        e.principal = j.at("principal").get<PrincipalInfo>();
    }
    e.resource = j.value("resource", std::string());
    e.action = j.value("action", std::string());
    e.result = j.value("result", std::string());
    e.error = j.value("error", std::string());
    e.duration_ns = j.value("duration_ns", int64_t{0});
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        e.metadata = j.at("metadata");
    } else {
        e.metadata = nlohmann::json::object();
    }
    if (j.contains("client_info") && j.at("client_info").is_object()) {
        e.client_info = j.at("client_info").get<ClientInfo>();
    }
}

}  // namespace warden::audit
