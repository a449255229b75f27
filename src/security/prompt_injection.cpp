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


// Warden Prompt Injection Detector - Implementation

#include "prompt_injection.hpp"

#include <algorithm>
#include <mutex>

#include "../core/base64.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace warden::security {

std::string_view to_string(Sensitivity level) noexcept {
    switch (level) {
        case Sensitivity::Low:
            return "low";
        case Sensitivity::Medium:
            return "medium";
        case Sensitivity::High:
            return "high";
    }
    return "medium";
}

std::string_view to_string(DetectionCategory category) noexcept {
    switch (category) {
        case DetectionCategory::None:
            return "";
        case DetectionCategory::SystemOverride:
            return "system_override";
        case DetectionCategory::RoleHijacking:
            return "role_hijacking";
        case DetectionCategory::DelimiterInjection:
            return "delimiter_injection";
        case DetectionCategory::EncodingAttack:
            return "encoding_attack";
        case DetectionCategory::Jailbreak:
            return "jailbreak";
    }
    return "";
}

std::optional<Sensitivity> parse_sensitivity(std::string_view text) {
    std::string lower = core::to_lower(text);
    if (lower == "low") {
        return Sensitivity::Low;
    }
    if (lower == "medium") {
        return Sensitivity::Medium;
    }
    if (lower == "high") {
        return Sensitivity::High;
    }
    return std::nullopt;
}

std::optional<Pattern> make_pattern(std::string_view regex, DetectionCategory category,
                                    double weight, std::string description, Sensitivity min_level,
                                    uint32_t options, std::string& error) {
    auto compiled = http::Regex::compile(regex, options, error);
    if (!compiled) {
        return std::nullopt;
    }
    return Pattern{std::move(*compiled), category, weight, std::move(description), min_level};
}

// ============================================================================
// UTF-8 helpers
// ============================================================================

namespace {

// Decode one code point at `pos`; advances `pos`. Invalid bytes decode as
// themselves (one byte).
uint32_t next_code_point(std::string_view s, size_t& pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char c = byte(pos);

    size_t len = 1;
    uint32_t cp = c;
    if (c >= 0xC0 && c < 0xE0) {
        len = 2;
        cp = c & 0x1F;
    } else if (c >= 0xE0 && c < 0xF0) {
        len = 3;
        cp = c & 0x0F;
    } else if (c >= 0xF0 && c < 0xF8) {
        len = 4;
        cp = c & 0x07;
    }

    if (len == 1 || pos + len > s.size()) {
        ++pos;
        return c;
    }
    for (size_t i = 1; i < len; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            ++pos;
            return c;
        }
        cp = (cp << 6) | (byte(pos + i) & 0x3F);
    }
    pos += len;
    return cp;
}

bool is_invisible(uint32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0xFEFF || cp == 0x00AD ||
           cp == 0x2060;
}

// Latin look-alike for a Cyrillic/Greek code point, or 0
char homoglyph_for(uint32_t cp) {
    switch (cp) {
        // Cyrillic lower case
        case 0x0430: return 'a';
        case 0x0435: return 'e';
        case 0x043E: return 'o';
        case 0x0440: return 'p';
        case 0x0441: return 'c';
        case 0x0445: return 'x';
        case 0x0443: return 'y';
        case 0x0456: return 'i';
        // Greek capitals
        case 0x0391: return 'A';
        case 0x0392: return 'B';
        case 0x0395: return 'E';
        case 0x0397: return 'H';
        case 0x0399: return 'I';
        case 0x039A: return 'K';
        case 0x039C: return 'M';
        case 0x039D: return 'N';
        case 0x039F: return 'O';
        case 0x03A1: return 'P';
        case 0x03A4: return 'T';
        case 0x03A7: return 'X';
        case 0x03A5: return 'Y';
        // Cyrillic Ze
        case 0x0417: return 'Z';
        default: return 0;
    }
}

bool is_ascii_letter(uint32_t cp) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
}

// Cut at `limit` bytes without splitting a multi-byte sequence
std::string_view truncate_utf8(std::string_view input, size_t limit) {
    if (input.size() <= limit) {
        return input;
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(input[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return input.substr(0, cut);
}

struct BuiltinPattern {
    const char* regex;
    DetectionCategory category;
    double weight;
    const char* description;
    Sensitivity min_level;
    bool caseless;
};

constexpr BuiltinPattern kBuiltinPatterns[] = {
    // Instruction override
    {R"(ignore\s+(all\s+)?previous\s+instructions?)", DetectionCategory::SystemOverride, 1.0,
     "ignore previous instructions", Sensitivity::Low, true},
    {R"(disregard\s+(your\s+|all\s+)?instructions?)", DetectionCategory::SystemOverride, 1.0,
     "disregard instructions", Sensitivity::Low, true},
    {R"(forget\s+(everything|all|your\s+instructions?))", DetectionCategory::SystemOverride, 1.0,
     "forget instructions", Sensitivity::Low, true},
    {R"(override\s+(your\s+)?(system|instructions?|programming))",
     DetectionCategory::SystemOverride, 0.9, "override system", Sensitivity::Low, true},
    {R"(new\s+instructions?:\s*)", DetectionCategory::SystemOverride, 0.7, "new instructions",
     Sensitivity::Medium, true},

    // Role hijacking
    {R"(you\s+are\s+now\s+a)", DetectionCategory::RoleHijacking, 1.0, "you are now",
     Sensitivity::Low, true},
    {R"(pretend\s+(to\s+be|you\s+are))", DetectionCategory::RoleHijacking, 0.9, "pretend to be",
     Sensitivity::Low, true},
    {R"(act\s+as\s+(if|though|a))", DetectionCategory::RoleHijacking, 0.8, "act as if",
     Sensitivity::Low, true},
    {R"(roleplay\s+as)", DetectionCategory::RoleHijacking, 0.7, "roleplay as",
     Sensitivity::Medium, true},
    {R"(as\s+an\s+ai\s+(assistant|model|system))", DetectionCategory::RoleHijacking, 0.6,
     "as an AI", Sensitivity::Medium, true},
    {R"(imagine\s+you\s+are)", DetectionCategory::RoleHijacking, 0.6, "imagine you are",
     Sensitivity::Medium, true},

    // Delimiter injection
    {R"(^system:\s*)", DetectionCategory::DelimiterInjection, 1.0, "system prefix",
     Sensitivity::Low, true},
    {R"(\[INST\])", DetectionCategory::DelimiterInjection, 1.0, "instruction tag",
     Sensitivity::Low, true},
    {R"(\[/INST\])", DetectionCategory::DelimiterInjection, 1.0, "instruction end tag",
     Sensitivity::Low, true},
    {R"(###\s*(System|Instruction|Human|Assistant))", DetectionCategory::DelimiterInjection, 0.9,
     "markdown role header", Sensitivity::Low, true},
    {R"(<\|?(system|user|assistant|im_start|im_end)\|?>)", DetectionCategory::DelimiterInjection,
     1.0, "chat template tags", Sensitivity::Low, false},
    {R"(</?system>)", DetectionCategory::DelimiterInjection, 0.9, "system XML tags",
     Sensitivity::Low, true},
    {R"(Human:\s*$)", DetectionCategory::DelimiterInjection, 0.7, "human turn marker",
     Sensitivity::Medium, true},
    {R"(Assistant:\s*$)", DetectionCategory::DelimiterInjection, 0.7, "assistant turn marker",
     Sensitivity::Medium, true},

    // Jailbreak
    {R"(\bDAN\s+(mode|prompt))", DetectionCategory::Jailbreak, 0.9, "DAN jailbreak",
     Sensitivity::Low, true},
    {R"(jailbreak)", DetectionCategory::Jailbreak, 0.8, "jailbreak keyword", Sensitivity::Medium,
     true},
    {R"(developer\s+mode)", DetectionCategory::Jailbreak, 0.7, "developer mode",
     Sensitivity::Medium, true},
    {R"(bypass\s+(your\s+)?(filter|restriction|safety))", DetectionCategory::Jailbreak, 0.9,
     "bypass safety", Sensitivity::Low, true},
};

}  // namespace

std::string normalize_prompt_text(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    bool in_blank_run = false;
    while (pos < input.size()) {
        size_t start = pos;
        uint32_t cp = next_code_point(input, pos);
        if (is_invisible(cp)) {
            continue;
        }
        if (cp == ' ' || cp == '\t') {
            if (!in_blank_run) {
                out.push_back(' ');
                in_blank_run = true;
            }
            continue;
        }
        in_blank_run = false;
        out.append(input.substr(start, pos - start));
    }
    return out;
}

// ============================================================================
// Detector
// ============================================================================

PromptInjectionDetector::PromptInjectionDetector(Sensitivity sensitivity)
    : sensitivity_(sensitivity) {
    patterns_.reserve(std::size(kBuiltinPatterns));
    for (const auto& builtin : kBuiltinPatterns) {
        std::string error;
        auto pattern = make_pattern(builtin.regex, builtin.category, builtin.weight,
                                    builtin.description, builtin.min_level,
                                    builtin.caseless ? http::kRegexCaseless : http::kRegexDefault,
                                    error);
        if (!pattern) {
            WARDEN_LOG_ERROR("Prompt injection pattern rejected: {}", error);
            continue;
        }
        patterns_.push_back(std::move(*pattern));
    }

    base64_candidate_ = http::Regex::compile(R"([A-Za-z0-9+/]{20,}={0,2})");
}

void PromptInjectionDetector::set_sensitivity(Sensitivity level) {
    std::unique_lock lock(mutex_);
    sensitivity_ = level;
}

Sensitivity PromptInjectionDetector::sensitivity() const {
    std::shared_lock lock(mutex_);
    return sensitivity_;
}

void PromptInjectionDetector::add_pattern(Pattern pattern) {
    std::unique_lock lock(mutex_);
    patterns_.push_back(std::move(pattern));
}

size_t PromptInjectionDetector::pattern_count() const {
    std::shared_lock lock(mutex_);
    return patterns_.size();
}

const Pattern* PromptInjectionDetector::first_match(std::string_view text) const {
    for (const auto& pattern : patterns_) {
        if (pattern.min_level > sensitivity_) {
            continue;
        }
        if (pattern.regex.matches(text)) {
            return &pattern;
        }
    }
    return nullptr;
}

DetectionResult PromptInjectionDetector::detect(std::string_view input) const {
    DetectionResult result;
    if (input.empty()) {
        return result;
    }

    input = truncate_utf8(input, kMaxInputSize);

    std::shared_lock lock(mutex_);

    std::string normalized = normalize_prompt_text(input);

    if (auto encoded = detect_encoding_attack(normalized)) {
        return encoded;
    }

    if (sensitivity_ >= Sensitivity::Medium) {
        if (auto homoglyph = detect_homoglyphs(normalized)) {
            return homoglyph;
        }
    }

    for (const auto& pattern : patterns_) {
        if (pattern.min_level > sensitivity_) {
            continue;
        }
        if (!pattern.regex.matches(normalized)) {
            continue;
        }
        result.matched_patterns.push_back(pattern.description);
        if (pattern.weight > result.confidence) {
            result.confidence = pattern.weight;
            result.category = pattern.category;
        }
    }

    if (!result.matched_patterns.empty()) {
        result.detected = true;
        double extra = 0.1 * static_cast<double>(result.matched_patterns.size() - 1);
        result.confidence = std::min(1.0, result.confidence + extra);
        result.details = "Detected potential prompt injection attack";
    }

    return result;
}

DetectionResult PromptInjectionDetector::detect_encoding_attack(std::string_view input) const {
    DetectionResult result;
    if (!base64_candidate_) {
        return result;
    }

    for (auto candidate : base64_candidate_->find_all(input, kMaxBase64Candidates)) {
        auto decoded = core::base64_decode(candidate);
        if (!decoded) {
            continue;
        }

        if (const Pattern* hit = first_match(core::to_lower(*decoded))) {
            result.detected = true;
            result.confidence = 0.95;
            result.category = DetectionCategory::EncodingAttack;
            result.matched_patterns.push_back("base64 encoded: " + hit->description);
            result.details = "Detected base64-encoded prompt injection";
            return result;
        }
    }

    return result;
}

DetectionResult PromptInjectionDetector::detect_homoglyphs(std::string_view input) const {
    DetectionResult result;

    std::string mapped;
    mapped.reserve(input.size());
    size_t homoglyph_count = 0;
    size_t ascii_letters = 0;

    size_t pos = 0;
    while (pos < input.size()) {
        size_t start = pos;
        uint32_t cp = next_code_point(input, pos);
        if (char latin = homoglyph_for(cp)) {
            mapped.push_back(latin);
            ++homoglyph_count;
            continue;
        }
        if (is_ascii_letter(cp)) {
            ++ascii_letters;
        }
        mapped.append(input.substr(start, pos - start));
    }

    if (homoglyph_count == 0) {
        return result;
    }

    if (const Pattern* hit = first_match(core::to_lower(mapped))) {
        result.detected = true;
        result.confidence = 0.9;
        result.category = DetectionCategory::EncodingAttack;
        result.matched_patterns.push_back("homoglyph attack: " + hit->description);
        result.details = "Detected unicode homoglyph obfuscation";
        return result;
    }

    if (sensitivity_ >= Sensitivity::High && homoglyph_count > 3 && ascii_letters > 0) {
        double ratio = static_cast<double>(homoglyph_count) /
                       static_cast<double>(ascii_letters + homoglyph_count);
        if (ratio > 0.1) {
            result.detected = true;
            result.confidence = 0.5;
            result.category = DetectionCategory::EncodingAttack;
            result.matched_patterns.push_back("suspicious homoglyph usage");
            result.details = "High ratio of unicode homoglyphs detected";
        }
    }

    return result;
}

}  // namespace warden::security
