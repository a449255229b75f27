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


// Warden Prompt Injection Detector - Header
// Heuristic detection of instruction override, role hijacking,
// delimiter injection, jailbreak and obfuscated variants

#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../http/regex.hpp"

namespace warden::security {

enum class Sensitivity : uint8_t { Low = 0, Medium = 1, High = 2 };

enum class DetectionCategory : uint8_t {
    None,
    SystemOverride,
    RoleHijacking,
    DelimiterInjection,
    EncodingAttack,
    Jailbreak
};

[[nodiscard]] std::string_view to_string(Sensitivity level) noexcept;
[[nodiscard]] std::string_view to_string(DetectionCategory category) noexcept;

/// Parse "low" / "medium" / "high" (case-insensitive)
[[nodiscard]] std::optional<Sensitivity> parse_sensitivity(std::string_view text);

struct DetectionResult {
    bool detected = false;
    double confidence = 0.0;  // [0, 1]
    DetectionCategory category = DetectionCategory::None;
    std::vector<std::string> matched_patterns;  // Pattern descriptions
    std::string details;

    [[nodiscard]] explicit operator bool() const noexcept { return detected; }
};

/// Detection rule. Active when the detector's sensitivity >= min_level.
struct Pattern {
    http::Regex regex;
    DetectionCategory category;
    double weight;
    std::string description;
    Sensitivity min_level;
};

/// Build a pattern; nullopt (with `error`) if the regex does not compile
[[nodiscard]] std::optional<Pattern> make_pattern(std::string_view regex,
                                                  DetectionCategory category, double weight,
                                                  std::string description, Sensitivity min_level,
                                                  uint32_t options, std::string& error);

/// Thread-safe detector: detect() takes a shared lock, mutation an exclusive one
class PromptInjectionDetector {
public:
    static constexpr size_t kMaxInputSize = 10 * 1024;
    static constexpr size_t kMaxBase64Candidates = 10;

    explicit PromptInjectionDetector(Sensitivity sensitivity = Sensitivity::Medium);

    [[nodiscard]] DetectionResult detect(std::string_view input) const;

    void set_sensitivity(Sensitivity level);
    [[nodiscard]] Sensitivity sensitivity() const;

    void add_pattern(Pattern pattern);

    [[nodiscard]] size_t pattern_count() const;

private:
    // All helpers expect mutex_ held (shared)
    [[nodiscard]] DetectionResult detect_encoding_attack(std::string_view input) const;
    [[nodiscard]] DetectionResult detect_homoglyphs(std::string_view input) const;
    [[nodiscard]] const Pattern* first_match(std::string_view text) const;

    mutable std::shared_mutex mutex_;
    Sensitivity sensitivity_;
    std::vector<Pattern> patterns_;
    std::optional<http::Regex> base64_candidate_;
};

/// Drop zero-width and soft-hyphen code points; collapse space/tab runs
[[nodiscard]] std::string normalize_prompt_text(std::string_view input);

}  // namespace warden::security
