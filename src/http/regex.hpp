#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace warden::http {

// Compile-time options for Regex::compile
enum RegexOptions : uint32_t {
    kRegexDefault = 0,
    kRegexCaseless = 1u << 0,
    kRegexMultiline = 1u << 1,
};

// PCRE2 wrapper for regex compilation and execution
// Thread-safe for read operations after compilation
class Regex {
public:
    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      uint32_t options = kRegexDefault);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      uint32_t options,
                                                      std::string& error_message);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Check if pattern matches anywhere in the subject
    [[nodiscard]] bool matches(std::string_view subject) const;

    // Check if pattern matches the whole subject
    [[nodiscard]] bool full_match(std::string_view subject) const;

    // Find first match and return matched substring
    [[nodiscard]] std::optional<std::string_view> find_first(std::string_view subject) const;

    // Collect up to max_matches non-overlapping matches, left to right
    [[nodiscard]] std::vector<std::string_view> find_all(std::string_view subject,
                                                         size_t max_matches) const;

    // Replace every match with a literal replacement
    [[nodiscard]] std::string replace_all(std::string_view subject,
                                          std::string_view replacement) const;

    // Get the original pattern string
    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;      // Original pattern (for debugging)
};

}  // namespace warden::http
