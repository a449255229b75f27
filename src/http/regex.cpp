#include "regex.hpp"

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace warden::http {

// Helper to convert error code to string
static std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

// RAII holder for per-call match data
namespace {
struct MatchData {
    explicit MatchData(const pcre2_code* code)
        : data(pcre2_match_data_create_from_pattern(code, nullptr)) {}
    ~MatchData() {
        if (data) {
            pcre2_match_data_free(data);
        }
    }
    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;

    pcre2_match_data* data;
};
}  // namespace

Regex::Regex(pcre2_real_code_8* code, std::string pattern)
    : code_(code), pattern_(std::move(pattern)) {}

Regex::Regex(Regex&& other) noexcept : code_(other.code_), pattern_(std::move(other.pattern_)) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    if (code_) {
        pcre2_code_free(code_);
    }
}

std::optional<Regex> Regex::compile(std::string_view pattern, uint32_t options) {
    std::string error_message;
    return compile(pattern, options, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, uint32_t options,
                                    std::string& error_message) {
    uint32_t pcre_options = 0;
    if (options & kRegexCaseless) {
        pcre_options |= PCRE2_CASELESS;
    }
    if (options & kRegexMultiline) {
        pcre_options |= PCRE2_MULTILINE;
    }

    int error_code;
    PCRE2_SIZE error_offset;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                               pcre_options, &error_code, &error_offset, nullptr);

    if (!code) {
        error_message = get_pcre2_error(error_code) + " at offset " + std::to_string(error_offset) +
                        " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

bool Regex::matches(std::string_view subject) const {
    return find_first(subject).has_value();
}

bool Regex::full_match(std::string_view subject) const {
    MatchData match(code_);
    if (!match.data) {
        return false;
    }

    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         0, PCRE2_ANCHORED | PCRE2_ENDANCHORED, match.data, nullptr);
    return rc >= 0;
}

std::optional<std::string_view> Regex::find_first(std::string_view subject) const {
    auto all = find_all(subject, 1);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::vector<std::string_view> Regex::find_all(std::string_view subject,
                                              size_t max_matches) const {
    std::vector<std::string_view> found;

    MatchData match(code_);
    if (!match.data) {
        return found;
    }

    PCRE2_SIZE offset = 0;
    while (found.size() < max_matches && offset <= subject.size()) {
        int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                             offset, 0, match.data, nullptr);
        if (rc < 0) {
            break;
        }

        PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match.data);
        PCRE2_SIZE start = ovector[0];
        PCRE2_SIZE end = ovector[1];
        found.push_back(subject.substr(start, end - start));

        // Empty match: step forward to avoid looping forever
        offset = (end == start) ? end + 1 : end;
    }

    return found;
}

std::string Regex::replace_all(std::string_view subject, std::string_view replacement) const {
    std::string output;
    output.reserve(subject.size());

    MatchData match(code_);
    if (!match.data) {
        return std::string(subject);
    }

    PCRE2_SIZE offset = 0;
    PCRE2_SIZE copied = 0;
    while (offset <= subject.size()) {
        int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                             offset, 0, match.data, nullptr);
        if (rc < 0) {
            break;
        }

        PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match.data);
        PCRE2_SIZE start = ovector[0];
        PCRE2_SIZE end = ovector[1];

        output.append(subject.substr(copied, start - copied));
        output.append(replacement);
        copied = end;

        if (end == start) {
            if (end < subject.size()) {
                output.push_back(subject[end]);
            }
            copied = end + 1;
            offset = end + 1;
        } else {
            offset = end;
        }
    }

    if (copied < subject.size()) {
        output.append(subject.substr(copied));
    }
    return output;
}

}  // namespace warden::http
