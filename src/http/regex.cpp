#include "regex.hpp"

#include <cstdint>
#include <cstring>

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace conduit::http {

// Helper to convert error code to string
static std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

namespace {

// Owns a match data block for the duration of one call
class MatchData {
public:
    explicit MatchData(const pcre2_code* code)
        : data_(pcre2_match_data_create_from_pattern(code, nullptr)) {}
    ~MatchData() {
        if (data_) {
            pcre2_match_data_free(data_);
        }
    }

    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;

    [[nodiscard]] pcre2_match_data* get() const noexcept { return data_; }

private:
    pcre2_match_data* data_;
};

int run_match(const pcre2_code* code, std::string_view subject, size_t offset,
              pcre2_match_data* match_data) {
    return pcre2_match(code, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                       offset,
                       0,  // options
                       match_data, nullptr);
}

std::vector<std::string_view> collect_groups(std::string_view subject, pcre2_match_data* match_data,
                                             int rc) {
    std::vector<std::string_view> groups;
    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data);

    // rc is the number of captured groups + 1 (full match); trailing unset groups are not counted
    uint32_t total = pcre2_get_ovector_count(match_data);
    for (uint32_t i = 0; i < total; ++i) {
        PCRE2_SIZE start = ovector[2 * i];
        PCRE2_SIZE end = ovector[2 * i + 1];

        if (static_cast<int>(i) >= rc || start == PCRE2_UNSET) {
            groups.emplace_back();  // Unmatched group
        } else {
            groups.push_back(subject.substr(start, end - start));
        }
    }
    return groups;
}

}  // namespace

// Regex implementation

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

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string error_message;
    return compile(pattern, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code;
    PCRE2_SIZE error_offset;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                               0,  // options (default)
                               &error_code, &error_offset, nullptr);

    if (!code) {
        error_message = get_pcre2_error(error_code) + " at offset " + std::to_string(error_offset) +
                        " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

std::string Regex::escape(std::string_view literal) {
    static constexpr std::string_view kMeta = "\\^$.|?*+()[]{}/-#";

    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kMeta.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

bool Regex::matches(std::string_view subject) const {
    MatchData match_data(code_);
    if (!match_data.get()) {
        return false;
    }

    return run_match(code_, subject, 0, match_data.get()) >= 0;  // >= 0 means match found
}

std::optional<std::string_view> Regex::find_first(std::string_view subject) const {
    MatchData match_data(code_);
    if (!match_data.get()) {
        return std::nullopt;
    }

    if (run_match(code_, subject, 0, match_data.get()) < 0) {
        return std::nullopt;
    }

    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data.get());
    return subject.substr(ovector[0], ovector[1] - ovector[0]);
}

std::vector<std::string_view> Regex::extract_groups(std::string_view subject) const {
    MatchData match_data(code_);
    if (!match_data.get()) {
        return {};
    }

    int rc = run_match(code_, subject, 0, match_data.get());
    if (rc < 0) {
        return {};
    }

    return collect_groups(subject, match_data.get(), rc);
}

std::optional<std::string> Regex::replace(std::string_view subject,
                                          const MatchEvaluator& evaluator) const {
    MatchData match_data(code_);
    if (!match_data.get()) {
        return std::nullopt;
    }

    std::string output;
    output.reserve(subject.size());

    size_t offset = 0;
    size_t copied = 0;
    while (offset <= subject.size()) {
        int rc = run_match(code_, subject, offset, match_data.get());
        if (rc == PCRE2_ERROR_NOMATCH) {
            break;
        }
        if (rc < 0) {
            return std::nullopt;
        }

        PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data.get());
        size_t start = ovector[0];
        size_t end = ovector[1];

        output.append(subject.substr(copied, start - copied));
        output += evaluator(collect_groups(subject, match_data.get(), rc));
        copied = end;

        // Empty match: step forward one character to guarantee progress
        if (end == start) {
            if (end < subject.size()) {
                output += subject[end];
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

}  // namespace conduit::http
