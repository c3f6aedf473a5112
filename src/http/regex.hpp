#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace conduit::http {

// PCRE2 wrapper for regex compilation and execution
// Thread-safe for read operations after compilation
class Regex {
public:
    // Receives the capture groups of one match (index 0 is the full match,
    // unmatched groups are empty views) and returns the replacement text
    using MatchEvaluator = std::function<std::string(const std::vector<std::string_view>& groups)>;

    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Escape every regex metacharacter so the text matches literally
    [[nodiscard]] static std::string escape(std::string_view literal);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    // Delete copy operations
    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Check if pattern matches the subject string
    [[nodiscard]] bool matches(std::string_view subject) const;

    // Find first match and return matched substring
    [[nodiscard]] std::optional<std::string_view> find_first(std::string_view subject) const;

    // Extract capture groups from first match
    // Returns empty vector if no match
    // Index 0 is the full match, 1+ are capture groups
    [[nodiscard]] std::vector<std::string_view> extract_groups(std::string_view subject) const;

    // Replace every non-overlapping match with the evaluator's result
    // Returns nullopt on a matching error (e.g. match limit exceeded)
    [[nodiscard]] std::optional<std::string> replace(std::string_view subject,
                                                     const MatchEvaluator& evaluator) const;

    // Get the original pattern string
    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;      // Original pattern (for debugging)
};

}  // namespace conduit::http
