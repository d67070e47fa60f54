#include "locator/pattern_detectors.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace vecture {

namespace {

bool is_word_byte(char c) {
    const auto uc = static_cast<unsigned char>(c);
    // Bytes of multi-byte UTF-8 sequences count as word characters so a
    // capital after an accented letter is not treated as a word start.
    return uc >= 0x80 || std::isalnum(uc) || c == '_';
}

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

void sort_spans(std::vector<Span>& spans) {
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.start != b.start ? a.start < b.start : a.end < b.end;
    });
    spans.erase(std::unique(spans.begin(), spans.end()), spans.end());
}

} // anonymous namespace

// ============================================================================
// RegexDetector
// ============================================================================

RegexDetector::RegexDetector(Category category, std::regex regex, Validator validator)
    : category_(category),
      regex_(std::move(regex)),
      validator_(std::move(validator)) {}

Result<std::shared_ptr<RegexDetector>> RegexDetector::create(
    Category category,
    std::string_view pattern,
    Validator validator) {

    using R = Result<std::shared_ptr<RegexDetector>>;

    if (pattern.empty()) {
        return R::error(ErrorCode::INVALID_PATTERN,
            std::format("Empty pattern for class {}", category_to_string(category)));
    }

    try {
        std::regex compiled(pattern.begin(), pattern.end(), std::regex::ECMAScript);
        return R::ok(std::make_shared<RegexDetector>(
            category, std::move(compiled), std::move(validator)));
    } catch (const std::regex_error& e) {
        return R::error(ErrorCode::INVALID_PATTERN,
            std::format("Invalid pattern for class {}: {}", category_to_string(category), e.what()));
    }
}

Result<std::shared_ptr<RegexDetector>> RegexDetector::create_default(Category category) {
    switch (category) {
        case Category::IPV4:
            return create(category, kDefaultIpv4Pattern, validate_ipv4);
        case Category::DATE:
            return create(category, kDefaultDatePattern);
        case Category::EMAIL:
            return create(category, kDefaultEmailPattern);
        default:
            return Result<std::shared_ptr<RegexDetector>>::error(ErrorCode::INVALID_PATTERN,
                std::format("Class {} is not a structural pattern class", category_to_string(category)));
    }
}

std::vector<Span> RegexDetector::detect(std::string_view text) const {
    std::vector<Span> spans;
    if (text.empty()) return spans;

    const char* base = text.data();
    std::cregex_iterator it(base, base + text.size(), regex_);
    const std::cregex_iterator end;

    for (; it != end; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;

        const auto start = static_cast<size_t>(m.position(0));
        const auto len = static_cast<size_t>(m.length(0));
        if (validator_ && !validator_(text.substr(start, len))) continue;

        spans.emplace_back(start, start + len, category_);
    }
    return spans;
}

bool validate_ipv4(std::string_view candidate) {
    int octets = 0;
    int value = 0;
    int digits = 0;

    for (const char c : candidate) {
        if (c == '.') {
            if (digits == 0 || value > 255) return false;
            ++octets;
            value = 0;
            digits = 0;
        } else if (c >= '0' && c <= '9') {
            value = value * 10 + (c - '0');
            if (++digits > 3) return false;
        } else {
            return false;
        }
    }
    return octets == 3 && digits > 0 && value <= 255;
}

// ============================================================================
// CustomTermDetector
// ============================================================================

Result<std::shared_ptr<CustomTermDetector>> CustomTermDetector::create(
    std::vector<std::string> terms) {

    for (size_t i = 0; i < terms.size(); ++i) {
        if (terms[i].empty()) {
            return Result<std::shared_ptr<CustomTermDetector>>::error(
                ErrorCode::INVALID_PATTERN,
                std::format("Custom term #{} is empty", i + 1));
        }
    }
    return Result<std::shared_ptr<CustomTermDetector>>::ok(
        std::make_shared<CustomTermDetector>(std::move(terms)));
}

CustomTermDetector::CustomTermDetector(std::vector<std::string> terms)
    : terms_(std::move(terms)) {}

std::vector<Span> CustomTermDetector::detect(std::string_view text) const {
    std::vector<Span> spans;

    for (const auto& term : terms_) {
        if (term.empty()) continue;
        size_t pos = text.find(term);
        while (pos != std::string_view::npos) {
            spans.emplace_back(pos, pos + term.size(), Category::CUSTOM_TERM);
            pos = text.find(term, pos + term.size());
        }
    }

    sort_spans(spans);
    return spans;
}

// ============================================================================
// CapitalizedHeuristicDetector
// ============================================================================

CapitalizedHeuristicDetector::CapitalizedHeuristicDetector(const Config& config)
    : config_(config) {}

bool CapitalizedHeuristicDetector::at_sentence_start(std::string_view text, size_t pos) {
    size_t i = pos;

    // Opening quotes/brackets directly before the word
    while (i > 0 && (text[i - 1] == '"' || text[i - 1] == '\'' || text[i - 1] == '(')) {
        --i;
    }

    int newlines = 0;
    bool saw_space = false;
    while (i > 0) {
        const char c = text[i - 1];
        if (c == '\n') {
            ++newlines;
        } else if (c != ' ' && c != '\t' && c != '\r') {
            break;
        }
        saw_space = true;
        --i;
    }

    if (i == 0) return true;
    if (newlines >= 2) return true;

    const char prev = text[i - 1];
    return saw_space && (prev == '.' || prev == '!' || prev == '?');
}

std::vector<Span> CapitalizedHeuristicDetector::detect(std::string_view text) const {
    struct Token {
        size_t start;
        size_t end;
    };

    std::vector<Token> tokens;
    const size_t n = text.size();

    for (size_t i = 0; i < n; ++i) {
        if (!is_upper(text[i])) continue;
        if (i > 0 && is_word_byte(text[i - 1])) continue;

        size_t j = i + 1;
        while (j < n && is_lower(text[j])) ++j;
        if (j == i + 1) continue;                       // lone capital
        if (j < n && is_word_byte(text[j])) continue;   // "McDonald", "Foo2"

        tokens.push_back({i, j});
        i = j - 1;
    }

    std::vector<Span> spans;
    size_t idx = 0;
    while (idx < tokens.size()) {
        // Grow a run while tokens are separated by exactly one space
        size_t last = idx;
        while (last + 1 < tokens.size() &&
               tokens[last + 1].start == tokens[last].end + 1 &&
               text[tokens[last].end] == ' ') {
            ++last;
        }

        size_t first = idx;
        if (config_.skip_sentence_initial && at_sentence_start(text, tokens[first].start)) {
            ++first;
        }
        if (first <= last) {
            spans.emplace_back(tokens[first].start, tokens[last].end,
                               Category::CAPITALIZED_HEURISTIC);
        }
        idx = last + 1;
    }
    return spans;
}

} // namespace vecture
