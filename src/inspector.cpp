// ═══════════════════════════════════════════════════════════════════
//  src/inspector.cpp — SQL-token and tag scanning over raw bodies
// ═══════════════════════════════════════════════════════════════════

#include "reqguard/inspector.h"

#include <cstdint>

namespace reqguard::inspect {

namespace {

constexpr const char* kSqlPattern = "(SELECT|INSERT|UPDATE|DELETE|DROP|;|--|#)";
constexpr const char* kXssPattern = "<[^>]+>";

} // namespace

const char* toString(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::SqlInjectionSuspected: return "sql_injection_suspected";
        case RejectionKind::XssSuspected:          return "xss_suspected";
        case RejectionKind::InvalidEncoding:       return "invalid_encoding";
    }
    return "unknown";
}

BodyInspector::BodyInspector()
    : sqlTokens_(kSqlPattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
{}

Verdict BodyInspector::inspect(std::string_view body) const {
    if (body.empty()) return Verdict::accept();

    if (!isValidUtf8(body)) {
        return Verdict::reject(RejectionKind::InvalidEncoding);
    }
    if (containsSqlToken(body)) {
        return Verdict::reject(RejectionKind::SqlInjectionSuspected);
    }
    if (containsTag(body)) {
        return Verdict::reject(RejectionKind::XssSuspected);
    }
    return Verdict::accept();
}

bool BodyInspector::containsSqlToken(std::string_view text) const {
    return std::regex_search(text.begin(), text.end(), sqlTokens_);
}

// Same language as <[^>]+>, scanned linearly. The backtracking std::regex
// executor recurses once per consumed character, so a long unterminated
// "<aaaa..." would exhaust the stack.
bool BodyInspector::containsTag(std::string_view text) {
    std::size_t open = text.find('<');
    while (open != std::string_view::npos) {
        if (open + 1 < text.size() && text[open + 1] != '>') {
            return text.find('>', open + 2) != std::string_view::npos;
        }
        open = text.find('<', open + 1);
    }
    return false;
}

// RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF.
bool BodyInspector::isValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        auto c = static_cast<std::uint8_t>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint8_t lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            return false;
        }

        if (i + len > n) return false;

        auto second = static_cast<std::uint8_t>(bytes[i + 1]);
        if (second < lo || second > hi) return false;
        for (std::size_t k = 2; k < len; ++k) {
            auto cont = static_cast<std::uint8_t>(bytes[i + k]);
            if (cont < 0x80 || cont > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

const char* BodyInspector::sqlPattern() {
    return kSqlPattern;
}

const char* BodyInspector::xssPattern() {
    return kXssPattern;
}

} // namespace reqguard::inspect
