#pragma once
// ═══════════════════════════════════════════════════════════════════
//  reqguard/inspector.h — Raw request body inspection
// ═══════════════════════════════════════════════════════════════════
//
//  Scans a request body for SQL-keyword fragments and HTML-tag-shaped
//  tokens. This is a blunt substring scan: it misses real attacks and
//  flags benign text ("deleted", "a <b> c"). It is not a parser.
//
//  Usage:
//    inspect::BodyInspector inspector;
//    auto verdict = inspector.inspect(req.rawBody);
//    if (!verdict.accepted()) { ... verdict.kind() ... }
//
// ═══════════════════════════════════════════════════════════════════

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace reqguard::inspect {

// ── Why a body was refused ──
enum class RejectionKind {
    SqlInjectionSuspected,
    XssSuspected,
    InvalidEncoding,
};

// "sql_injection_suspected" | "xss_suspected" | "invalid_encoding"
const char* toString(RejectionKind kind);

// ── Outcome of inspecting one body ──
class Verdict {
public:
    static Verdict accept() { return Verdict(); }
    static Verdict reject(RejectionKind kind) { return Verdict(kind); }

    bool accepted() const { return !kind_.has_value(); }

    // Throws std::bad_optional_access on an accepted verdict
    RejectionKind kind() const { return kind_.value(); }

    bool operator==(const Verdict& other) const { return kind_ == other.kind_; }
    bool operator!=(const Verdict& other) const { return kind_ != other.kind_; }

private:
    Verdict() = default;
    explicit Verdict(RejectionKind kind) : kind_(kind) {}

    std::optional<RejectionKind> kind_;
};

// ═══════════════════════════════════════════════════════════════════
//  class BodyInspector
//  Immutable after construction; inspect() may be called from any
//  number of threads at once.
// ═══════════════════════════════════════════════════════════════════
class BodyInspector {
public:
    BodyInspector();

    // Checks run in order: encoding, SQL, tag. First hit wins.
    Verdict inspect(std::string_view body) const;

    bool containsSqlToken(std::string_view text) const;
    static bool containsTag(std::string_view text);
    static bool isValidUtf8(std::string_view bytes);

    static const char* sqlPattern();
    static const char* xssPattern();

private:
    std::regex sqlTokens_;
};

} // namespace reqguard::inspect
