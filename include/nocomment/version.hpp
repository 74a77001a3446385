#pragma once

#include <nocomment/result.hpp>
#include <string>
#include <vector>

namespace nocomment {

// Semantic version: major.minor.micro[-label][+build]
// Build metadata is accepted but not kept; it never affects ordering.
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;  // pre-release label, e.g. "alpha.1", empty for release

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for requirements: "0", "0.4", "0.4.21"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int micro = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =0.4.21
    Caret,       // ^0.4.21 (also a bare "0.4.21")
    Tilde,       // ~0.4.21
    GreaterEq,   // >=0.4.21
    Greater,     // >0.4.21
    LessEq,      // <=0.4.21
    Less,        // <0.4.21
};

struct VersionConstraint {
    ConstraintOp op;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound requirement: ">=0.4.0, <0.5.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace nocomment
