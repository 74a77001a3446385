#include <nocomment/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nocomment {

// Parses a non-empty run of decimal digits. std::stoi would accept "+1" and "1x".
static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = trim(input);
    if (s.empty()) {
        return NocommentError{NocommentError::Version, "empty version string"};
    }
    if (s[0] == 'v' || s[0] == 'V') s.erase(0, 1);

    size_t plus = s.find('+');
    if (plus != std::string::npos) s.erase(plus);

    Version v;
    std::string core = s;
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        core = s.substr(0, dash);
        v.label = s.substr(dash + 1);
        if (v.label.empty()) {
            return NocommentError{NocommentError::Version,
                "empty label after '-' in '" + input + "'"};
        }
    }

    size_t dot1 = core.find('.');
    size_t dot2 = dot1 == std::string::npos ? dot1 : core.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos) {
        return NocommentError{NocommentError::Version,
            "invalid version '" + input + "'",
            "expected format: major.minor.micro[-label]"};
    }

    if (!parse_component(core.substr(0, dot1), v.major) ||
        !parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), v.minor) ||
        !parse_component(core.substr(dot2 + 1), v.micro)) {
        return NocommentError{NocommentError::Version,
            "invalid version '" + input + "'",
            "expected format: major.minor.micro[-label]"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!label.empty()) {
        s += "-" + label;
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release (non-empty label) < release (empty label)
    if (label.empty() && !o.label.empty()) return false;
    if (!label.empty() && o.label.empty()) return true;
    return label < o.label;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return NocommentError{NocommentError::Version, "empty partial version string"};
    }

    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.empty() || parts.size() > 3 || s.back() == '.') {
        return NocommentError{NocommentError::Version,
            "invalid partial version '" + s + "'"};
    }

    PartialVersion pv;
    int* fields[] = {&pv.major, &pv.minor, &pv.micro};
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!parse_component(parts[i], *fields[i])) {
            return NocommentError{NocommentError::Version,
                "invalid partial version '" + s + "'"};
        }
    }
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (micro >= 0) {
            s += "." + std::to_string(micro);
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    // Expand partial version to full for comparison
    Version req;
    req.major = version.major;
    req.minor = version.minor >= 0 ? version.minor : 0;
    req.micro = version.micro >= 0 ? version.micro : 0;

    // Pre-release hosts never satisfy a requirement
    if (!v.label.empty()) return false;

    switch (op) {
    case ConstraintOp::Exact:
        if (v.major != req.major) return false;
        if (version.minor >= 0 && v.minor != req.minor) return false;
        if (version.micro >= 0 && v.micro != req.micro) return false;
        return true;

    case ConstraintOp::Caret:
        // ^X.Y.Z (X>0): >=X.Y.Z, <(X+1).0.0
        // ^0.Y.Z (Y>0): >=0.Y.Z, <0.(Y+1).0
        // ^0.0.Z: exactly 0.0.Z
        // ^0 and ^0.0 leave the unset parts open
        if (v < req) return false;
        if (req.major > 0 || version.minor < 0) {
            return v.major == req.major;
        }
        if (req.minor > 0 || version.micro < 0) {
            return v.major == 0 && v.minor == req.minor;
        }
        return v.major == 0 && v.minor == 0 && v.micro == req.micro;

    case ConstraintOp::Tilde:
        // ~X.Y.Z: >=X.Y.Z, <X.(Y+1).0; ~X: >=X.0.0, <(X+1).0.0
        if (v < req) return false;
        if (version.minor < 0) return v.major == req.major;
        return v.major == req.major && v.minor == req.minor;

    case ConstraintOp::GreaterEq:
        return v >= req;

    case ConstraintOp::Greater:
        return v > req;

    case ConstraintOp::LessEq:
        return v <= req;

    case ConstraintOp::Less:
        return v < req;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);

    struct Prefix { const char* text; ConstraintOp op; };
    static const Prefix prefixes[] = {
        {">=", ConstraintOp::GreaterEq},
        {"<=", ConstraintOp::LessEq},
        {">",  ConstraintOp::Greater},
        {"<",  ConstraintOp::Less},
        {"=",  ConstraintOp::Exact},
        {"^",  ConstraintOp::Caret},
        {"~",  ConstraintOp::Tilde},
    };

    // No prefix = caret, like Cargo
    ConstraintOp op = ConstraintOp::Caret;
    for (const auto& p : prefixes) {
        std::string text(p.text);
        if (s.compare(0, text.size(), text) == 0) {
            op = p.op;
            s = trim(s.substr(text.size()));
            break;
        }
    }

    if (s.empty()) {
        return NocommentError{NocommentError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    auto pv = PartialVersion::parse(s);
    if (pv.is_err()) return std::move(pv).error();

    VersionConstraint vc;
    vc.op = op;
    vc.version = pv.value();
    return Result<VersionConstraint>::ok(vc);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return NocommentError{NocommentError::Version, "empty version requirement"};
    }

    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    if (req.constraints.empty()) {
        return NocommentError{NocommentError::Version,
            "no constraints in version requirement '" + s + "'"};
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace nocomment
