#pragma once

#include <nocomment/md/token.hpp>
#include <nocomment/result.hpp>
#include <string>

namespace nocomment {

enum class Dialect {
    CommonMark,  // no extensions
    GitHub,      // tables, strikethrough, task lists, permissive autolinks
    Extended     // GitHub plus $math$, [[wiki links]] and _underline_
};

const char* dialect_name(Dialect d);
bool parse_dialect(const std::string& name, Dialect& out);

// Tokenize markdown with md4c. Every "<" inside plain text becomes its own
// Text token so that a comment opener the parser did not accept as raw HTML
// still starts at a token boundary.
Result<TokenList> tokenize(const std::string& source,
                           Dialect dialect = Dialect::CommonMark);

} // namespace nocomment
