#pragma once

#include <nocomment/md/token.hpp>
#include <string>
#include <vector>

namespace nocomment {

struct ScrubResult {
    TokenList tokens;
    std::vector<std::string> comments;  // text of every removed comment, in order
};

// Remove every closed `<!-- ... -->` span from a token stream.
//
// A span opens on either
//   - a Text token that is exactly "<" followed by a Text token starting with "!--", or
//   - an Html token starting with "<!--",
// and closes on the first candidate token whose payload, with trailing
// whitespace stripped, ends with "-->". Split openers keep scanning across
// any other token kind (a comment may cover a paragraph break); Html openers
// only extend over consecutive Html tokens. An opener that never closes is
// kept, and so is everything after it.
ScrubResult scrub_comments(const TokenList& tokens);

TokenList scrub(const TokenList& tokens);

} // namespace nocomment
