#pragma once

#include <nocomment/md/token.hpp>
#include <string>

namespace nocomment {

// Serialize tokens back to CommonMark text.
//
// Scrubbing a comment that spans block boundaries can leave start/end
// tokens unbalanced: end tokens with no open counterpart are dropped, and
// containers still open at the end of the stream are closed.
std::string render_markdown(const TokenList& tokens);

// Serialize tokens to HTML, one tag per start/end token.
std::string render_html(const TokenList& tokens);

} // namespace nocomment
