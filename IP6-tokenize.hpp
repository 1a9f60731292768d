#ifndef IP6_TOKENIZE_DOT_HPP
#define IP6_TOKENIZE_DOT_HPP

#include "IP6-token.hpp"

#include <optional>
#include <string_view>

namespace IP6 {

// Split an address on ':' and classify every fragment. A run of two
// colons is one DoubleColon; three or more colons, or any fragment that is
// neither 1 to 4 hex digits nor a dotted quad, fails the whole input.
auto tokenize_classify(std::string_view addr) -> std::optional<tokens>;

// Classify exactly one fragment: ":", "::", a hex group or a dotted quad.
auto classify_token(std::string_view frag) -> std::optional<token>;

// Hex group normalised for RFC 5952 4.1 and 4.3: lowercase, no leading
// zeros, and AllZeros for a zero value. The input must be 1 to 4 hex digits.
auto hex_group(std::string_view digits) -> token;

} // namespace IP6

#endif // IP6_TOKENIZE_DOT_HPP
