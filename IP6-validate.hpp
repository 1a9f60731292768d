#ifndef IP6_VALIDATE_DOT_HPP
#define IP6_VALIDATE_DOT_HPP

#include "IP6-token.hpp"

namespace IP6 {

// RFC 4291 2.2: at most one "::", no more than eight groups, and a
// dotted quad only in the last two group positions.
auto is_valid(tokens const& toks) -> bool;

} // namespace IP6

#endif // IP6_VALIDATE_DOT_HPP
