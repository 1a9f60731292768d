#ifndef IP6_CANON_DOT_HPP
#define IP6_CANON_DOT_HPP

#include "IP6-token.hpp"

#include <optional>
#include <string_view>

namespace IP6 {

enum class ipv4_option : bool {
  keep_transition, // dotted quad stays after a well-known transition prefix
  rewrite,         // dotted quad always becomes two hex groups
};

enum class zeros_option {
  compress, // longest run of two or more zero groups becomes "::"
  expand,   // all eight groups written out, minimal digits
  pad,      // all eight groups written out, four digits each
};

struct form {
  ipv4_option ipv4;
  zeros_option zeros;
};

// RFC 5952
auto constexpr canonical_form{form{ipv4_option::keep_transition,
                                   zeros_option::compress}};
auto constexpr pure_form{form{ipv4_option::rewrite, zeros_option::compress}};
auto constexpr full_form{form{ipv4_option::rewrite, zeros_option::expand}};
auto constexpr padded_form{form{ipv4_option::rewrite, zeros_option::pad}};

// Replace the "::" with the AllZeros groups it stands for.
auto expand(tokens const& toks) -> tokens;

// "127.0.0.1" -> 7f00:1
auto ipv4_to_groups(token const& tok) -> tokens;

// Name of the IPv4 transition family whose prefix precedes a trailing
// dotted quad, if any. Checked on the tokens as written, before expansion.
auto transition_kind(tokens const& toks) -> std::optional<std::string_view>;

// Replace the leftmost longest run of two or more AllZeros groups of an
// expanded sequence with "::".
auto compress(tokens const& toks) -> tokens;

// Zero pad every group of an expanded sequence to four digits.
auto pad(tokens const& toks) -> tokens;

// The tokens must have passed is_valid(). The result holds no AllZeros; a
// zero group is SixteenBits "0" (or "0000" in the padded form).
auto canonicalize(tokens const& toks, form f) -> tokens;

} // namespace IP6

#endif // IP6_CANON_DOT_HPP
