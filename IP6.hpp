#ifndef IP6_DOT_HPP
#define IP6_DOT_HPP

#include "IP6-canon.hpp"
#include "IP6-token.hpp"

#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include <glog/logging.h>

// Every function here is a pure function of its arguments and shares no
// state, so any number of threads may call them without locking.

namespace IP6 {
using namespace std::literals::string_view_literals;

auto is_address(std::string_view addr) -> bool;
auto is_address_literal(std::string_view addr) -> bool;
auto to_address_literal(std::string_view addr) -> std::string;
auto reverse(std::string_view addr) -> std::string;

// Tokens of the chosen form, zero groups spelled SixteenBits "0".
auto canonical_tokens(std::string_view addr, form f) -> std::optional<tokens>;

// RFC 5952 text, dotted quad kept after a transition prefix:
// "D045::00Da:0fA9:0:0:230.34.110.80" -> "d045:0:da:fa9::e622:6e50"
auto parse_and_canonicalize(std::string_view addr)
    -> std::optional<std::string>;

// Hex digits only.
auto parse_and_canonicalize_pure(std::string_view addr)
    -> std::optional<std::string>;

// Hex digits only, all eight groups, no "::".
auto parse_and_expand_pure(std::string_view addr)
    -> std::optional<std::string>;

// As parse_and_expand_pure, four digits per group.
auto parse_and_expand_padded(std::string_view addr)
    -> std::optional<std::string>;

auto constexpr lit_pfx{"[IPv6:"sv};
auto constexpr lit_pfx_sz{std::size(lit_pfx)};

auto constexpr lit_sfx{"]"sv};
auto constexpr lit_sfx_sz{std::size(lit_sfx)};

auto constexpr lit_extra_sz{lit_pfx_sz + lit_sfx_sz};

auto constexpr loopback_literal{"[IPv6:::1]"};

inline auto as_address(std::string_view address_literal) -> std::string_view
{
  CHECK(is_address_literal(address_literal));
  return address_literal.substr(lit_pfx_sz,
                                address_literal.length() - lit_extra_sz);
}

} // namespace IP6

#endif // IP6_DOT_HPP
