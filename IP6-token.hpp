#ifndef IP6_TOKEN_DOT_HPP
#define IP6_TOKEN_DOT_HPP

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace IP6 {

// One syntactic unit of an IPv6 address text representation.

// 1 to 4 hex digits. The tokenizer stores them lowercase without leading
// zeros; only the padded full form writes "0db8".
struct SixteenBits {
  std::string text;
  bool operator==(SixteenBits const&) const = default;
};

struct Colon {
  bool operator==(Colon const&) const = default;
};

struct DoubleColon {
  bool operator==(DoubleColon const&) const = default;
};

// A 16-bit group whose value is zero.
struct AllZeros {
  bool operator==(AllZeros const&) const = default;
};

// Dotted quad, kept as written.
struct IPv4Addr {
  std::string text;
  bool operator==(IPv4Addr const&) const = default;
};

using token = std::variant<SixteenBits, Colon, DoubleColon, AllZeros, IPv4Addr>;
using tokens = std::vector<token>;

auto constexpr tok_colon{std::string_view{":"}};
auto constexpr tok_dcolon{std::string_view{"::"}};
auto constexpr tok_zero{std::string_view{"0"}};

template <typename T>
inline bool holds(token const& tok)
{
  return std::holds_alternative<T>(tok);
}

// True for the tokens that stand for address bits: SixteenBits, AllZeros
// and IPv4Addr.
inline bool is_group(token const& tok)
{
  return !holds<Colon>(tok) && !holds<DoubleColon>(tok);
}

// Number of group tokens; an IPv4Addr counts once.
auto group_tokens(tokens const& toks) -> std::size_t;
auto count_double_colons(tokens const& toks) -> std::size_t;
auto count_ipv4_addrs(tokens const& toks) -> std::size_t;

auto to_text(token const& tok) -> std::string_view;
auto to_text(tokens const& toks) -> std::string;

std::ostream& operator<<(std::ostream& os, token const& tok);
std::ostream& operator<<(std::ostream& os, tokens const& toks);

} // namespace IP6

#endif // IP6_TOKEN_DOT_HPP
