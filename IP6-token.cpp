#include "IP6-token.hpp"

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

namespace IP6 {

auto group_tokens(tokens const& toks) -> std::size_t
{
  return std::count_if(begin(toks), end(toks), is_group);
}

auto count_double_colons(tokens const& toks) -> std::size_t
{
  return std::count_if(begin(toks), end(toks), holds<DoubleColon>);
}

auto count_ipv4_addrs(tokens const& toks) -> std::size_t
{
  return std::count_if(begin(toks), end(toks), holds<IPv4Addr>);
}

auto to_text(token const& tok) -> std::string_view
{
  return std::visit(
      [](auto const& t) -> std::string_view {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, SixteenBits>)
          return t.text;
        else if constexpr (std::is_same_v<T, Colon>)
          return tok_colon;
        else if constexpr (std::is_same_v<T, DoubleColon>)
          return tok_dcolon;
        // "A single 16-bit 0000 field MUST be represented as 0" (RFC 5952 4.1)
        else if constexpr (std::is_same_v<T, AllZeros>)
          return tok_zero;
        else
          return t.text;
      },
      tok);
}

auto to_text(tokens const& toks) -> std::string
{
  std::string ret;
  ret.reserve(8 * 5);
  for (auto const& tok : toks)
    ret += to_text(tok);
  return ret;
}

std::ostream& operator<<(std::ostream& os, token const& tok)
{
  std::visit(
      [&os](auto const& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, SixteenBits>)
          os << fmt::format("SixteenBits(\"{}\")", t.text);
        else if constexpr (std::is_same_v<T, Colon>)
          os << "Colon";
        else if constexpr (std::is_same_v<T, DoubleColon>)
          os << "DoubleColon";
        else if constexpr (std::is_same_v<T, AllZeros>)
          os << "AllZeros";
        else
          os << fmt::format("IPv4Addr(\"{}\")", t.text);
      },
      tok);
  return os;
}

std::ostream& operator<<(std::ostream& os, tokens const& toks)
{
  os << '[';
  auto sep{""};
  for (auto const& tok : toks) {
    os << sep << tok;
    sep = ",";
  }
  return os << ']';
}

} // namespace IP6
