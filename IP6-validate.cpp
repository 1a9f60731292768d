#include "IP6-validate.hpp"

#include <algorithm>

namespace IP6 {

namespace {
bool valid_first(token const& tok)
{
  return holds<SixteenBits>(tok) || holds<AllZeros>(tok)
         || holds<DoubleColon>(tok);
}

// No two identical tokens side by side, and groups alternate with
// separators. Tokenized text always alternates; token sequences built by
// hand may not.
bool valid_neighbors(tokens const& toks)
{
  auto const bad = std::adjacent_find(
      begin(toks), end(toks), [](token const& a, token const& b) {
        return (a == b) || (is_group(a) == is_group(b));
      });
  return bad == end(toks);
}
} // namespace

auto is_valid(tokens const& toks) -> bool
{
  if (toks.empty())
    return false;

  // "::" and "::1"
  if (toks.size() == 1 && holds<DoubleColon>(toks[0]))
    return true;
  if (toks.size() == 2 && holds<DoubleColon>(toks[0])
      && holds<SixteenBits>(toks[1]))
    return true;

  if (!valid_neighbors(toks) || !valid_first(toks.front()))
    return false;

  auto const dcolons{count_double_colons(toks)};
  if (dcolons > 1)
    return false;

  auto const groups{group_tokens(toks)};
  auto const& last{toks.back()};

  switch (count_ipv4_addrs(toks)) {
  case 0:
    if (holds<Colon>(last))
      return false;
    return dcolons ? (groups < 8) : (groups == 8);

  case 1:
    // The dotted quad fills the last two of the eight groups, and "::"
    // stands for at least one more.
    if (!holds<IPv4Addr>(last))
      return false;
    return dcolons ? (groups < 7) : (groups == 7);
  }

  return false;
}

} // namespace IP6
