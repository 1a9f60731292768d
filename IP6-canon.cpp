#include "IP6-canon.hpp"

#include "IP6-tokenize.hpp"
#include "IP6-validate.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iterator>
#include <system_error>

#include <fmt/format.h>

#include <glog/logging.h>

namespace IP6 {

namespace {
template <typename It>
void append_groups(tokens& out, It first, It last)
{
  for (auto it = first; it != last; ++it) {
    if (it != first)
      out.emplace_back(Colon{});
    out.push_back(*it);
  }
}

tokens groups_of(tokens const& toks)
{
  tokens ret;
  ret.reserve(8);
  std::copy_if(begin(toks), end(toks), std::back_inserter(ret), is_group);
  return ret;
}

enum class match : bool { exact, suffix };

struct transition_prefix {
  std::string_view kind;
  match how;
  tokens pattern;
};

// RFC 5952 5: these prefixes keep the dotted quad visible.
std::vector<transition_prefix> const& transition_prefixes()
{
  // clang-format off
  static std::vector<transition_prefix> const prefixes{
    {"IPv4-compatible",   match::exact,  {DoubleColon{}}},
    {"IPv4-mapped",       match::exact,  {DoubleColon{}, SixteenBits{"ffff"}, Colon{}}},
    {"IPv4-translated",   match::exact,  {DoubleColon{}, SixteenBits{"ffff"}, Colon{},
                                          AllZeros{}, Colon{}}},
    {"IPv4-translatable", match::exact,  {SixteenBits{"64"}, Colon{},
                                          SixteenBits{"ff9b"}, DoubleColon{}}},
    {"ISATAP",            match::suffix, {SixteenBits{"200"}, Colon{},
                                          SixteenBits{"5efe"}, Colon{}}},
    {"ISATAP",            match::suffix, {AllZeros{}, Colon{},
                                          SixteenBits{"5efe"}, Colon{}}},
    {"ISATAP",            match::suffix, {DoubleColon{}, SixteenBits{"5efe"}, Colon{}}},
  };
  // clang-format on
  return prefixes;
}

bool matches(transition_prefix const& pfx, tokens const& head)
{
  if (pfx.how == match::exact)
    return head == pfx.pattern;
  return (head.size() >= pfx.pattern.size())
         && std::equal(rbegin(pfx.pattern), rend(pfx.pattern), rbegin(head));
}
} // namespace

auto expand(tokens const& toks) -> tokens
{
  auto const dcolon
      = std::find_if(begin(toks), end(toks), holds<DoubleColon>);
  if (dcolon == end(toks))
    return toks;

  auto const target{count_ipv4_addrs(toks) ? 7u : 8u};
  auto const present{group_tokens(toks)};
  CHECK_LT(present, target) << "no room for \"::\" in " << toks;

  tokens ret;
  ret.reserve(2 * 8);

  ret.insert(end(ret), begin(toks), dcolon);
  if (dcolon != begin(toks))
    ret.emplace_back(Colon{});

  for (auto n{0u}; n < target - present; ++n) {
    if (n)
      ret.emplace_back(Colon{});
    ret.emplace_back(AllZeros{});
  }

  if (std::next(dcolon) != end(toks)) {
    ret.emplace_back(Colon{});
    ret.insert(end(ret), std::next(dcolon), end(toks));
  }

  return ret;
}

auto ipv4_to_groups(token const& tok) -> tokens
{
  CHECK(holds<IPv4Addr>(tok)) << "not a dotted quad: " << tok;
  auto const& text{std::get<IPv4Addr>(tok).text};

  std::array<unsigned, 4> octets{};
  auto p{text.data()};
  auto const e{text.data() + text.size()};
  for (auto& octet : octets) {
    auto const [ptr, ec] = std::from_chars(p, e, octet);
    CHECK(ec == std::errc{} && octet <= 255) << "bad dotted quad " << text;
    p = (ptr != e) ? ptr + 1 : ptr;
  }

  auto const hi{(octets[0] << 8) | octets[1]};
  auto const lo{(octets[2] << 8) | octets[3]};

  return {hex_group(fmt::format("{:04x}", hi)), Colon{},
          hex_group(fmt::format("{:04x}", lo))};
}

auto transition_kind(tokens const& toks) -> std::optional<std::string_view>
{
  if (toks.empty() || !holds<IPv4Addr>(toks.back()))
    return {};

  tokens const head(begin(toks), std::prev(end(toks)));
  for (auto const& pfx : transition_prefixes()) {
    if (matches(pfx, head))
      return pfx.kind;
  }
  return {};
}

auto compress(tokens const& toks) -> tokens
{
  CHECK_EQ(count_double_colons(toks), 0u) << "not expanded: " << toks;

  auto const groups{groups_of(toks)};

  // Leftmost of the longest runs wins (RFC 5952 4.2.3).
  auto best_pos{groups.size()};
  auto best_len{std::size_t{0}};
  for (std::size_t i{0}; i < groups.size();) {
    if (!holds<AllZeros>(groups[i])) {
      ++i;
      continue;
    }
    auto j{i};
    while (j < groups.size() && holds<AllZeros>(groups[j]))
      ++j;
    if (j - i > best_len) {
      best_pos = i;
      best_len = j - i;
    }
    i = j;
  }

  // "The symbol "::" MUST NOT be used to shorten just one 16-bit 0
  // field." (RFC 5952 4.2.2)
  if (best_len < 2)
    return toks;

  auto const run_begin{begin(groups) + best_pos};
  auto const run_end{run_begin + best_len};

  tokens ret;
  ret.reserve(toks.size());
  append_groups(ret, begin(groups), run_begin);
  ret.emplace_back(DoubleColon{});
  append_groups(ret, run_end, end(groups));
  return ret;
}

auto pad(tokens const& toks) -> tokens
{
  CHECK_EQ(count_double_colons(toks), 0u) << "not expanded: " << toks;

  tokens ret;
  ret.reserve(toks.size());
  for (auto const& tok : toks) {
    if (holds<AllZeros>(tok)) {
      ret.emplace_back(SixteenBits{"0000"});
    }
    else if (holds<SixteenBits>(tok)) {
      ret.emplace_back(
          SixteenBits{fmt::format("{:0>4}", std::get<SixteenBits>(tok).text)});
    }
    else {
      ret.push_back(tok);
    }
  }
  return ret;
}

namespace {
// Final forms spell a zero group as SixteenBits "0"; AllZeros only lives
// between expansion and compression.
tokens spell_zeros(tokens toks)
{
  std::replace_if(begin(toks), end(toks), holds<AllZeros>,
                  token{SixteenBits{std::string{tok_zero}}});
  return toks;
}
} // namespace

auto canonicalize(tokens const& toks, form f) -> tokens
{
  CHECK(is_valid(toks)) << "canonicalizing invalid tokens " << toks;

  auto const rewrite{count_ipv4_addrs(toks)
                     && ((f.ipv4 == ipv4_option::rewrite)
                         || !transition_kind(toks))};

  auto ret{expand(toks)};

  if (rewrite) {
    auto const groups{ipv4_to_groups(ret.back())};
    ret.pop_back();
    ret.insert(end(ret), begin(groups), end(groups));
  }

  switch (f.zeros) {
  case zeros_option::compress: return spell_zeros(compress(ret));
  case zeros_option::expand: return spell_zeros(ret);
  case zeros_option::pad: return pad(ret);
  }

  LOG(FATAL) << "unknown zeros_option";
}

} // namespace IP6
