#include "IP6.hpp"

#include "IP6-tokenize.hpp"
#include "IP6-validate.hpp"

#include <fmt/format.h>

#include <tao/pegtl.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::parse;
using tao::pegtl::seq;

#include <glog/logging.h>

namespace IP6 {

struct literal_prefix_only : seq<TAO_PEGTL_ISTRING("[IPv6:"), eof> {
};

namespace {
auto render(std::string_view addr, form f) -> std::optional<std::string>
{
  auto const toks{canonical_tokens(addr, f)};
  if (!toks)
    return {};
  return to_text(*toks);
}
} // namespace

auto canonical_tokens(std::string_view addr, form f) -> std::optional<tokens>
{
  auto const toks{tokenize_classify(addr)};
  if (!toks)
    return {};
  if (!is_valid(*toks)) {
    VLOG(1) << "not a valid IPv6 address «" << addr << "» " << *toks;
    return {};
  }
  return canonicalize(*toks, f);
}

auto parse_and_canonicalize(std::string_view addr)
    -> std::optional<std::string>
{
  return render(addr, canonical_form);
}

auto parse_and_canonicalize_pure(std::string_view addr)
    -> std::optional<std::string>
{
  return render(addr, pure_form);
}

auto parse_and_expand_pure(std::string_view addr)
    -> std::optional<std::string>
{
  return render(addr, full_form);
}

auto parse_and_expand_padded(std::string_view addr)
    -> std::optional<std::string>
{
  return render(addr, padded_form);
}

auto is_address(std::string_view addr) -> bool
{
  auto const toks{tokenize_classify(addr)};
  return toks && is_valid(*toks);
}

auto is_address_literal(std::string_view addr) -> bool
{
  if (addr.size() <= lit_extra_sz || !addr.ends_with(lit_sfx))
    return false;

  memory_input<> in{addr.data(), lit_pfx_sz, "ip6-literal"};
  if (!parse<literal_prefix_only>(in))
    return false;

  return is_address(addr.substr(lit_pfx_sz, addr.length() - lit_extra_sz));
}

auto to_address_literal(std::string_view addr) -> std::string
{
  auto const canon{parse_and_canonicalize(addr)};
  CHECK(canon) << "not a valid IPv6 address " << addr;
  return fmt::format("{}{}{}", lit_pfx, *canon, lit_sfx);
}

auto reverse(std::string_view addr) -> std::string
{
  auto const full{parse_and_expand_padded(addr)};
  CHECK(full) << "not a valid IPv6 address " << addr;

  auto q{std::string{}};
  q.reserve(2 * 32);

  for (auto it = full->rbegin(); it != full->rend(); ++it) {
    if (*it == ':')
      continue;
    q += *it;
    q += '.';
  }

  CHECK_EQ(q.size(), 2u * 32);
  return q;
}

} // namespace IP6
