#include "IP6-tokenize.hpp"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::at;
using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::not_at;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::star;
using tao::pegtl::string;
using tao::pegtl::two;

using tao::pegtl::abnf::DIGIT;
using tao::pegtl::abnf::HEXDIG;

namespace IP6 {

using dot   = one<'.'>;
using colon = one<':'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet> {
};

struct h16 : rep_min_max<1, 4, HEXDIG> {
};

// A fragment ends at a separator or at the end of the input.
struct frag_end : sor<colon, eof> {
};

struct ipv4_tok : seq<ipv4_address, at<frag_end>> {
};

struct h16_tok : seq<h16, at<frag_end>> {
};

// ":::" is neither a Colon followed by a DoubleColon nor the reverse.
struct dcolon_tok : seq<two<':'>, not_at<colon>> {
};

struct colon_tok : seq<colon, not_at<colon>> {
};

struct addr_token : sor<dcolon_tok, colon_tok, ipv4_tok, h16_tok> {
};

struct addr_tokens_only : seq<star<addr_token>, eof> {
};

struct addr_token_only : seq<addr_token, eof> {
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<dcolon_tok> {
  static void apply0(tokens& toks) { toks.emplace_back(DoubleColon{}); }
};

template <>
struct action<colon_tok> {
  static void apply0(tokens& toks) { toks.emplace_back(Colon{}); }
};

template <>
struct action<ipv4_tok> {
  template <typename Input>
  static void apply(Input const& in, tokens& toks)
  {
    toks.emplace_back(IPv4Addr{in.string()});
  }
};

template <>
struct action<h16_tok> {
  template <typename Input>
  static void apply(Input const& in, tokens& toks)
  {
    toks.push_back(hex_group(in.string_view()));
  }
};

auto hex_group(std::string_view digits) -> token
{
  CHECK(!digits.empty() && digits.size() <= 4) << "bad hex group " << digits;

  // "Leading zeros MUST be suppressed" (RFC 5952 4.1)
  auto const nz = digits.find_first_not_of('0');
  if (nz == std::string_view::npos)
    return AllZeros{};

  // "The characters ... MUST be represented in lowercase" (RFC 5952 4.3)
  std::string text{digits.substr(nz)};
  std::transform(begin(text), end(text), begin(text), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return SixteenBits{text};
}

auto tokenize_classify(std::string_view addr) -> std::optional<tokens>
{
  tokens toks;
  memory_input<> in{addr.data(), addr.size(), "ip6"};
  if (!parse<addr_tokens_only, action>(in, toks)) {
    VLOG(1) << "can't tokenize «" << addr << "»";
    return {};
  }
  return toks;
}

auto classify_token(std::string_view frag) -> std::optional<token>
{
  tokens toks;
  memory_input<> in{frag.data(), frag.size(), "ip6-token"};
  if (!parse<addr_token_only, action>(in, toks))
    return {};
  CHECK_EQ(toks.size(), 1u);
  return toks.front();
}

} // namespace IP6
