#include "IP6-canon.hpp"
#include "IP6-tokenize.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace IP6;

namespace {
tokens toks_of(std::string_view addr)
{
  auto const toks{tokenize_classify(addr)};
  CHECK(toks) << "can't tokenize " << addr;
  return *toks;
}

std::string canon(std::string_view addr, form f)
{
  return to_text(canonicalize(toks_of(addr), f));
}
} // namespace

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // expand

  CHECK_EQ(to_text(expand(toks_of("1::2"))), "1:0:0:0:0:0:0:2");
  CHECK_EQ(to_text(expand(toks_of("::"))), "0:0:0:0:0:0:0:0");
  CHECK_EQ(to_text(expand(toks_of("1::"))), "1:0:0:0:0:0:0:0");
  CHECK_EQ(to_text(expand(toks_of("::1"))), "0:0:0:0:0:0:0:1");
  CHECK_EQ(to_text(expand(toks_of("1:2:3::6:7:8"))), "1:2:3:0:0:6:7:8");
  CHECK_EQ(to_text(expand(toks_of("::ffff:1.2.3.4"))),
           "0:0:0:0:0:ffff:1.2.3.4");
  CHECK_EQ(to_text(expand(toks_of("1:2:3:4:5:6:7:8"))), "1:2:3:4:5:6:7:8");
  CHECK_EQ(count_double_colons(expand(toks_of("a::b"))), 0u);

  // ipv4_to_groups

  CHECK(ipv4_to_groups(IPv4Addr{"127.0.0.1"})
        == (tokens{SixteenBits{"7f00"}, Colon{}, SixteenBits{"1"}}));
  CHECK_EQ(to_text(ipv4_to_groups(IPv4Addr{"192.0.2.1"})), "c000:201");
  CHECK_EQ(to_text(ipv4_to_groups(IPv4Addr{"255.255.255.255"})), "ffff:ffff");
  CHECK_EQ(to_text(ipv4_to_groups(IPv4Addr{"001.002.003.004"})), "102:304");
  CHECK(ipv4_to_groups(IPv4Addr{"0.0.0.0"})
        == (tokens{AllZeros{}, Colon{}, AllZeros{}}));

  // transition_kind

  CHECK(transition_kind(toks_of("::1.2.3.4")) == "IPv4-compatible");
  CHECK(transition_kind(toks_of("::ffff:1.2.3.4")) == "IPv4-mapped");
  CHECK(transition_kind(toks_of("::FFFF:0:1.2.3.4")) == "IPv4-translated");
  CHECK(transition_kind(toks_of("64:ff9b::1.2.3.4")) == "IPv4-translatable");
  CHECK(transition_kind(toks_of("fe80::5efe:1.2.3.4")) == "ISATAP");
  CHECK(transition_kind(toks_of("fe80::0200:5efe:1.2.3.4")) == "ISATAP");
  CHECK(transition_kind(toks_of("fe80:0:0:0:0:5efe:1.2.3.4")) == "ISATAP");
  CHECK(!transition_kind(toks_of("1::1.2.3.4")));
  CHECK(!transition_kind(toks_of("::1")));
  CHECK(!transition_kind(toks_of("64:ff9b:1::1.2.3.4")));
  CHECK(!transition_kind(toks_of("::fffe:1.2.3.4")));

  // compress

  CHECK_EQ(to_text(compress(toks_of("1:0:0:0:0:0:0:2"))), "1::2");
  CHECK_EQ(to_text(compress(toks_of("0:0:0:0:0:0:0:0"))), "::");
  CHECK_EQ(to_text(compress(toks_of("1:0:0:0:0:0:0:0"))), "1::");
  CHECK_EQ(to_text(compress(toks_of("0:0:0:0:0:0:0:1"))), "::1");

  // Longest run wins, leftmost among equals.
  CHECK_EQ(to_text(compress(toks_of("2001:0:0:1:0:0:0:1"))), "2001:0:0:1::1");
  CHECK_EQ(to_text(compress(toks_of("1:0:0:1:0:0:1:1"))), "1::1:0:0:1:1");
  CHECK_EQ(to_text(compress(toks_of("1:0:0:0:1:0:0:0"))), "1::1:0:0:0");

  // A single zero group stays.
  CHECK_EQ(to_text(compress(toks_of("2001:db8:0:1:1:1:1:1"))),
           "2001:db8:0:1:1:1:1:1");
  CHECK_EQ(to_text(compress(toks_of("1:2:3:4:5:6:7:8"))), "1:2:3:4:5:6:7:8");

  // compress undoes expand when the "::" covered the unique longest run.
  for (auto addr : {"2001:db8::1", "::", "1::", "::ffff:1.2.3.4",
                    "1:0:0:2::3"}) {
    auto const toks{toks_of(addr)};
    CHECK(compress(expand(toks)) == toks) << addr;
  }

  // pad

  CHECK_EQ(to_text(pad(expand(toks_of("2001:db8::1")))),
           "2001:0db8:0000:0000:0000:0000:0000:0001");

  // canonicalize

  CHECK_EQ(canon("D045::00Da:0fA9:0:0:230.34.110.80", canonical_form),
           "d045:0:da:fa9::e622:6e50");
  CHECK_EQ(canon("::ffff:192.0.2.1", canonical_form), "::ffff:192.0.2.1");
  CHECK_EQ(canon("::ffff:192.0.2.1", pure_form), "::ffff:c000:201");
  CHECK_EQ(canon("::ffff:192.0.2.1", full_form), "0:0:0:0:0:ffff:c000:201");
  CHECK_EQ(canon("::ffff:192.0.2.1", padded_form),
           "0000:0000:0000:0000:0000:ffff:c000:0201");
  CHECK_EQ(canon("1::1.2.3.4", canonical_form), "1::102:304");
  CHECK_EQ(canon("::0.0.0.1", canonical_form), "::0.0.0.1");
  CHECK_EQ(canon("::0.0.0.1", pure_form), "::1");
  CHECK_EQ(canon("2001:0:0:1:0:0:0:1", full_form), "2001:0:0:1:0:0:0:1");
  CHECK_EQ(canon("::", full_form), "0:0:0:0:0:0:0:0");

  // No AllZeros survive into a final form.
  for (auto f : {canonical_form, pure_form, full_form, padded_form}) {
    auto const out{canonicalize(toks_of("2001:db8:0:1:0:0:0:1"), f)};
    CHECK(std::none_of(begin(out), end(out), holds<AllZeros>));
  }
  CHECK(canonicalize(toks_of("1:0:2:3:4:5:6:7"), canonical_form)
        == (tokens{SixteenBits{"1"}, Colon{}, SixteenBits{"0"}, Colon{},
                   SixteenBits{"2"}, Colon{}, SixteenBits{"3"}, Colon{},
                   SixteenBits{"4"}, Colon{}, SixteenBits{"5"}, Colon{},
                   SixteenBits{"6"}, Colon{}, SixteenBits{"7"}}));
}
