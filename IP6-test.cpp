#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP6::as_address;
  using IP6::is_address;
  using IP6::is_address_literal;
  using IP6::parse_and_canonicalize;
  using IP6::parse_and_canonicalize_pure;
  using IP6::parse_and_expand_padded;
  using IP6::parse_and_expand_pure;
  using IP6::reverse;
  using IP6::to_address_literal;

  CHECK(is_address("::1"));
  CHECK(is_address_literal("[IPv6:::1]"));
  CHECK(is_address_literal(IP6::loopback_literal));

  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));

  CHECK(is_address("::ffff:0:0.0.0.0"));
  CHECK(is_address("::ffff:0:255.255.255.255"));

  CHECK(is_address("fd12:3456:789a:1::1"));

  CHECK(!is_address(""));
  CHECK(!is_address(":::1"));
  CHECK(!is_address("1::2::3"));
  CHECK(!is_address("1:2:3:4:5:6:7:8:9"));

  auto const addr{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"};
  auto const addr_lit{"[IPv6:2001:db8:85a3::8a2e:370:7334]"};

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));
  CHECK(is_address_literal("[ipv6:2001:db8:85a3::8a2e:370:7334]"));
  CHECK(!is_address_literal("[IPv6:::1"));
  CHECK(!is_address_literal("IPv6:::1]"));
  CHECK(!is_address_literal("[IPv6:]"));
  CHECK(!is_address_literal("[IPv6:1::2::3]"));
  CHECK(!is_address_literal("::1"));

  CHECK_EQ(to_address_literal(addr), addr_lit);
  CHECK_EQ(as_address(addr_lit), "2001:db8:85a3::8a2e:370:7334");

  // RFC 3596 2.5
  CHECK_EQ(reverse("4321:0:1:2:3:4:567:89ab"),
           "b.a.9.8.7.6.5.0.4.0.0.0.3.0.0.0.2.0.0.0.1.0.0.0.0.0.0.0.1.2.3.4.");

  CHECK_EQ(*parse_and_canonicalize(addr), "2001:db8:85a3::8a2e:370:7334");
  CHECK_EQ(*parse_and_canonicalize("D045::00Da:0fA9:0:0:230.34.110.80"),
           "d045:0:da:fa9::e622:6e50");
  CHECK_EQ(*parse_and_canonicalize("2001:DB8::1"), "2001:db8::1");
  CHECK_EQ(*parse_and_canonicalize("0:0:0:0:0:0:0:1"), "::1");
  CHECK_EQ(*parse_and_canonicalize("0:0:0:0:0:0:0:0"), "::");
  CHECK_EQ(*parse_and_canonicalize("2001:db8:0:0:1:0:0:1"), "2001:db8::1:0:0:1");
  CHECK_EQ(*parse_and_canonicalize("2001:0:0:1:0:0:0:1"), "2001:0:0:1::1");

  // One zero group is never "::".
  CHECK_EQ(*parse_and_canonicalize("2001:db8:0:1:1:1:1:1"),
           "2001:db8:0:1:1:1:1:1");
  CHECK_EQ(*parse_and_canonicalize("2001:db8::1:1:1:1:1"),
           "2001:db8:0:1:1:1:1:1");

  // "::" standing for a single zero group ahead of a dotted quad.
  CHECK_EQ(*parse_and_canonicalize("1:2:3:4:5::1.2.3.4"),
           "1:2:3:4:5:0:102:304");
  CHECK_EQ(*parse_and_canonicalize("::1:2:3:4:5:1.2.3.4"),
           "0:1:2:3:4:5:102:304");
  CHECK(!parse_and_canonicalize("1:2:3:4:5:6::1.2.3.4"));

  // Transition prefixes keep the dotted quad.
  CHECK_EQ(*parse_and_canonicalize("::ffff:192.0.2.1"), "::ffff:192.0.2.1");
  CHECK_EQ(*parse_and_canonicalize("::FFFF:0:192.0.2.1"), "::ffff:0:192.0.2.1");
  CHECK_EQ(*parse_and_canonicalize("64:ff9b::192.0.2.33"),
           "64:ff9b::192.0.2.33");
  CHECK_EQ(*parse_and_canonicalize("fe80::5efe:192.0.2.1"),
           "fe80::5efe:192.0.2.1");
  CHECK_EQ(*parse_and_canonicalize("::1.2.3.4"), "::1.2.3.4");

  // The prefix is matched as written, before "::" is expanded.
  CHECK_EQ(*parse_and_canonicalize("0:0:0:0:0:ffff:1.2.3.4"),
           "::ffff:102:304");
  CHECK_EQ(*parse_and_canonicalize("2001:db8::192.0.2.1"),
           "2001:db8::c000:201");

  CHECK_EQ(*parse_and_canonicalize_pure("::ffff:192.0.2.1"), "::ffff:c000:201");
  CHECK_EQ(*parse_and_canonicalize_pure("64:ff9b::192.0.2.33"),
           "64:ff9b::c000:221");
  CHECK_EQ(*parse_and_canonicalize_pure("::1.2.3.4"), "::102:304");
  CHECK_EQ(*parse_and_canonicalize_pure("2001:db8::1"), "2001:db8::1");

  CHECK_EQ(*parse_and_expand_pure("2001:db8::1"), "2001:db8:0:0:0:0:0:1");
  CHECK_EQ(*parse_and_expand_pure("::ffff:192.0.2.1"),
           "0:0:0:0:0:ffff:c000:201");
  CHECK_EQ(*parse_and_expand_pure("::"), "0:0:0:0:0:0:0:0");

  CHECK_EQ(*parse_and_expand_padded("2001:db8::1"),
           "2001:0db8:0000:0000:0000:0000:0000:0001");

  for (auto bad : {"", ":", ":::1", "1::2::3", "1:2:3:4:5:6:7:8:9",
                   "1:2:3:4:5:6:7", "::1:", ":1::", "1.2.3.4", "::g",
                   "::256.0.0.1", "02001:db8::1"}) {
    CHECK(!parse_and_canonicalize(bad)) << bad;
    CHECK(!parse_and_canonicalize_pure(bad)) << bad;
    CHECK(!parse_and_expand_pure(bad)) << bad;
    CHECK(!IP6::canonical_tokens(bad, IP6::canonical_form)) << bad;
  }

  // Canonical text comes back unchanged.
  for (auto canon : {"::", "::1", "1::", "2001:db8::1", "fe80::1:2",
                     "2001:db8:0:1:1:1:1:1", "2001:0:0:1::1",
                     "::ffff:192.0.2.1", "64:ff9b::192.0.2.33",
                     "1:2:3:4:5:6:7:8", "2001:db8::1:0:0:1"}) {
    CHECK_EQ(*parse_and_canonicalize(canon), canon);
  }

  // Idempotent.
  for (auto in : {"D045::00Da:0fA9:0:0:230.34.110.80", "0:0:0:0:0:ffff:1.2.3.4",
                  "2001:0DB8:0:0:0:0:0:1", "1::1.2.3.4", "::0:0:1"}) {
    auto const once{parse_and_canonicalize(in)};
    CHECK(once) << in;
    CHECK_EQ(*parse_and_canonicalize(*once), *once);
  }
}
