#include "IP6-token.hpp"

#include <sstream>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using namespace IP6;

  tokens const toks{SixteenBits{"2001"}, Colon{}, SixteenBits{"db8"},
                    DoubleColon{}, AllZeros{}};

  CHECK_EQ(to_text(toks), "2001:db8::0");
  CHECK_EQ(to_text(token{AllZeros{}}), "0");
  CHECK_EQ(to_text(token{IPv4Addr{"192.0.2.1"}}), "192.0.2.1");
  CHECK_EQ(to_text(tokens{}), "");

  CHECK_EQ(group_tokens(toks), 3u);
  CHECK_EQ(count_double_colons(toks), 1u);
  CHECK_EQ(count_ipv4_addrs(toks), 0u);

  CHECK(is_group(SixteenBits{"1"}));
  CHECK(is_group(AllZeros{}));
  CHECK(is_group(IPv4Addr{"1.2.3.4"}));
  CHECK(!is_group(Colon{}));
  CHECK(!is_group(DoubleColon{}));

  // Equality is structural, text included.
  CHECK(token{SixteenBits{"a"}} == token{SixteenBits{"a"}});
  CHECK(token{SixteenBits{"a"}} != token{SixteenBits{"b"}});
  CHECK(token{Colon{}} != token{DoubleColon{}});
  CHECK(token{AllZeros{}} != token{SixteenBits{"0"}});

  std::ostringstream os;
  os << tokens{DoubleColon{}, SixteenBits{"ffff"}, Colon{},
               IPv4Addr{"1.2.3.4"}};
  CHECK_EQ(os.str(),
           "[DoubleColon,SixteenBits(\"ffff\"),Colon,IPv4Addr(\"1.2.3.4\")]");
}
