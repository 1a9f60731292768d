#include "IP6-tokenize.hpp"

#include <glog/logging.h>

using namespace IP6;

namespace {
bool toks_eq(std::string_view addr, tokens const& expected)
{
  auto const toks{tokenize_classify(addr)};
  if (!toks) {
    LOG(ERROR) << "failed to tokenize " << addr;
    return false;
  }
  LOG_IF(ERROR, *toks != expected)
      << addr << ": " << *toks << " != " << expected;
  return *toks == expected;
}
} // namespace

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(toks_eq("2001:DB8::0001", {SixteenBits{"2001"}, Colon{},
                                   SixteenBits{"db8"}, DoubleColon{},
                                   SixteenBits{"1"}}));
  CHECK(toks_eq("::", {DoubleColon{}}));
  CHECK(toks_eq("1::", {SixteenBits{"1"}, DoubleColon{}}));
  CHECK(toks_eq("::ffff:192.0.2.1", {DoubleColon{}, SixteenBits{"ffff"},
                                     Colon{}, IPv4Addr{"192.0.2.1"}}));
  CHECK(toks_eq("0:0000:00", {AllZeros{}, Colon{}, AllZeros{}, Colon{},
                              AllZeros{}}));
  CHECK(toks_eq("0fA9", {SixteenBits{"fa9"}}));

  // Structure is the validator's job.
  CHECK(toks_eq("", {}));
  CHECK(toks_eq(":1", {Colon{}, SixteenBits{"1"}}));
  CHECK(toks_eq("1:", {SixteenBits{"1"}, Colon{}}));
  CHECK(toks_eq("1::2::3", {SixteenBits{"1"}, DoubleColon{}, SixteenBits{"2"},
                            DoubleColon{}, SixteenBits{"3"}}));
  CHECK(toks_eq("1.2.3.4:1", {IPv4Addr{"1.2.3.4"}, Colon{},
                              SixteenBits{"1"}}));

  // Octets may carry leading zeros, the text is kept as written.
  CHECK(toks_eq("::001.02.3.004", {DoubleColon{}, IPv4Addr{"001.02.3.004"}}));

  CHECK(!tokenize_classify(":::"));
  CHECK(!tokenize_classify(":::1"));
  CHECK(!tokenize_classify("1:::2"));
  CHECK(!tokenize_classify("12345::"));
  CHECK(!tokenize_classify("g::1"));
  CHECK(!tokenize_classify("::1.2.3"));
  CHECK(!tokenize_classify("::1.2.3.4.5"));
  CHECK(!tokenize_classify("::1.2.3.256"));
  CHECK(!tokenize_classify("::1.2.3.0001"));
  CHECK(!tokenize_classify("::1 "));
  CHECK(!tokenize_classify("[::1]"));
  CHECK(!tokenize_classify("fe80::1%eth0"));

  CHECK(classify_token(":") == token{Colon{}});
  CHECK(classify_token("::") == token{DoubleColon{}});
  CHECK(classify_token("0fA9") == token{SixteenBits{"fa9"}});
  CHECK(classify_token("0000") == token{AllZeros{}});
  CHECK(classify_token("10.0.0.1") == token{IPv4Addr{"10.0.0.1"}});
  CHECK(!classify_token(""));
  CHECK(!classify_token(":::"));
  CHECK(!classify_token("1:2"));
  CHECK(!classify_token("10000"));

  CHECK(hex_group("ABCD") == token{SixteenBits{"abcd"}});
  CHECK(hex_group("00") == token{AllZeros{}});
  CHECK(hex_group("0100") == token{SixteenBits{"100"}});
}
