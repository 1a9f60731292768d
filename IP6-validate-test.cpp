#include "IP6-tokenize.hpp"
#include "IP6-validate.hpp"

#include <glog/logging.h>

using namespace IP6;

namespace {
bool valid(std::string_view addr)
{
  auto const toks{tokenize_classify(addr)};
  CHECK(toks) << "can't tokenize " << addr;
  return is_valid(*toks);
}
} // namespace

int main(int argc, char const* argv[])
{
  CHECK(valid("::"));
  CHECK(valid("::1"));
  CHECK(valid("1::"));
  CHECK(valid("1:2:3:4:5:6:7:8"));
  CHECK(valid("1:2:3:4:5:6:7::"));
  CHECK(valid("::2:3:4:5:6:7:8"));
  CHECK(valid("2001:db8::1"));

  CHECK(!valid(""));
  CHECK(!valid("1:2:3:4:5:6:7"));
  CHECK(!valid("1:2:3:4:5:6:7:8:9"));
  CHECK(!valid("1:2:3:4::5:6:7:8"));
  CHECK(!valid("1::2::3"));
  CHECK(!valid("::1::"));
  CHECK(!valid(":1:2:3:4:5:6:7:8"));
  CHECK(!valid("1:2:3:4:5:6:7:8:"));
  CHECK(!valid("1:2:3:4:5:6:7:"));

  // The dotted quad fills the last two groups.
  CHECK(valid("1:2:3:4:5:6:1.2.3.4"));
  CHECK(valid("::1.2.3.4"));
  CHECK(valid("::ffff:1.2.3.4"));
  CHECK(valid("1:2:3:4::1.2.3.4"));
  CHECK(!valid("1:2:3:4:5:1.2.3.4"));
  CHECK(!valid("1:2:3:4:5:6:7:1.2.3.4"));
  CHECK(valid("1:2:3:4:5::1.2.3.4"));
  CHECK(valid("::1:2:3:4:5:1.2.3.4"));
  CHECK(!valid("1:2:3:4:5:6::1.2.3.4"));
  CHECK(!valid("::1:2:3:4:5:6:1.2.3.4"));
  CHECK(!valid("1.2.3.4"));
  CHECK(!valid("::1.2.3.4:1"));
  CHECK(!valid("::1.2.3.4:1.2.3.4"));

  // Sequences built by hand.
  CHECK(is_valid({DoubleColon{}}));
  CHECK(is_valid({DoubleColon{}, SixteenBits{"1"}}));
  CHECK(is_valid({DoubleColon{}, AllZeros{}}));
  CHECK(!is_valid({}));
  CHECK(!is_valid({DoubleColon{}, DoubleColon{}}));
  CHECK(!is_valid({SixteenBits{"1"}, SixteenBits{"2"}, DoubleColon{}}));
  CHECK(!is_valid({SixteenBits{"1"}, Colon{}, DoubleColon{}, SixteenBits{"2"}}));
  CHECK(!is_valid({AllZeros{}}));
  CHECK(!is_valid({Colon{}}));
  CHECK(!is_valid({IPv4Addr{"1.2.3.4"}}));
}
