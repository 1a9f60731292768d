#include "IP6.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_uint64(threads, 8, "number of threads");
DEFINE_uint64(rounds, 200, "passes over the inputs per thread");

namespace {
struct result {
  std::optional<std::string> canon;
  std::optional<std::string> pure;
  std::optional<std::string> full;
};

result run(std::string const& addr)
{
  return {IP6::parse_and_canonicalize(addr),
          IP6::parse_and_canonicalize_pure(addr),
          IP6::parse_and_expand_pure(addr)};
}

std::vector<std::string> inputs()
{
  std::vector<std::string> ret{
      "::",
      "::1",
      "D045::00Da:0fA9:0:0:230.34.110.80",
      "::ffff:192.0.2.1",
      "2001:0:0:1:0:0:0:1",
      ":::1",
      "1::2::3",
      "",
  };
  for (auto i{0u}; i < 256; ++i) {
    ret.push_back(fmt::format("2001:db8:{:x}::{}.{}.0.1", i, i, 255 - i));
    ret.push_back(fmt::format("fe80:0:0:{:x}:0:0:0:{:X}", i, i * 257));
    ret.push_back(fmt::format("{:x}:{:x}:{:x}:1", i, i, i)); // too short
  }
  return ret;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  CHECK_GT(FLAGS_threads, 0u) << "--threads must be at least 1";

  auto const addrs{inputs()};

  std::vector<result> expected;
  expected.reserve(addrs.size());
  for (auto const& addr : addrs)
    expected.push_back(run(addr));

  CHECK(expected[2].canon);
  CHECK_EQ(*expected[2].canon, "d045:0:da:fa9::e622:6e50");

  // Each thread owns a disjoint slice of the inputs and of the results.
  std::vector<result> actual(addrs.size());
  std::vector<std::thread> workers;
  for (std::size_t t{0}; t < FLAGS_threads; ++t) {
    workers.emplace_back([t, &addrs, &actual] {
      for (std::uint64_t r{0}; r < FLAGS_rounds; ++r) {
        for (auto i{t}; i < addrs.size(); i += FLAGS_threads)
          actual[i] = run(addrs[i]);
      }
    });
  }
  for (auto& w : workers)
    w.join();

  for (std::size_t i{0}; i < addrs.size(); ++i) {
    CHECK(actual[i].canon == expected[i].canon) << addrs[i];
    CHECK(actual[i].pure == expected[i].pure) << addrs[i];
    CHECK(actual[i].full == expected[i].full) << addrs[i];
  }
}
