// Print IPv6 addresses in canonical text form, one per line.

#include "IP6-tokenize.hpp"
#include "IP6.hpp"

#include <iostream>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(pure, false, "rewrite any embedded IPv4 address as hex groups");
DEFINE_bool(full, false, "write out all eight groups, no \"::\"");
DEFINE_bool(padded, false, "write out all eight groups with four digits each");
DEFINE_bool(literal, false, "print as an address literal [IPv6:...]");
DEFINE_bool(reverse, false, "print the ip6.arpa reverse name");
DEFINE_bool(tokens, false, "print the token sequence as classified");

namespace {
std::optional<std::string> convert(std::string_view addr)
{
  if (FLAGS_tokens) {
    auto const toks{IP6::tokenize_classify(addr)};
    if (!toks)
      return {};
    return fmt::format("{}", fmt::streamed(*toks));
  }

  if (!IP6::is_address(addr))
    return {};

  if (FLAGS_reverse)
    return IP6::reverse(addr) + "ip6.arpa";
  if (FLAGS_literal)
    return IP6::to_address_literal(addr);
  if (FLAGS_padded)
    return IP6::parse_and_expand_padded(addr);
  if (FLAGS_full)
    return IP6::parse_and_expand_pure(addr);
  if (FLAGS_pure)
    return IP6::parse_and_canonicalize_pure(addr);
  return IP6::parse_and_canonicalize(addr);
}

bool do_addr(std::string_view addr)
{
  auto const out{convert(addr)};
  if (!out) {
    LOG(WARNING) << "not a valid IPv6 address «" << addr << "»";
    return false;
  }
  std::cout << *out << '\n';
  return true;
}
} // namespace

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("ip6canon [flags] [address ...]");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto ok{true};

  if (argc > 1) {
    for (auto a = 1; a < argc; ++a)
      ok = do_addr(argv[a]) && ok;
  }
  else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty())
        continue;
      ok = do_addr(line) && ok;
    }
  }

  return ok ? 0 : 1;
}
