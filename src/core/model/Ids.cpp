#include "Ids.hpp"

#include <cctype>
#include <cstdint>
#include <random>

#include <unistd.h>

namespace vf {

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

std::string default_owner_id() {
  char host[256] = {0};
  std::string h = "host";
  if (::gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    h.clear();
    for (const char* p = host; *p; ++p) {
      char c = *p;
      h += (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') ? c : '_';
    }
    if (!std::isalnum(static_cast<unsigned char>(h[0]))) h.insert(0, "w");
    if (h.size() > 100) h.resize(100);
  }
  return h + "-" + std::to_string(::getpid());
}

} // namespace vf
