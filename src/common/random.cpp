#include "acta/common/random.hpp"

#include <array>
#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>

namespace acta::common {

namespace {

void fill_random(unsigned char *data, const std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  // RAND_bytes only fails when the OpenSSL pool cannot be seeded.
  static thread_local std::mt19937_64 fallback{std::random_device{}()};
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<unsigned char>(fallback() & 0xFFU);
  }
}

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string random_uuid() {
  std::array<unsigned char, 16> data{};
  fill_random(data.data(), data.size());
  data[6] = static_cast<unsigned char>((data[6] & 0x0FU) | 0x40U);
  data[8] = static_cast<unsigned char>((data[8] & 0x3FU) | 0x80U);

  const std::string hex = to_hex(data.data(), data.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace acta::common
