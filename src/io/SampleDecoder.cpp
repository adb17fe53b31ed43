/* @file SampleDecoder.cpp
 * @brief line parser for sensor text streams
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

// Cardia headers
#include "io/SampleDecoder.hpp"

using namespace cardia::io;

namespace {
  std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos)
      return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
  }
} // namespace

std::optional<double> SampleDecoder::decodeLine(std::string_view line) {
  const auto text = trim(line);
  if (text.empty())
    return std::nullopt;

  const std::string owned(text); // strtod needs a terminator
  char* end = nullptr;
  errno = 0;

  if (encoding_ == core::SampleEncoding::Volts) {
    const double v = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size() || errno == ERANGE || !std::isfinite(v)) {
      ++rejected_;
      return std::nullopt;
    }
    ++accepted_;
    return v;
  }

  long counts = std::strtol(owned.c_str(), &end, 10);
  if (end != owned.c_str() + owned.size() || errno == ERANGE || counts < kAdcMinCounts ||
      counts > kAdcMaxCounts) {
    ++rejected_;
    return std::nullopt;
  }
  if (counts > kAdcFullScale)
    counts -= 65536;
  ++accepted_;
  return static_cast<double>(counts) / static_cast<double>(kAdcFullScale) * reference_;
}

std::vector<double> SampleDecoder::decode(std::string_view chunk) {
  std::vector<double> out;
  while (!chunk.empty()) {
    const auto pos = chunk.find('\n');
    const auto line = chunk.substr(0, pos);
    if (auto v = decodeLine(line))
      out.push_back(*v);
    if (pos == std::string_view::npos)
      break;
    chunk.remove_prefix(pos + 1);
  }
  return out;
}
