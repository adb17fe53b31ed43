#pragma once
/** @file  SampleDecoder.hpp
 *  @brief Text payload → voltage samples.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/SessionConfig.hpp"

namespace cardia {
  namespace io {

    /**
 * @class SampleDecoder
 * @brief One number per line. Blank lines are skipped, anything unparsable is
 *        counted in `rejected()`.
 *
 *  * `Volts`: value taken as is.
 *  * `AdcCounts`: integer count in [-32768, 65535]; > 32767 wraps to signed
 *    16-bit, then scaled by reference / 32767. Counts outside that range are
 *    rejected.
 */
    class SampleDecoder {
    public:
      static constexpr long kAdcFullScale = 32767;
      static constexpr long kAdcMinCounts = -32768;
      static constexpr long kAdcMaxCounts = 65535;

      explicit SampleDecoder(core::SampleEncoding encoding = core::SampleEncoding::Volts,
                             double reference = 3.3)
          : encoding_(encoding), reference_(reference) {}

      /// Decode a single line (no terminator). nullopt for blank or bad lines.
      std::optional<double> decodeLine(std::string_view line);

      /// Decode a chunk holding any number of LF / CRLF terminated lines.
      std::vector<double> decode(std::string_view chunk);

      std::size_t accepted() const { return accepted_; }
      std::size_t rejected() const { return rejected_; }
      void resetCounters() { accepted_ = rejected_ = 0; }

    private:
      core::SampleEncoding encoding_;
      double reference_;
      std::size_t accepted_{ 0 };
      std::size_t rejected_{ 0 };
    };

  } // namespace io
} // namespace cardia
