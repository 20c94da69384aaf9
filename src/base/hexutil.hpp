#ifndef BLOCKWATCH_HEXUTIL_HPP
#define BLOCKWATCH_HEXUTIL_HPP

#include <string_view>
#include <vector>

#include <gsl/span>
#include "outcome/outcome.hpp"

namespace blockwatch::base {

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
  };

  /**
   * @brief Lowercase hex encoding, the form used in block documents and
   * watcher records
   */
  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept;

  /**
   * @brief Decodes a hex string, upper or lower case, with or without a
   * leading "0x"
   * @return decoded bytes, NOT_ENOUGH_INPUT for an odd number of digits,
   * NON_HEX_INPUT for anything else that is not a digit
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

}  // namespace blockwatch::base

OUTCOME_HPP_DECLARE_ERROR_2(blockwatch::base, UnhexError);

#endif  // BLOCKWATCH_HEXUTIL_HPP
