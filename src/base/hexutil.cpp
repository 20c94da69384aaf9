#include "base/hexutil.hpp"

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3(blockwatch::base, UnhexError, e) {
  using blockwatch::base::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
  }
  return "Unknown unhex error";
}

namespace blockwatch::base {

  namespace {
    constexpr std::string_view kHexPrefix = "0x";
  }

  std::string hex_lower(gsl::span<const uint8_t> bytes) noexcept {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    if (hex.substr(0, kHexPrefix.size()) == kHexPrefix) {
      hex.remove_prefix(kHexPrefix.size());
    }
    if (hex.size() % 2 != 0) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }

    std::vector<uint8_t> blob;
    blob.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return blob;
  }

}  // namespace blockwatch::base
