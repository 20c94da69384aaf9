#ifndef BLOCKWATCH_PRIMITIVES_COMMON_HPP
#define BLOCKWATCH_PRIMITIVES_COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace blockwatch::primitives {
  /// Index of a block in the ledger, the genesis block is 0
  using BlockIndex = uint64_t;

  /// Base URL of a watched archive, always ending with '/'
  using SourceUrl = std::string;

  using Bytes = std::vector<uint8_t>;
}  // namespace blockwatch::primitives

#endif  // BLOCKWATCH_PRIMITIVES_COMMON_HPP
