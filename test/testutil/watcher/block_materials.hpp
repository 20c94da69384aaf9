#ifndef BLOCKWATCH_TEST_TESTUTIL_WATCHER_BLOCK_MATERIALS_HPP
#define BLOCKWATCH_TEST_TESTUTIL_WATCHER_BLOCK_MATERIALS_HPP

#include "network/block_path.hpp"
#include "primitives/block_material.hpp"

namespace blockwatch::test {

  /**
   * Block of the source with deterministic contents and optionally a
   * signature, so that blocks of different sources are distinguishable
   */
  inline primitives::BlockMaterial makeBlock(const primitives::SourceUrl &src,
                                             primitives::BlockIndex index,
                                             bool is_signed = true) {
    primitives::BlockMaterial material;
    material.index = index;
    material.contents.assign(src.begin(), src.end());
    material.contents.push_back(static_cast<uint8_t>(index));
    if (is_signed) {
      material.signature = primitives::BlockSignature{
          {0xde, 0xad, static_cast<uint8_t>(index)},
          {0x01, static_cast<uint8_t>(src.size())},
          1600000000 + index};
    }
    return material;
  }

  /// URL the block of the source is fetched from
  inline std::string blockUrl(const primitives::SourceUrl &src,
                              primitives::BlockIndex index) {
    return network::resolveBlockUrl(src, network::blockIndexToPath(index))
        .value();
  }

}  // namespace blockwatch::test

#endif  // BLOCKWATCH_TEST_TESTUTIL_WATCHER_BLOCK_MATERIALS_HPP
