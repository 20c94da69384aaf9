#ifndef BLOCKWATCH_PRIMITIVES_BLOCK_MATERIAL_HPP
#define BLOCKWATCH_PRIMITIVES_BLOCK_MATERIAL_HPP

#include <optional>

#include "primitives/block_signature.hpp"

namespace blockwatch::primitives {

  /**
   * @brief Block as it is published by an archive: the block itself is
   * opaque, the signature is optional since not every archive signs
   */
  struct BlockMaterial {
    BlockIndex index{};                      ///< index of the block
    Bytes contents{};                        ///< opaque block contents
    std::optional<BlockSignature> signature; ///< validator attestation

    inline bool operator==(const BlockMaterial &rhs) const {
      return index == rhs.index && contents == rhs.contents
             && signature == rhs.signature;
    }

    inline bool operator!=(const BlockMaterial &rhs) const {
      return !operator==(rhs);
    }

    friend std::ostream &operator<<(std::ostream &out,
                                    const BlockMaterial &b) {
      out << "block #" << b.index << " (" << b.contents.size() << " bytes";
      if (b.signature) {
        out << ", " << *b.signature;
      }
      return out << ")";
    }
  };

}  // namespace blockwatch::primitives

#endif  // BLOCKWATCH_PRIMITIVES_BLOCK_MATERIAL_HPP
