#ifndef BLOCKWATCH_PRIMITIVES_BLOCK_SIGNATURE_HPP
#define BLOCKWATCH_PRIMITIVES_BLOCK_SIGNATURE_HPP

#include <ostream>

#include "base/hexutil.hpp"
#include "primitives/common.hpp"

namespace blockwatch::primitives {

  /**
   * @brief Attestation of a block produced by the validator that published
   * it to its archive
   */
  struct BlockSignature {
    Bytes signature;     ///< signature over the block
    Bytes signer;        ///< public key of the signer
    uint64_t signed_at;  ///< unix time the block was signed at

    inline bool operator==(const BlockSignature &rhs) const {
      return signature == rhs.signature && signer == rhs.signer
             && signed_at == rhs.signed_at;
    }

    inline bool operator!=(const BlockSignature &rhs) const {
      return !operator==(rhs);
    }

    friend std::ostream &operator<<(std::ostream &out,
                                    const BlockSignature &s) {
      return out << "signer " << base::hex_lower(s.signer) << " at "
                 << s.signed_at;
    }
  };

  /**
   * @brief Signature as it is recorded for a watched source
   */
  struct BlockSignatureData {
    SourceUrl src_url;
    std::string archive_filename;  ///< canonical path of the signed block
    BlockSignature block_signature;

    inline bool operator==(const BlockSignatureData &rhs) const {
      return src_url == rhs.src_url && archive_filename == rhs.archive_filename
             && block_signature == rhs.block_signature;
    }

    inline bool operator!=(const BlockSignatureData &rhs) const {
      return !operator==(rhs);
    }
  };

}  // namespace blockwatch::primitives

#endif  // BLOCKWATCH_PRIMITIVES_BLOCK_SIGNATURE_HPP
