#ifndef BLOCKWATCH_NETWORK_BLOCK_MATERIAL_CODEC_HPP
#define BLOCKWATCH_NETWORK_BLOCK_MATERIAL_CODEC_HPP

#include <string>
#include <string_view>

#include <boost/property_tree/ptree.hpp>

#include "outcome/outcome.hpp"
#include "primitives/block_material.hpp"

namespace blockwatch::network
{
    /**
     * @brief Serialize block material into the archive JSON document
     * {"index": n, "contents": "<hex>",
     *  "signature": {"signature": "<hex>", "signer": "<hex>", "signed_at": n}}
     * The signature object is left out when the block is not signed
     */
    std::string encodeBlockMaterial( const primitives::BlockMaterial &material );

    /**
     * @brief Parse an archive JSON document
     * @return decoded block or FetcherError::MALFORMED_BLOCK
     */
    outcome::result<primitives::BlockMaterial> decodeBlockMaterial( std::string_view document );

    /// Property tree form of a signature, shared with the signature records of the store
    boost::property_tree::ptree signatureToTree( const primitives::BlockSignature &signature );

    /// @return decoded signature or FetcherError::MALFORMED_BLOCK
    outcome::result<primitives::BlockSignature> signatureFromTree( const boost::property_tree::ptree &tree );
} // namespace blockwatch::network

#endif // BLOCKWATCH_NETWORK_BLOCK_MATERIAL_CODEC_HPP
