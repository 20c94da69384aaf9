#include "network/block_material_codec.hpp"

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include "base/hexutil.hpp"
#include "network/fetcher_error.hpp"

namespace blockwatch::network
{
    namespace pt = boost::property_tree;

    namespace
    {
        outcome::result<primitives::Bytes> readHex( const pt::ptree &tree, const std::string &key )
        {
            auto value = tree.get_optional<std::string>( key );
            if ( !value )
            {
                return FetcherError::MALFORMED_BLOCK;
            }
            auto bytes = base::unhex( *value );
            if ( !bytes )
            {
                return FetcherError::MALFORMED_BLOCK;
            }
            return std::move( bytes.value() );
        }
    } // namespace

    pt::ptree signatureToTree( const primitives::BlockSignature &signature )
    {
        pt::ptree tree;
        tree.put( "signature", base::hex_lower( signature.signature ) );
        tree.put( "signer", base::hex_lower( signature.signer ) );
        tree.put( "signed_at", signature.signed_at );
        return tree;
    }

    outcome::result<primitives::BlockSignature> signatureFromTree( const pt::ptree &tree )
    {
        primitives::BlockSignature signature;
        OUTCOME_TRY( signature_bytes, readHex( tree, "signature" ) );
        OUTCOME_TRY( signer, readHex( tree, "signer" ) );
        auto signed_at = tree.get_optional<uint64_t>( "signed_at" );
        if ( !signed_at )
        {
            return FetcherError::MALFORMED_BLOCK;
        }
        signature.signature = std::move( signature_bytes );
        signature.signer    = std::move( signer );
        signature.signed_at = *signed_at;
        return signature;
    }

    std::string encodeBlockMaterial( const primitives::BlockMaterial &material )
    {
        pt::ptree tree;
        tree.put( "index", material.index );
        tree.put( "contents", base::hex_lower( material.contents ) );
        if ( material.signature )
        {
            tree.put_child( "signature", signatureToTree( *material.signature ) );
        }

        std::ostringstream out;
        pt::write_json( out, tree, false );
        return out.str();
    }

    outcome::result<primitives::BlockMaterial> decodeBlockMaterial( std::string_view document )
    {
        pt::ptree tree;
        try
        {
            std::istringstream in{ std::string( document ) };
            pt::read_json( in, tree );
        }
        catch ( const pt::json_parser_error &e )
        {
            return FetcherError::MALFORMED_BLOCK;
        }

        primitives::BlockMaterial material;
        auto                      index = tree.get_optional<primitives::BlockIndex>( "index" );
        if ( !index )
        {
            return FetcherError::MALFORMED_BLOCK;
        }
        material.index = *index;

        OUTCOME_TRY( contents, readHex( tree, "contents" ) );
        material.contents = std::move( contents );

        if ( auto signature_tree = tree.get_child_optional( "signature" ) )
        {
            OUTCOME_TRY( signature, signatureFromTree( *signature_tree ) );
            material.signature = std::move( signature );
        }
        return material;
    }
} // namespace blockwatch::network
