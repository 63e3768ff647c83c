
#include "crypto/sha/sha256.hpp"

#include "base/hexutil.hpp"

namespace calcflow::crypto
{
    Hash256 sha256( std::string_view input )
    {
        Hash256      out{};
        unsigned int digest_len = 0;

        EVP_MD_CTX *ctx = EVP_MD_CTX_new();
        EVP_DigestInit_ex( ctx, EVP_sha256(), nullptr );
        EVP_DigestUpdate( ctx, input.data(), input.size() );
        EVP_DigestFinal_ex( ctx, out.data(), &digest_len );
        EVP_MD_CTX_free( ctx );

        return out;
    }

    std::string sha256Hex( std::string_view input )
    {
        return base::hex_lower( sha256( input ) );
    }

    Sha256Stream::Sha256Stream() : ctx_( EVP_MD_CTX_new(), &EVP_MD_CTX_free )
    {
        EVP_DigestInit_ex( ctx_.get(), EVP_sha256(), nullptr );
    }

    void Sha256Stream::update( std::string_view chunk )
    {
        EVP_DigestUpdate( ctx_.get(), chunk.data(), chunk.size() );
    }

    std::string Sha256Stream::finalHex()
    {
        Hash256      out{};
        unsigned int digest_len = 0;
        EVP_DigestFinal_ex( ctx_.get(), out.data(), &digest_len );
        EVP_DigestInit_ex( ctx_.get(), EVP_sha256(), nullptr );
        return base::hex_lower( out );
    }
} // namespace calcflow::crypto
