#ifndef _REVUSB_CRYPTO_
#define _REVUSB_CRYPTO_

#include "pchheader.hpp"

/**
 * Offers convenience functions for random data generation wrapping libsodium.
 */
namespace crypto
{
    int init();

    void random_bytes(std::string &result, const size_t len);

    const std::string random_token(const size_t len);

} // namespace crypto

#endif
