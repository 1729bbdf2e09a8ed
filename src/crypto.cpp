#include "pchheader.hpp"
#include "crypto.hpp"
#include "util/util.hpp"

namespace crypto
{

    /**
     * Initializes the crypto subsystem. Must be called once during application startup.
     * @return 0 for successful initialization. -1 for failure.
     */
    int init()
    {
        if (sodium_init() < 0)
        {
            std::cerr << "sodium_init failed.\n";
            return -1;
        }

        return 0;
    }

    /**
     * Fills the string with the requested number of random bytes.
     */
    void random_bytes(std::string &result, const size_t len)
    {
        result.resize(len);
        randombytes_buf(result.data(), len);
    }

    /**
     * Returns a hex token made of 'len' random bytes. Used for unique temporary file names.
     */
    const std::string random_token(const size_t len)
    {
        std::string rand_bytes;
        random_bytes(rand_bytes, len);
        return util::to_hex(rand_bytes);
    }

} // namespace crypto
