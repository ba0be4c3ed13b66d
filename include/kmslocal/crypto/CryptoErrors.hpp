#ifndef INCLUDE_KMSLOCAL_CRYPTO_CRYPTOERRORS_HPP
#define INCLUDE_KMSLOCAL_CRYPTO_CRYPTOERRORS_HPP

#include <stdexcept>

namespace kmslocal::crypto
{

class RandomSourceError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A backend call failed or was handed a length it cannot process.
class CryptoBackendError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace kmslocal::crypto

#endif // INCLUDE_KMSLOCAL_CRYPTO_CRYPTOERRORS_HPP
