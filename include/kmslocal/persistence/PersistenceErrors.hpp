#ifndef INCLUDE_KMSLOCAL_PERSISTENCE_PERSISTENCEERRORS_HPP
#define INCLUDE_KMSLOCAL_PERSISTENCE_PERSISTENCEERRORS_HPP

#include <stdexcept>

namespace kmslocal::persistence
{

class IoError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace kmslocal::persistence

#endif // INCLUDE_KMSLOCAL_PERSISTENCE_PERSISTENCEERRORS_HPP
