// error.hpp
// Exceptions raised by the balancing core.

#ifndef RBSET_ERROR_HPP
#define RBSET_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rbset
{

    /*-------------------------------------------------------------------------
     *  InvalidStateError
     *-------------------------------------------------------------------------
     *  Thrown when a structural precondition of the algorithm does not hold,
     *  e.g. a rotation whose pivot child is missing.  Reaching it means the
     *  red-black invariants were already broken; callers are not expected to
     *  recover from it.
     *-------------------------------------------------------------------------*/
    class InvalidStateError : public std::logic_error
    {
    public:
        explicit InvalidStateError(const std::string &what)
            : std::logic_error(what) {}
    };

} // namespace rbset

#endif // RBSET_ERROR_HPP
