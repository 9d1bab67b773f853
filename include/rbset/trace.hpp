// trace.hpp
// Debug logging of rotations through the rotation hook.  The balancing
// core itself never writes output; attach this when the rotation
// sequence is of interest (RBSET_LOG_LEVEL=debug to see it).

#ifndef RBSET_TRACE_HPP
#define RBSET_TRACE_HPP

#include "rbset/rb_set.hpp"
#include "rbset/util/print.hpp"

namespace rbset
{

    template <typename T, typename Compare>
    void trace_rotations(RBSet<T, Compare> &set)
    {
        set.on_rotation([](const T &pivot, Rotation dir)
                        { util::log(util::level::debug, "rotate {} at {}", to_string(dir), pivot); });
    }

} // namespace rbset

#endif // RBSET_TRACE_HPP
