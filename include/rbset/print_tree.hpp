// print_tree.hpp
// Text rendering of a tree, one line per level.
//
//   12(B)
//   5(R 12 LE)	15(B 12 RI)
//   ...
//
// Each entry is value(colour parent side); the root has no parent part.

#ifndef RBSET_PRINT_TREE_HPP
#define RBSET_PRINT_TREE_HPP

#include <cstddef>
#include <sstream>
#include <string>

#include "rbset/level_order.hpp"
#include "rbset/rb_set.hpp"

namespace rbset
{

    template <typename T, typename Compare>
    std::string format_levels(const RBSet<T, Compare> &set)
    {
        std::ostringstream out;
        std::size_t depth = 0;
        bool line_start = true;

        for (const auto &entry : set.level_order())
        {
            if (entry.depth != depth)
            {
                out << '\n';
                depth = entry.depth;
                line_start = true;
            }
            if (!line_start)
                out << '\t';
            line_start = false;

            out << entry.value << '(' << to_string(entry.color);
            if (entry.parent != nullptr)
                out << ' ' << *entry.parent
                    << (entry.relation == Relation::LEFT ? " LE" : " RI");
            out << ')';
        }

        if (!set.empty())
            out << '\n';
        return out.str();
    }

} // namespace rbset

#endif // RBSET_PRINT_TREE_HPP
