// node.hpp
// Node layout shared by the balancing core and the typed set facade.
// -----------------------------------------------------------------
// * NodeBase carries only the links and the colour bit, so the
//   red-black algorithm in tree_core.cpp is compiled once for every
//   value type.
// * Node<T> adds the stored value.  The sentinel root is a bare
//   NodeBase and therefore never holds (or default-constructs) a T.

#ifndef RBSET_NODE_HPP
#define RBSET_NODE_HPP

#include <cstdint>
#include <utility>

namespace rbset
{

    /*-------------------------------------------------------------------------
     *  enum Color
     *-------------------------------------------------------------------------
     *  • New nodes start RED; the actual root is always BLACK.
     *  • A null child counts as BLACK (see TreeCore::is_black).
     *-------------------------------------------------------------------------*/
    enum class Color : std::uint8_t
    {
        RED,
        BLACK
    };

    /* Direction of a rotation, reported to the rotation hook. */
    enum class Rotation : std::uint8_t
    {
        LEFT,
        RIGHT
    };

    inline const char *to_string(Color c) noexcept
    {
        return c == Color::RED ? "R" : "B";
    }

    inline const char *to_string(Rotation r) noexcept
    {
        return r == Rotation::LEFT ? "left" : "right";
    }

    /*-------------------------------------------------------------------------
     *  struct NodeBase
     *-------------------------------------------------------------------------
     *  left, right  – owning links (the tree frees through them).
     *  parent       – non-owning back-reference; nullptr for the actual root.
     *                 It never points at the sentinel.
     *-------------------------------------------------------------------------*/
    struct NodeBase
    {
        NodeBase *parent{nullptr};
        NodeBase *left{nullptr};
        NodeBase *right{nullptr};
        Color color{Color::RED};

        bool is_red() const noexcept { return color == Color::RED; }
        bool is_black() const noexcept { return color == Color::BLACK; }
        bool is_leaf() const noexcept { return left == nullptr && right == nullptr; }
    };

    template <typename T>
    struct Node : NodeBase
    {
        T value;

        explicit Node(const T &v) : value(v) {}
        explicit Node(T &&v) : value(std::move(v)) {}
    };

} // namespace rbset

#endif // RBSET_NODE_HPP
