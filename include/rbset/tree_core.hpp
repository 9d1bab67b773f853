// tree_core.hpp
// Value-independent red-black balancing core.
// -------------------------------------------
// * Owns the sentinel root: a bare NodeBase whose `left` link is the
//   actual root.  Rotations that would relink "the root's parent"
//   relink the sentinel instead, so no branch on a missing parent is
//   needed when writing the owning link.
// * Knows nothing about values or ordering.  RBSet<T, Compare> finds
//   positions with its comparator and hands nodes to
//   insert_and_rebalance() / unlink_and_rebalance().
// * No internal locking: callers serialise all mutating calls
//   (see locked_set.hpp for a ready-made wrapper).

#ifndef RBSET_TREE_CORE_HPP
#define RBSET_TREE_CORE_HPP

#include <cstddef>
#include <functional>

#include "rbset/node.hpp"

namespace rbset
{

    /* Result of an invariant check.  NONE means the tree is valid. */
    enum class Violation : std::uint8_t
    {
        NONE,
        RED_ROOT,           // actual root is RED
        ROOT_HAS_PARENT,    // actual root carries a parent reference
        BROKEN_PARENT_LINK, // child->parent does not point at its owner
        DOUBLE_RED,         // RED node with a RED child
        BLACK_HEIGHT,       // two null-child paths with different black counts
        SIZE_MISMATCH,      // node count differs from size()
        ORDER               // in-order sequence not strictly increasing
    };

    const char *to_string(Violation v) noexcept;

    class TreeCore
    {
    public:
        /* Invoked after every completed rotation with the node that moved
           down and the rotation direction.  Must not throw: it runs in the
           middle of a fix-up. */
        using RotationHook = std::function<void(const NodeBase &, Rotation)>;

        TreeCore() noexcept { header_.color = Color::BLACK; }

        TreeCore(const TreeCore &) = delete;
        TreeCore &operator=(const TreeCore &) = delete;

        std::size_t size() const noexcept { return size_; }
        bool empty() const noexcept { return header_.left == nullptr; }

        /* Structural part of the invariant check: colours, parent links,
           black-height and node count.  Iterative, O(n). */
        Violation check_structure() const;

        static const NodeBase *leftmost(const NodeBase *n) noexcept;
        static const NodeBase *successor(const NodeBase *n) noexcept;

    protected:
        NodeBase *root() const noexcept { return header_.left; }
        NodeBase &header() noexcept { return header_; }
        const NodeBase &header() const noexcept { return header_; }

        void set_rotation_hook(RotationHook hook) { rotation_hook_ = std::move(hook); }

        /* Link `z` below `parent` (nullptr → z becomes the root) and restore
           the invariants.  size() grows by one. */
        void insert_and_rebalance(NodeBase *z, NodeBase *parent, bool as_left);

        /* Detach `d` from the tree and restore the invariants.  The caller
           owns `d` afterwards; its links are cleared.  size() shrinks by one. */
        void unlink_and_rebalance(NodeBase *d);

        /* Post-order walk through parent links that hands every node to
           `drop` after unhooking it.  Leaves the tree empty. */
        template <typename Drop>
        void dispose_all(Drop drop)
        {
            NodeBase *n = header_.left;
            while (n != nullptr)
            {
                if (n->left != nullptr)
                {
                    n = n->left;
                }
                else if (n->right != nullptr)
                {
                    n = n->right;
                }
                else
                {
                    NodeBase *p = n->parent;
                    if (p != nullptr)
                    {
                        if (p->left == n)
                            p->left = nullptr;
                        else
                            p->right = nullptr;
                    }
                    drop(n);
                    n = p;
                }
            }
            header_.left = nullptr;
            size_ = 0;
        }

        /*---------------------------------------------------------------------
         *  Rotation primitives
         *---------------------------------------------------------------------
         *          p              p
         *         /              /
         *        x              y
         *       / \    --->    / \
         *      α   y          x   γ
         *         / \        / \
         *        β   γ      α   β
         *
         *  rotate_left(x) needs x->right, rotate_right(x) needs x->left;
         *  otherwise InvalidStateError is thrown before any link changes.
         *---------------------------------------------------------------------*/
        void rotate_left(NodeBase *x);
        void rotate_right(NodeBase *x);

        void fix_insert(NodeBase *x);

        /* `cur` may be nullptr: the deficit then sits at the missing child
           of `parent`. */
        void fix_remove(NodeBase *cur, NodeBase *parent);

        /* Navigation helpers */
        static NodeBase *get_sibling(NodeBase *node, NodeBase *parent) noexcept;
        static NodeBase *get_uncle(NodeBase *node) noexcept;
        NodeBase *remove_min(NodeBase *node) noexcept;
        static bool is_black(const NodeBase *node) noexcept
        {
            return node == nullptr || node->is_black();
        }
        bool is_root(const NodeBase *node) const noexcept
        {
            return node != nullptr && node == header_.left && node->parent == nullptr;
        }

    private:
        /* Write `parent` into node->parent, mapping the sentinel to nullptr. */
        void set_parent(NodeBase *node, NodeBase *parent) noexcept;

        /* The owning link that currently points at `node`. */
        NodeBase *&slot_of(NodeBase *node) noexcept;

        void force_root_black() noexcept;

        NodeBase header_;
        std::size_t size_{0};
        RotationHook rotation_hook_;
    };

} // namespace rbset

#endif // RBSET_TREE_CORE_HPP
