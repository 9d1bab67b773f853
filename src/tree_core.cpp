// tree_core.cpp
// Rotations, navigation helpers and the insert / delete fix-up state
// machines of the red-black core.  All loops are iterative; nothing
// here recurses, allocates nodes or prints.

#include "rbset/tree_core.hpp"

#include <initializer_list>
#include <utility>
#include <vector>

#include "rbset/error.hpp"

namespace rbset
{

    const char *to_string(Violation v) noexcept
    {
        switch (v)
        {
        case Violation::NONE:
            return "none";
        case Violation::RED_ROOT:
            return "red root";
        case Violation::ROOT_HAS_PARENT:
            return "root has parent";
        case Violation::BROKEN_PARENT_LINK:
            return "broken parent link";
        case Violation::DOUBLE_RED:
            return "double red";
        case Violation::BLACK_HEIGHT:
            return "black height mismatch";
        case Violation::SIZE_MISMATCH:
            return "size mismatch";
        case Violation::ORDER:
            return "order violation";
        }
        return "unknown";
    }

    /*───────────────────────────────────────────────────────────────────────────
      Linking helpers
     ──────────────────────────────────────────────────────────────────────────*/
    void TreeCore::set_parent(NodeBase *node, NodeBase *parent) noexcept
    {
        if (node == nullptr)
            return;
        node->parent = (parent == &header_) ? nullptr : parent;
    }

    NodeBase *&TreeCore::slot_of(NodeBase *node) noexcept
    {
        NodeBase *p = node->parent;
        if (p == nullptr)
            return header_.left;
        return p->left == node ? p->left : p->right;
    }

    void TreeCore::force_root_black() noexcept
    {
        NodeBase *r = header_.left;
        if (r != nullptr)
        {
            r->color = Color::BLACK;
            r->parent = nullptr;
        }
    }

    /*───────────────────────────────────────────────────────────────────────────
      Rotations
      ---------
      Exactly three nodes change: x, its pivot child y, and the owner of x
      (a real parent or the sentinel).  The required child is checked before
      anything is written, so a failing rotation leaves the graph untouched.
     ──────────────────────────────────────────────────────────────────────────*/
    void TreeCore::rotate_left(NodeBase *x)
    {
        NodeBase *y = x->right;
        if (y == nullptr)
            throw InvalidStateError("rotate_left: node has no right child");

        NodeBase *&link = slot_of(x);

        /* β moves from y->left to x->right */
        x->right = y->left;
        if (y->left != nullptr)
            y->left->parent = x;

        /* y takes x's place under x's owner */
        y->parent = x->parent;
        link = y;

        /* x drops to y's left */
        y->left = x;
        x->parent = y;

        if (rotation_hook_)
            rotation_hook_(*x, Rotation::LEFT);
    }

    void TreeCore::rotate_right(NodeBase *x)
    {
        NodeBase *y = x->left;
        if (y == nullptr)
            throw InvalidStateError("rotate_right: node has no left child");

        NodeBase *&link = slot_of(x);

        x->left = y->right;
        if (y->right != nullptr)
            y->right->parent = x;

        y->parent = x->parent;
        link = y;

        y->right = x;
        x->parent = y;

        if (rotation_hook_)
            rotation_hook_(*x, Rotation::RIGHT);
    }

    /*───────────────────────────────────────────────────────────────────────────
      Navigation helpers
     ──────────────────────────────────────────────────────────────────────────*/
    NodeBase *TreeCore::get_sibling(NodeBase *node, NodeBase *parent) noexcept
    {
        if (node == nullptr)
            // The missing child is whichever side is empty.  Both sides being
            // empty would mean a black-height deficit under a leaf, which the
            // invariants rule out.
            return parent->left == nullptr ? parent->right : parent->left;

        parent = node->parent;
        return node == parent->left ? parent->right : parent->left;
    }

    NodeBase *TreeCore::get_uncle(NodeBase *node) noexcept
    {
        NodeBase *parent = node->parent;
        if (parent == nullptr)
            return nullptr;
        NodeBase *grand = parent->parent;
        if (grand == nullptr)
            return nullptr;
        return parent == grand->left ? grand->right : grand->left;
    }

    /*────────────────────────────────────────────────────────────────────────────
      remove_min(node)
      ----------------
      Returns the in-order successor of `node` (left-most node of its right
      subtree).  When the successor sits deeper than node->right, its right
      subtree is hooked into its former parent's left slot before returning.
      The successor keeps its own `parent` and `right` pointers so the caller
      can still locate the deficit position.
    ────────────────────────────────────────────────────────────────────────────*/
    NodeBase *TreeCore::remove_min(NodeBase *node) noexcept
    {
        NodeBase *min = node->right;
        NodeBase *parent = min;
        while (min != nullptr && min->left != nullptr)
        {
            parent = min;
            min = min->left;
        }

        if (parent == min) // node->right has no left child
            return min;

        parent->left = min->right;
        set_parent(min->right, parent);
        return min;
    }

    const NodeBase *TreeCore::leftmost(const NodeBase *n) noexcept
    {
        if (n == nullptr)
            return nullptr;
        while (n->left != nullptr)
            n = n->left;
        return n;
    }

    const NodeBase *TreeCore::successor(const NodeBase *n) noexcept
    {
        if (n->right != nullptr)
            return leftmost(n->right);

        const NodeBase *p = n->parent;
        while (p != nullptr && n == p->right)
        {
            n = p;
            p = p->parent;
        }
        return p;
    }

    /* --------------------------------------------------------------------------
     *  INSERT
     * -------------------------------------------------------------------------- */
    void TreeCore::insert_and_rebalance(NodeBase *z, NodeBase *parent, bool as_left)
    {
        z->left = z->right = nullptr;
        z->color = Color::RED;

        if (parent == nullptr)
        {
            if (header_.left != nullptr)
                throw InvalidStateError("insert_and_rebalance: tree already has a root");
            z->parent = nullptr;
            z->color = Color::BLACK;
            header_.left = z;
            ++size_;
            return;
        }

        z->parent = parent;
        if (as_left)
            parent->left = z;
        else
            parent->right = z;
        ++size_;

        fix_insert(z);
    }

    /* --------------------------------------------------------------------------
     *  Insert fix-up
     *
     *  x is RED.  While its parent is RED (so a grandparent exists, the root
     *  being BLACK):
     *    A. uncle RED    → parent, uncle BLACK; grandparent RED; climb to it.
     *    B. uncle BLACK  → inner child: rotate parent outward first, then
     *                      rotate grandparent the other way.  Whichever node
     *                      ends on top turns BLACK, the old grandparent RED.
     *                      B ends the loop, so at most two rotations happen.
     * -------------------------------------------------------------------------- */
    void TreeCore::fix_insert(NodeBase *x)
    {
        NodeBase *parent = x->parent;

        while (parent != nullptr && parent->is_red())
        {
            NodeBase *uncle = get_uncle(x);

            if (uncle != nullptr && uncle->is_red())
            {
                parent->color = Color::BLACK;
                uncle->color = Color::BLACK;
                parent->parent->color = Color::RED;

                // the grandparent may now be a red child of a red node
                x = parent->parent;
                parent = x->parent;
                continue;
            }

            NodeBase *grand = parent->parent;
            if (parent == grand->left)
            {
                const bool inner = x == parent->right;
                if (inner)
                    rotate_left(parent);
                rotate_right(grand);

                if (inner)
                {
                    x->color = Color::BLACK;
                    parent = nullptr;
                }
                else
                {
                    parent->color = Color::BLACK;
                }
                grand->color = Color::RED;
            }
            else
            {
                const bool inner = x == parent->left;
                if (inner)
                    rotate_right(parent);
                rotate_left(grand);

                if (inner)
                {
                    x->color = Color::BLACK;
                    parent = nullptr;
                }
                else
                {
                    parent->color = Color::BLACK;
                }
                grand->color = Color::RED;
            }
        }

        force_root_black();
    }

    /* --------------------------------------------------------------------------
     *  DELETE
     *
     *  d has a right child  → graft the in-order successor m into d's slot;
     *                         the deficit (if m was BLACK) sits where m's
     *                         right child went.
     *  d has no right child → d's left child (maybe null) takes d's slot;
     *                         the deficit (if d was BLACK) sits there.
     * -------------------------------------------------------------------------- */
    void TreeCore::unlink_and_rebalance(NodeBase *d)
    {
        NodeBase *parent = d->parent != nullptr ? d->parent : &header_;

        if (d->right != nullptr)
        {
            NodeBase *min = remove_min(d);
            const bool min_was_black = min->is_black();

            // where the black-height deficit appears if min was BLACK
            NodeBase *deficit = min->right;
            NodeBase *deficit_parent = min->parent;

            min->left = d->left;
            set_parent(d->left, min);

            if (parent->left == d)
                parent->left = min;
            else
                parent->right = min;
            set_parent(min, parent);

            if (min != d->right)
            {
                min->right = d->right;
                set_parent(d->right, min);
            }
            else
            {
                // min was d's right child and keeps its own right subtree
                deficit_parent = min;
            }

            min->color = d->color;

            if (min_was_black)
                fix_remove(deficit, deficit_parent);
        }
        else
        {
            NodeBase *child = d->left;
            set_parent(child, parent);
            if (parent->left == d)
                parent->left = child;
            else
                parent->right = child;

            if (d->is_black() && header_.left != nullptr)
                fix_remove(child, d->parent);
        }

        d->parent = d->left = d->right = nullptr;
        force_root_black();
        --size_;
    }

    /* --------------------------------------------------------------------------
     *  Delete fix-up
     *
     *  The cursor carries one missing BLACK.  It is (cur, parent) because the
     *  deficit may sit at a null child.  Loop while the cursor is BLACK and
     *  not the root:
     *    1. sibling RED                 → recolour, rotate parent toward cur;
     *                                     the new sibling is BLACK.
     *    2. both nephews BLACK          → sibling RED, climb to parent.
     *    3. near RED, far BLACK         → rotate sibling away from cur (→ 4).
     *    4. far nephew RED              → recolour, rotate parent toward cur,
     *                                     done.
     *  Each case runs at most once per call except 2, so ≤ 3 rotations.
     * -------------------------------------------------------------------------- */
    void TreeCore::fix_remove(NodeBase *cur, NodeBase *parent)
    {
        if (cur != nullptr)
            parent = cur->parent;
        bool red = cur != nullptr && cur->is_red();

        while (!red && !is_root(cur))
        {
            NodeBase *sibling = get_sibling(cur, parent);
            if (sibling == nullptr)
                throw InvalidStateError("fix_remove: deficit position has no sibling");

            const bool cur_is_left = parent->right == sibling;

            if (sibling->is_red())
            {
                parent->color = Color::RED;
                sibling->color = Color::BLACK;
                if (cur_is_left)
                    rotate_left(parent);
                else
                    rotate_right(parent);
            }
            else if (is_black(sibling->left) && is_black(sibling->right))
            {
                sibling->color = Color::RED;
                cur = parent;
                red = cur->is_red();
                parent = cur->parent;
            }
            else if (cur_is_left && is_black(sibling->right))
            {
                sibling->left->color = Color::BLACK;
                sibling->color = Color::RED;
                rotate_right(sibling);
            }
            else if (!cur_is_left && is_black(sibling->left))
            {
                sibling->right->color = Color::BLACK;
                sibling->color = Color::RED;
                rotate_left(sibling);
            }
            else
            {
                sibling->color = parent->color;
                parent->color = Color::BLACK;
                if (cur_is_left)
                {
                    sibling->right->color = Color::BLACK;
                    rotate_left(parent);
                }
                else
                {
                    sibling->left->color = Color::BLACK;
                    rotate_right(parent);
                }
                cur = header_.left; // terminates the loop
            }
        }

        if (red)
            cur->color = Color::BLACK;

        force_root_black();
    }

    /*────────────────────────────────────────────────────────────────────────────
      check_structure
      ───────────────
      Explicit-stack DFS carrying the number of BLACK nodes seen above each
      node.  Every null child closes a path whose count must match the first
      one recorded.  Visiting more nodes than size() reports means either a
      miscount or a cycle; both stop the walk.
     ───────────────────────────────────────────────────────────────────────────*/
    Violation TreeCore::check_structure() const
    {
        const NodeBase *r = header_.left;
        if (r == nullptr)
            return size_ == 0 ? Violation::NONE : Violation::SIZE_MISMATCH;
        if (r->is_red())
            return Violation::RED_ROOT;
        if (r->parent != nullptr)
            return Violation::ROOT_HAS_PARENT;

        std::vector<std::pair<const NodeBase *, int>> stack;
        stack.emplace_back(r, 0);
        int target = -1;
        std::size_t count = 0;

        while (!stack.empty())
        {
            auto [n, blacks] = stack.back();
            stack.pop_back();

            if (++count > size_)
                return Violation::SIZE_MISMATCH;
            if (n->is_black())
                ++blacks;

            for (const NodeBase *child : {n->left, n->right})
            {
                if (child == nullptr)
                {
                    if (target == -1)
                        target = blacks;
                    else if (blacks != target)
                        return Violation::BLACK_HEIGHT;
                    continue;
                }
                if (child->parent != n)
                    return Violation::BROKEN_PARENT_LINK;
                if (n->is_red() && child->is_red())
                    return Violation::DOUBLE_RED;
                stack.emplace_back(child, blacks);
            }
        }

        return count == size_ ? Violation::NONE : Violation::SIZE_MISMATCH;
    }

} // namespace rbset
