// rb_set.hpp
// Ordered set of T backed by a red-black tree.
// --------------------------------------------
// * find / insert / remove are O(log n); the balancing work is done by
//   TreeCore (src/tree_core.cpp), this template only compares values
//   and manages node memory.
// * Comparator-equal values collapse into one node.  What happens on a
//   duplicate insert is decided by the override mode:
//       on  (default) – the stored value is replaced, the old one returned;
//       off           – the tree is untouched, the stored value returned.
// * Not thread-safe.  Wrap it in LockedSet (locked_set.hpp) or serialise
//   access externally: const calls may overlap each other, a mutating call
//   must run alone.
//
//   Usage:
//       rbset::RBSet<int> s;
//       s.insert(42);
//       if (auto v = s.find(42)) std::cout << *v << "\n";
//       s.remove(42);

#ifndef RBSET_RB_SET_HPP
#define RBSET_RB_SET_HPP

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

#include "rbset/level_order.hpp"
#include "rbset/node.hpp"
#include "rbset/tree_core.hpp"

namespace rbset
{

    template <typename T, typename Compare = std::less<T>>
    class RBSet : private TreeCore
    {
    public:
        using value_type = T;
        using NodeT = Node<T>;
        using RotationCallback = std::function<void(const T &, Rotation)>;

        /*───────────────────────────────────────────────────────────────────────
          const_iterator – in-order walk through parent links (no stack).
         ──────────────────────────────────────────────────────────────────────*/
        class const_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T *;
            using reference = const T &;

            const_iterator() noexcept = default;

            reference operator*() const { return value_of(node_); }
            pointer operator->() const { return &value_of(node_); }

            const_iterator &operator++()
            {
                node_ = rbset::TreeCore::successor(node_);
                return *this;
            }

            const_iterator operator++(int)
            {
                const_iterator tmp = *this;
                ++*this;
                return tmp;
            }

            friend bool operator==(const const_iterator &a, const const_iterator &b) noexcept
            {
                return a.node_ == b.node_;
            }

            friend bool operator!=(const const_iterator &a, const const_iterator &b) noexcept
            {
                return a.node_ != b.node_;
            }

        private:
            friend class RBSet;
            explicit const_iterator(const NodeBase *n) noexcept : node_(n) {}

            const NodeBase *node_{nullptr};
        };

        explicit RBSet(bool override_mode = true, Compare comp = Compare())
            : comp_(std::move(comp)), override_mode_(override_mode) {}

        ~RBSet() { clear(); }

        RBSet(const RBSet &) = delete;
        RBSet &operator=(const RBSet &) = delete;

        using TreeCore::empty;
        using TreeCore::size;

        bool is_override_mode() const noexcept { return override_mode_; }

        /* Affects future inserts only. */
        void set_override_mode(bool on) noexcept { override_mode_ = on; }

        /*───────────────────────────────────────────────────────────────────────
          find – binary search from the root; a copy of the stored value, or
          std::nullopt once a null link is reached.
         ──────────────────────────────────────────────────────────────────────*/
        std::optional<T> find(const T &value) const
        {
            const NodeBase *n = locate(value);
            if (n == nullptr)
                return std::nullopt;
            return value_of(n);
        }

        bool contains(const T &value) const { return locate(value) != nullptr; }

        /*───────────────────────────────────────────────────────────────────────
          insert
          ------
          Returns std::nullopt when a new node was linked.  On a duplicate it
          returns the value that was stored before the call (override on) or
          the value that stays stored (override off).
         ──────────────────────────────────────────────────────────────────────*/
        std::optional<T> insert(const T &value) { return insert_value(value); }
        std::optional<T> insert(T &&value) { return insert_value(std::move(value)); }

        /*───────────────────────────────────────────────────────────────────────
          remove – detaches the matching node, rebalances and hands back the
          value it held.  std::nullopt if no stored value compares equal.
         ──────────────────────────────────────────────────────────────────────*/
        std::optional<T> remove(const T &value)
        {
            NodeBase *d = locate(value);
            if (d == nullptr)
                return std::nullopt;

            unlink_and_rebalance(d);

            std::unique_ptr<NodeT> owned(static_cast<NodeT *>(d));
            return std::optional<T>(std::move(owned->value));
        }

        void clear()
        {
            dispose_all([](NodeBase *n) { delete static_cast<NodeT *>(n); });
        }

        /* Install (or, with an empty callback, remove) the rotation observer.
           The callback sees the value of the node that moved down. */
        void on_rotation(RotationCallback cb)
        {
            if (!cb)
            {
                set_rotation_hook(RotationHook{});
                return;
            }
            set_rotation_hook([cb = std::move(cb)](const NodeBase &n, Rotation dir)
                              { cb(value_of(&n), dir); });
        }

        const_iterator begin() const { return const_iterator(leftmost(root())); }
        const_iterator end() const { return const_iterator(); }

        template <typename Fn>
        void for_each(Fn &&fn) const
        {
            for (const T &v : *this)
                fn(v);
        }

        LevelOrder<T> level_order() const { return LevelOrder<T>(header()); }

        /*───────────────────────────────────────────────────────────────────────
          check – all five red-black properties, parent-link consistency,
          node count, and strictly increasing in-order sequence.
         ──────────────────────────────────────────────────────────────────────*/
        Violation check() const
        {
            const Violation v = check_structure();
            if (v != Violation::NONE)
                return v;

            const NodeBase *prev = nullptr;
            for (const NodeBase *n = leftmost(root()); n != nullptr; n = successor(n))
            {
                if (prev != nullptr && !comp_(value_of(prev), value_of(n)))
                    return Violation::ORDER;
                prev = n;
            }
            return Violation::NONE;
        }

        bool validate() const { return check() == Violation::NONE; }

    private:
        static const T &value_of(const NodeBase *n) { return static_cast<const NodeT *>(n)->value; }
        static T &value_of(NodeBase *n) { return static_cast<NodeT *>(n)->value; }

        NodeBase *locate(const T &value) const
        {
            NodeBase *n = root();
            while (n != nullptr)
            {
                const T &v = value_of(n);
                if (comp_(value, v))
                    n = n->left;
                else if (comp_(v, value))
                    n = n->right;
                else
                    return n;
            }
            return nullptr;
        }

        /* Equal node if one exists, otherwise the last node on the search
           path (the would-be parent).  Requires a non-empty tree. */
        NodeBase *find_parent(const T &value) const
        {
            NodeBase *parent = root();
            NodeBase *child = parent;
            while (child != nullptr)
            {
                const T &v = value_of(child);
                if (comp_(value, v))
                {
                    parent = child;
                    child = child->left;
                }
                else if (comp_(v, value))
                {
                    parent = child;
                    child = child->right;
                }
                else
                {
                    return child;
                }
            }
            return parent;
        }

        template <typename U>
        std::optional<T> insert_value(U &&value)
        {
            if (empty())
            {
                insert_and_rebalance(new NodeT(std::forward<U>(value)), nullptr, true);
                return std::nullopt;
            }

            NodeBase *x = find_parent(value);
            T &existing = value_of(x);
            const bool goes_left = comp_(value, existing);

            if (!goes_left && !comp_(existing, value))
            {
                if (!override_mode_)
                    return existing;

                // same key, so the node keeps its place; no rebalancing needed
                T replacement(std::forward<U>(value));
                T previous = std::exchange(existing, std::move(replacement));
                return std::optional<T>(std::move(previous));
            }

            insert_and_rebalance(new NodeT(std::forward<U>(value)), x, goes_left);
            return std::nullopt;
        }

        Compare comp_;
        bool override_mode_;
    };

} // namespace rbset

#endif // RBSET_RB_SET_HPP
