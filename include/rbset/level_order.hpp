// level_order.hpp
// Breadth-first, level-by-level view over a tree's nodes.
// -------------------------------------------------------
// * Lazy: each iterator owns an explicit queue and expands a node's
//   children only when it advances past that node.
// * Restartable: every begin() starts a fresh walk from the current
//   root, so the same range can be iterated repeatedly.
// * Read-only.  Mutating the tree invalidates live iterators.

#ifndef RBSET_LEVEL_ORDER_HPP
#define RBSET_LEVEL_ORDER_HPP

#include <cstddef>
#include <deque>
#include <iterator>
#include <utility>

#include "rbset/node.hpp"

namespace rbset
{

    /* Position of a node relative to its parent. */
    enum class Relation : std::uint8_t
    {
        ROOT,
        LEFT,
        RIGHT
    };

    /*-------------------------------------------------------------------------
     *  LevelEntry<T>
     *-------------------------------------------------------------------------
     *  value     – stored value (reference into the live node).
     *  color     – node colour.
     *  relation  – ROOT, or which child of its parent the node is.
     *  depth     – 0 for the root.
     *  parent    – parent's value, nullptr for the root.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct LevelEntry
    {
        const T &value;
        Color color;
        Relation relation;
        std::size_t depth;
        const T *parent;
    };

    template <typename T>
    class LevelOrder
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = LevelEntry<T>;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = LevelEntry<T>;

            iterator() = default;

            LevelEntry<T> operator*() const
            {
                const NodeBase *node = queue_.front().first;
                const NodeBase *p = node->parent;

                Relation rel = Relation::ROOT;
                if (p != nullptr)
                    rel = p->left == node ? Relation::LEFT : Relation::RIGHT;

                return LevelEntry<T>{value_of(node), node->color, rel,
                                     queue_.front().second,
                                     p != nullptr ? &value_of(p) : nullptr};
            }

            iterator &operator++()
            {
                auto [node, depth] = queue_.front();
                queue_.pop_front();
                if (node->left != nullptr)
                    queue_.emplace_back(node->left, depth + 1);
                if (node->right != nullptr)
                    queue_.emplace_back(node->right, depth + 1);
                return *this;
            }

            friend bool operator==(const iterator &a, const iterator &b) noexcept
            {
                if (a.queue_.empty() || b.queue_.empty())
                    return a.queue_.empty() && b.queue_.empty();
                return a.queue_.front().first == b.queue_.front().first;
            }

            friend bool operator!=(const iterator &a, const iterator &b) noexcept
            {
                return !(a == b);
            }

        private:
            friend class LevelOrder;

            explicit iterator(const NodeBase *root)
            {
                if (root != nullptr)
                    queue_.emplace_back(root, 0);
            }

            static const T &value_of(const NodeBase *n)
            {
                return static_cast<const Node<T> *>(n)->value;
            }

            std::deque<std::pair<const NodeBase *, std::size_t>> queue_;
        };

        /* `header` is the tree's sentinel; its left link is read on begin(). */
        explicit LevelOrder(const NodeBase &header) noexcept : header_(&header) {}

        iterator begin() const { return iterator(header_->left); }
        iterator end() const { return iterator(); }

    private:
        const NodeBase *header_;
    };

} // namespace rbset

#endif // RBSET_LEVEL_ORDER_HPP
