// locked_set.hpp
// RBSet behind one global reader/writer lock.
// -------------------------------------------
//   ┌───────────────────────────┬──────────────────────────────────────┐
//   │ find / contains / size /  │ shared_lock → concurrent readers     │
//   │ validate / read()         │                                      │
//   ├───────────────────────────┼──────────────────────────────────────┤
//   │ insert / remove / clear / │ unique_lock → one writer, no readers │
//   │ set_override_mode/write() │                                      │
//   └───────────────────────────┴──────────────────────────────────────┘
// Rotations and recolours happen only under the unique lock, so readers
// never observe a half-relinked tree.  read()/write() run a callable
// against the underlying set while the lock is held, for multi-step
// operations that must appear atomic.

#ifndef RBSET_LOCKED_SET_HPP
#define RBSET_LOCKED_SET_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>

#include "rbset/rb_set.hpp"

namespace rbset
{

    template <typename T, typename Compare = std::less<T>>
    class LockedSet
    {
    public:
        using SetT = RBSet<T, Compare>;

        explicit LockedSet(bool override_mode = true, Compare comp = Compare())
            : set_(override_mode, std::move(comp)) {}

        LockedSet(const LockedSet &) = delete;
        LockedSet &operator=(const LockedSet &) = delete;

        std::optional<T> find(const T &value) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return set_.find(value);
        }

        bool contains(const T &value) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return set_.contains(value);
        }

        std::size_t size() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return set_.size();
        }

        bool is_override_mode() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return set_.is_override_mode();
        }

        Violation check() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return set_.check();
        }

        bool validate() const { return check() == Violation::NONE; }

        std::optional<T> insert(const T &value)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return set_.insert(value);
        }

        std::optional<T> insert(T &&value)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return set_.insert(std::move(value));
        }

        std::optional<T> remove(const T &value)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return set_.remove(value);
        }

        void clear()
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            set_.clear();
        }

        void set_override_mode(bool on)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            set_.set_override_mode(on);
        }

        /* fn(const SetT &) under the shared lock.  Do not let references
           into the set escape the call. */
        template <typename Fn>
        auto read(Fn &&fn) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return std::forward<Fn>(fn)(static_cast<const SetT &>(set_));
        }

        /* fn(SetT &) under the unique lock. */
        template <typename Fn>
        auto write(Fn &&fn)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return std::forward<Fn>(fn)(set_);
        }

    private:
        SetT set_;
        mutable std::shared_mutex mutex_;
    };

} // namespace rbset

#endif // RBSET_LOCKED_SET_HPP
