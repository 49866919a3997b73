// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_UTIL_SYNCHRONIZED_VALUE_HPP
#define ARTPORT_UTIL_SYNCHRONIZED_VALUE_HPP

#include <concepts>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace artport::util
{
    /// see https://en.cppreference.com/w/cpp/named_req/Mutex.html
    template <class T>
    concept Mutex = requires(T& x) {
        x.lock();
        x.unlock();
        { x.try_lock() } -> std::convertible_to<bool>;
    } and std::default_initializable<T> and (not std::movable<T>);

    /// see https://en.cppreference.com/w/cpp/named_req/SharedMutex.html
    template <class T>
    concept SharedMutex = Mutex<T> and requires(T& x) {
        x.lock_shared();
        x.unlock_shared();
    };

    /** Locks a mutex object using the most constrained sharing lock available for that mutex type.
        @returns A scoped locking object. The exact type depends on the mutex type.
    */
    template <Mutex M>
    [[nodiscard]] auto lock_as_readonly(M& mutex)
    {
        return std::unique_lock{ mutex };
    }

    template <SharedMutex M>
    [[nodiscard]] auto lock_as_readonly(M& mutex)
    {
        return std::shared_lock{ mutex };
    }

    template <Mutex M>
    [[nodiscard]] auto lock_as_exclusive(M& mutex)
    {
        return std::unique_lock{ mutex };
    }

    namespace details
    {
        template <typename T>
        T& ref_of();  // used only in non-executed contexts
    }

    template <Mutex M, bool readonly>
    using lock_type = std::conditional_t<
        readonly,
        decltype(lock_as_readonly(details::ref_of<M>())),
        decltype(lock_as_exclusive(details::ref_of<M>()))>;

    /** Locks a mutex for the lifetime of this type's instance and provide access to an associated
        value.

        If `readonly == true`, only non-mutable access to the associated value is provided.
    */
    template <std::default_initializable T, Mutex M, bool readonly>
    class [[nodiscard]] scoped_locked_ptr
    {
        std::conditional_t<readonly, const T*, T*> m_value;
        lock_type<M, readonly> m_lock;

    public:

        scoped_locked_ptr(T& value, M& mutex)
            requires(not readonly)
            : m_value(&value)
            , m_lock(mutex)
        {
        }

        scoped_locked_ptr(const T& value, M& mutex)
            requires(readonly)
            : m_value(&value)
            , m_lock(mutex)
        {
        }

        scoped_locked_ptr(scoped_locked_ptr&& other) noexcept
            : m_value(other.m_value)
            , m_lock(std::move(other.m_lock))
        {
            other.m_value = nullptr;
        }

        scoped_locked_ptr(const scoped_locked_ptr&) = delete;
        scoped_locked_ptr& operator=(const scoped_locked_ptr&) = delete;

        [[nodiscard]] auto operator*() -> T& requires(not readonly) { return *m_value; }
        [[nodiscard]] auto operator*() const -> const T&
        {
            return *m_value;
        }

        [[nodiscard]] auto operator->() -> T* requires(not readonly) { return m_value; }
        [[nodiscard]] auto operator->() const -> const T*
        {
            return m_value;
        }
    };

    /** Thread-safe value storage.

        Every access to the stored object goes through a lock on the associated mutex.
        `synchronize()` holds the lock for a whole scope, `operator->` for one expression.
        With a `SharedMutex`, `const` access takes a shared lock.

        Inspired by boost::thread::synchronized_value.
    */
    template <std::default_initializable T, Mutex M = std::mutex>
    class synchronized_value
    {
    public:

        using value_type = T;
        using mutex_type = M;
        using locked_ptr = scoped_locked_ptr<T, M, false>;
        using const_locked_ptr = scoped_locked_ptr<T, M, true>;

        synchronized_value() = default;

        explicit synchronized_value(T value)
            : m_value(std::move(value))
        {
        }

        synchronized_value(const synchronized_value&) = delete;
        synchronized_value& operator=(const synchronized_value&) = delete;

        /** Locks and returns a copy of the stored object. */
        [[nodiscard]] auto value() const -> T
        {
            auto _ = lock_as_readonly(m_mutex);
            return m_value;
        }

        [[nodiscard]] auto operator->() -> locked_ptr
        {
            return synchronize();
        }

        [[nodiscard]] auto operator->() const -> const_locked_ptr
        {
            return synchronize();
        }

        [[nodiscard]] auto synchronize() -> locked_ptr
        {
            return locked_ptr{ m_value, m_mutex };
        }

        [[nodiscard]] auto synchronize() const -> const_locked_ptr
        {
            return const_locked_ptr{ m_value, m_mutex };
        }

        /** Locks, then invokes `func` with the stored object as first argument. */
        template <typename Func, typename... Args>
            requires std::invocable<Func, T&, Args...>
        auto apply(Func&& func, Args&&... args)
        {
            auto _ = lock_as_exclusive(m_mutex);
            return std::invoke(std::forward<Func>(func), m_value, std::forward<Args>(args)...);
        }

        template <typename Func, typename... Args>
            requires std::invocable<Func, const T&, Args...>
        auto apply(Func&& func, Args&&... args) const
        {
            auto _ = lock_as_readonly(m_mutex);
            return std::invoke(std::forward<Func>(func), m_value, std::forward<Args>(args)...);
        }

    private:

        T m_value{};
        mutable M m_mutex;
    };
}

#endif
