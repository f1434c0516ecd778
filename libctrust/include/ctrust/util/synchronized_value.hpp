// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_UTIL_SYNCHRONIZED_VALUE_HPP
#define CTRUST_UTIL_SYNCHRONIZED_VALUE_HPP

#include <concepts>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace ctrust::util
{
    /// see https://en.cppreference.com/w/cpp/named_req/BasicLockable.html
    template <class T>
    concept BasicLockable = requires(T& x) {
        x.lock();
        x.unlock();
    };

    /// see https://en.cppreference.com/w/cpp/named_req/LockableMutex.html
    template <class T>
    concept Lockable = BasicLockable<T> and requires(T& x) {
        { x.try_lock() } -> std::convertible_to<bool>;
    };

    /// see https://en.cppreference.com/w/cpp/named_req/Mutex.html
    template <class T>
    concept Mutex = Lockable<T> and std::default_initializable<T> and std::destructible<T>
                    and (not std::movable<T>) and (not std::copyable<T>);

    /// see https://en.cppreference.com/w/cpp/named_req/SharedMutex.html
    template <class T>
    concept SharedMutex = Mutex<T> and requires(T& x) {
        x.lock_shared();
        { x.try_lock_shared() } -> std::convertible_to<bool>;
        x.unlock_shared();
    };

    /** Locks a mutex object using the most constrained sharing lock available for that mutex type.
        @returns A scoped locking object. The exact type depends on the mutex type.
    */
    template <Mutex M>
    [[nodiscard]]
    auto lock_as_readonly(M& mutex)
    {
        return std::unique_lock{ mutex };
    }

    template <SharedMutex M>
    [[nodiscard]]
    auto lock_as_readonly(M& mutex)
    {
        return std::shared_lock{ mutex };
    }

    /** Locks a mutex object using an exclusive lock.
        @returns A scoped locking object.
    */
    template <Mutex M>
    [[nodiscard]]
    auto lock_as_exclusive(M& mutex)
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

        If `readonly == true`, only non-mutable access to the associated value will be provided.
    */
    template <std::default_initializable T, Mutex M, bool readonly>
    class [[nodiscard]] scoped_locked_ptr
    {
        std::conditional_t<readonly, const T*, T*> m_value;
        lock_type<M, readonly> m_lock;

    public:

        static constexpr bool is_readonly = readonly;

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
            : m_value(std::move(other.m_value))
            , m_lock(std::move(other.m_lock))
        {
            other.m_value = nullptr;
        }

        scoped_locked_ptr& operator=(scoped_locked_ptr&& other) noexcept
        {
            m_value = std::move(other.m_value);
            m_lock = std::move(other.m_lock);
            other.m_value = nullptr;
            return *this;
        }

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

        Holds an object which access is always implying a lock to an associated mutex.
        If the mutex type satisfies `SharedMutex`, the locks will be shared if using `const`
        functions, enabling cheaper read-only access to the object in that context.

        `synchronize()` locks for a whole scope, `operator->` for the time of an expression,
        `apply()` for the time of the provided invocable.
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

        synchronized_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_value(std::move(value))
        {
        }

        synchronized_value(const synchronized_value& other)
            : m_value(other.value())
        {
        }

        auto operator=(const synchronized_value& other) -> synchronized_value&
        {
            if (this != &other)
            {
                auto copy = other.value();
                auto _ = lock_as_exclusive(m_mutex);
                m_value = std::move(copy);
            }
            return *this;
        }

        auto operator=(T value) -> synchronized_value&
        {
            auto _ = lock_as_exclusive(m_mutex);
            m_value = std::move(value);
            return *this;
        }

        /** Locks and return a copy of the current object.
            If `SharedMutex<M> == true`, the lock is a shared-lock.
        */
        [[nodiscard]] auto value() const -> T
        {
            auto _ = lock_as_readonly(m_mutex);
            return m_value;
        }

        [[nodiscard]] auto operator->() -> locked_ptr
        {
            return locked_ptr{ m_value, m_mutex };
        }

        [[nodiscard]] auto operator->() const -> const_locked_ptr
        {
            return const_locked_ptr{ m_value, m_mutex };
        }

        [[nodiscard]] auto synchronize() -> locked_ptr
        {
            return locked_ptr{ m_value, m_mutex };
        }

        [[nodiscard]] auto synchronize() const -> const_locked_ptr
        {
            return const_locked_ptr{ m_value, m_mutex };
        }

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
        mutable M m_mutex{};
    };
}
#endif
