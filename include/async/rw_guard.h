#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace probset::async
{

    /**
     * @brief Single-writer / multiple-reader ownership wrapper.
     *
     * rw_guard owns an object and a shared mutex covering the whole of it.
     *
     * Key Characteristics:
     * - Any number of readers may hold the object at once; they only get const access.
     * - A writer holds it exclusively, so readers never observe a half-applied mutation
     *   (e.g. a quotient filter cluster in the middle of a shift).
     * - There is no finer-grained locking: a single insertion may shift entries across the whole object.
     *
     * Usage Contract:
     * - Handles must not outlive the guard.
     * - A thread must not request a writer while it holds a reader on the same guard (deadlock).
     */
    template <typename T>
    class rw_guard
    {
        T _obj;
        mutable std::shared_mutex _m;

    public:
        // Prevent copying/moving while potentially referenced by an acquired handle
        rw_guard(const rw_guard&) = delete;
        rw_guard& operator=(const rw_guard&) = delete;
        rw_guard(rw_guard&&) = delete;
        rw_guard& operator=(rw_guard&&) = delete;

        explicit rw_guard(T&& obj) : _obj(std::move(obj))
        {
        }

        // RAII style, the lock is held until the handle is released or destroyed
        template <typename Ptr, typename Lock>
        class acquired
        {
            Ptr _obj;
            Lock _lock;

            acquired(Ptr obj, Lock&& lock) : _obj(obj), _lock(std::move(lock))
            {
            }

            friend class rw_guard<T>;

        public:
            acquired(acquired&& other) noexcept : _obj(std::exchange(other._obj, nullptr)), _lock(std::move(other._lock))
            {
            }

            acquired(const acquired&) = delete;
            acquired& operator=(const acquired&) = delete;

            operator bool() const
            {
                return this->_obj != nullptr;
            }

            Ptr operator->() const
            {
                return this->_obj;
            }

            auto& operator*() const
            {
                return *this->_obj;
            }

            void release()
            {
                if(this->_obj == nullptr)
                    return;

                this->_obj = nullptr;

                if(this->_lock.owns_lock())
                    this->_lock.unlock();
            }

            ~acquired()
            {
                this->release();
            }
        };

        using reader_t = acquired<const T*, std::shared_lock<std::shared_mutex>>;
        using writer_t = acquired<T*, std::unique_lock<std::shared_mutex>>;

        /** @brief Blocks until no writer holds the object, then grants const access. */
        [[nodiscard]] reader_t read() const
        {
            return reader_t{&this->_obj, std::shared_lock{this->_m}};
        }

        /** @brief Blocks until every reader and writer is gone, then grants exclusive access. */
        [[nodiscard]] writer_t write()
        {
            return writer_t{&this->_obj, std::unique_lock{this->_m}};
        }

        /** @brief Runs `fn` under a shared lock. */
        template <typename Fn>
        decltype(auto) with_reader(Fn&& fn) const
        {
            std::shared_lock lk(this->_m);
            return std::forward<Fn>(fn)(std::as_const(this->_obj));
        }

        /** @brief Runs `fn` under the exclusive lock. */
        template <typename Fn>
        decltype(auto) with_writer(Fn&& fn)
        {
            std::unique_lock lk(this->_m);
            return std::forward<Fn>(fn)(this->_obj);
        }
    };

} // namespace probset::async
