#pragma once
///@file

#include <mutex>

namespace ociauth {

/**
 * This template class ensures synchronized access to a value of type
 * T. It is used as follows:
 *
 *   struct Data { int x; ... };
 *
 *   Sync<Data> data;
 *
 *   {
 *     auto data_(data.lock());
 *     data_->x = 123;
 *   }
 *
 * Here, "data" is automatically unlocked when "data_" goes out of
 * scope.
 */
template<class T, class M = std::mutex>
class Sync
{
private:
    M mutex;
    T data;

public:

    Sync() {}

    Sync(T && data) noexcept
        : data(std::move(data))
    {
    }

    class Lock
    {
        Sync * s;
        std::unique_lock<M> lk;
        friend Sync;

        Lock(Sync * s)
            : s(s)
            , lk(s->mutex)
        {
        }

    public:
        Lock(const Lock & l) = delete;

        T * operator->()
        {
            return &s->data;
        }

        T & operator*()
        {
            return s->data;
        }
    };

    /**
     * Acquire exclusive access to the inner value.
     */
    Lock lock()
    {
        return Lock(this);
    }
};

} // namespace ociauth
