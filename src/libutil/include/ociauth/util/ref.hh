#pragma once
///@file

#include <memory>
#include <stdexcept>

namespace ociauth {

/**
 * A non-nullable reference-counted pointer: a `std::shared_ptr` that
 * refuses to be constructed from null.
 */
template<typename T>
class ref
{
private:

    std::shared_ptr<T> p;

    void assertNonNull()
    {
        if (!p)
            throw std::invalid_argument("null pointer cast to ref");
    }

public:

    using element_type = T;

    explicit ref(const std::shared_ptr<T> & p)
        : p(p)
    {
        assertNonNull();
    }

    explicit ref(std::shared_ptr<T> && p)
        : p(std::move(p))
    {
        assertNonNull();
    }

    T * operator->() const
    {
        return &*p;
    }

    T & operator*() const
    {
        return *p;
    }

    std::shared_ptr<T> get_ptr() const
    {
        return p;
    }

    template<typename T2>
    operator ref<T2>() const
    {
        return ref<T2>((std::shared_ptr<T2>) p);
    }

    bool operator==(const ref<T> & other) const
    {
        return p == other.p;
    }
};

template<typename T, typename... Args>
inline ref<T> make_ref(Args &&... args)
{
    return ref<T>(std::make_shared<T>(std::forward<Args>(args)...));
}

} // namespace ociauth
