#pragma once

/**
 * @file array.hpp
 * @brief Definition and implementation of `array` class.
 */

#include "assert.hpp"
#include "dtype.hpp"
#include "exceptions.hpp"
#include "impl/mpl.hpp"
#include "shape.hpp"
#include "slice.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ragged {

class array;

template <numeric T>
array adapt(T value);

/**
 * @brief Bytes of one fixed-width element together with its dtype.
 */
struct element_value
{
    enum dtype dtype = dtype::unknown;
    std::array<uint8_t, 8> bytes{};

    template <numeric T>
    static element_value of(T value) noexcept
    {
        element_value e;
        e.dtype = dtype_enum_v<T>;
        std::memcpy(e.bytes.data(), &value, sizeof(T));
        return e;
    }

    template <numeric T>
    T as() const
    {
        return switch_numeric_dtype(dtype, [this]<typename S>() {
            S s;
            std::memcpy(&s, bytes.data(), sizeof(S));
            return static_cast<T>(s);
        });
    }
};

namespace impl {

/**
 * @brief Validates an integer (or boolean mask) selector and resolves it to non-negative positions
 * within `[0, length)`. Negative positions count from the end.
 */
std::vector<int64_t> resolve_positions(const array& positions, int64_t length);

/// Int64 array holding the positions selected by `s`.
array positions_array(const slice::resolved& s);

/**
 * @brief Numpy style assignment of `values` into `count` target positions.
 *
 * Values with fewer dimensions than the target (`target_dimensions`) are repeated for every position,
 * a length-1 sequence is repeated too, otherwise the length must be `count`.
 * `assign(k, v)` is called with the k-th position and the value to store there.
 */
void broadcast_assign(int64_t count,
                      uint32_t target_dimensions,
                      const array& values,
                      const std::function<void(int64_t, const array&)>& assign);

} // namespace impl

class array
{
private:
    struct holder_
    {
        virtual ~holder_() = default;

        virtual enum dtype dtype() const = 0;
        virtual ragged::shape shape() const = 0;
        virtual element_value element(int64_t) const = 0;
        virtual array get(int64_t) const = 0;
        virtual array slice(const ragged::slice&) const = 0;
        virtual array take(const array&) const = 0;
        virtual array field(std::string_view) const = 0;
        virtual std::vector<std::string> fields() const = 0;
        virtual void set(int64_t, const array&) = 0;
        virtual void put(const array&, const array&) = 0;
        virtual bool writeable() const = 0;
        virtual void set_writeable(bool) = 0;
        virtual bool is_none() const = 0;
        virtual bool owns_addressing() const = 0;
    };

    template <typename I>
    struct concrete_holder_ final : public holder_
    {
        static_assert(impl::has_get_member_function<I> || impl::has_element_member_function<I>,
                      "Array adaptors should implement at least one of the following functions:\n"
                      "\telement_value element(int64_t) const;\n"
                      "\tragged::array get(int64_t) const;\n");

        explicit concrete_holder_(I&& i)
            : impl_(std::move(i))
        {
        }

        explicit concrete_holder_(const I& i)
            : impl_(i)
        {
        }

        enum dtype dtype() const override
        {
            return impl_.dtype();
        }

        ragged::shape shape() const override
        {
            return impl_.shape();
        }

        element_value element(int64_t index) const override
        {
            if constexpr (impl::has_element_member_function<I>) {
                return impl_.element(index);
            } else {
                auto sh = shape();
                if (sh.empty()) {
                    throw invalid_operation("element() method is not implemented for this array.");
                }
                auto subvolume = sh.tail().volume();
                return impl_.get(index / subvolume).element(index % subvolume);
            }
        }

        array get(int64_t index) const override
        {
            if constexpr (impl::has_get_member_function<I>) {
                return impl_.get(index);
            } else {
                throw invalid_operation("get() method is not implemented for this array.");
            }
        }

        array slice(const ragged::slice& s) const override
        {
            if constexpr (impl::has_slice_member_function<I>) {
                return impl_.slice(s);
            } else {
                auto sh = shape();
                if (sh.empty()) {
                    throw invalid_operation("Can't slice a scalar array.");
                }
                return take(impl::positions_array(s.resolve(sh[0])));
            }
        }

        array take(const array& positions) const override
        {
            if constexpr (impl::has_take_member_function<I>) {
                return impl_.take(positions);
            } else {
                throw invalid_operation("take() method is not implemented for this array.");
            }
        }

        array field(std::string_view name) const override
        {
            if constexpr (impl::has_field_member_function<I>) {
                return impl_.field(name);
            } else {
                throw invalid_operation(fmt::format("Array of dtype {} has no field '{}'.",
                                                    dtype_to_str(impl_.dtype()), name));
            }
        }

        std::vector<std::string> fields() const override
        {
            if constexpr (impl::has_fields_member_function<I>) {
                return impl_.fields();
            } else {
                return {};
            }
        }

        void set(int64_t index, const array& value) override
        {
            if constexpr (impl::has_set_member_function<I>) {
                impl_.set(index, value);
            } else {
                throw read_only();
            }
        }

        void put(const array& positions, const array& values) override
        {
            if constexpr (impl::has_put_member_function<I>) {
                impl_.put(positions, values);
            } else if constexpr (impl::has_set_member_function<I>) {
                auto sh = shape();
                auto p = impl::resolve_positions(positions, sh.empty() ? 0 : sh[0]);
                impl::broadcast_assign(static_cast<int64_t>(p.size()),
                                       static_cast<uint32_t>(sh.size()),
                                       values,
                                       [this, &p](int64_t k, const array& v) {
                                           impl_.set(p[static_cast<std::size_t>(k)], v);
                                       });
            } else {
                throw read_only();
            }
        }

        bool writeable() const override
        {
            if constexpr (impl::has_writeable_member_function<I>) {
                return impl_.writeable();
            } else {
                return false;
            }
        }

        void set_writeable(bool value) override
        {
            if constexpr (impl::has_set_writeable_member_function<I>) {
                impl_.set_writeable(value);
            } else if (value) {
                throw invalid_operation("This array can not be made writeable.");
            }
        }

        bool is_none() const override
        {
            if constexpr (impl::has_is_none_member_variable<I>) {
                return I::is_none;
            } else {
                return false;
            }
        }

        bool owns_addressing() const override
        {
            if constexpr (impl::has_owns_addressing_member_variable<I>) {
                return I::owns_addressing;
            } else {
                return false;
            }
        }

        I impl_;
    };

public:
    array() = default;

    template <typename I>
    requires(!std::is_same_v<array, std::remove_cvref_t<I>>)
    explicit array(I&& impl)
        : holder_(std::make_shared<concrete_holder_<std::remove_cvref_t<I>>>(std::forward<I>(impl)))
    {
    }

    explicit operator bool() const noexcept
    {
        return holder_ != nullptr;
    }

    inline enum dtype dtype() const
    {
        return holder()->dtype();
    }

    inline ragged::shape shape() const
    {
        return holder()->shape();
    }

    inline uint32_t dimensions() const
    {
        return static_cast<uint32_t>(shape().size());
    }

    /// Length of the first axis.
    inline int64_t size() const
    {
        auto s = shape();
        if (s.empty()) {
            throw invalid_operation("Can't get size of scalar array.");
        }
        return s[0];
    }

    inline int64_t volume() const
    {
        return shape().volume();
    }

    inline bool is_none() const noexcept
    {
        return holder_ != nullptr && holder_->is_none();
    }

    inline bool writeable() const
    {
        return holder()->writeable();
    }

    /// Changes the writeable flag of this handle and of every copy sharing it.
    inline void set_writeable(bool value)
    {
        holder()->set_writeable(value);
    }

    /// Element at flat (row-major) position `index`.
    inline element_value element(int64_t index) const
    {
        auto v = volume();
        if (index < 0 || index >= v) {
            throw index_out_of_bounds(index, v);
        }
        return holder()->element(index);
    }

    template <numeric T>
    inline T value(int64_t index = 0) const
    {
        return element(index).template as<T>();
    }

    /// Element `index` along the first axis. Negative positions count from the end unless the
    /// implementation resolves positions itself.
    inline array get(int64_t index) const
    {
        const auto* h = holder();
        return h->get(h->owns_addressing() ? index : normalize(index));
    }

    inline array operator[](int64_t index) const
    {
        return get(index);
    }

    inline array slice(const ragged::slice& s) const
    {
        return holder()->slice(s);
    }

    inline array take(const array& positions) const
    {
        return holder()->take(positions);
    }

    inline array field(std::string_view name) const
    {
        return holder()->field(name);
    }

    inline std::vector<std::string> fields() const
    {
        return holder()->fields();
    }

    inline void set(int64_t index, const array& value)
    {
        auto* h = holder();
        h->set(h->owns_addressing() ? index : normalize(index), value);
    }

    template <numeric T>
    inline void set(int64_t index, T value)
    {
        set(index, adapt(value));
    }

    inline void put(const array& positions, const array& values)
    {
        holder()->put(positions, values);
    }

    template <numeric T>
    std::vector<T> to_vector() const
    {
        auto v = volume();
        std::vector<T> result;
        result.reserve(static_cast<std::size_t>(v));
        for (int64_t i = 0; i < v; ++i) {
            result.push_back(holder()->element(i).template as<T>());
        }
        return result;
    }

    template <typename T>
    inline const T* dynamic_cast_() const
    {
        const auto* h = dynamic_cast<const concrete_holder_<T>*>(holder());
        return h != nullptr ? &h->impl_ : nullptr;
    }

private:
    inline holder_* holder()
    {
        check_null();
        return holder_.get();
    }

    inline const holder_* holder() const
    {
        check_null();
        return holder_.get();
    }

    inline void check_null() const
    {
        if (holder_ == nullptr) {
            throw invalid_operation("Null array.");
        }
    }

    inline int64_t normalize(int64_t index) const
    {
        auto n = size();
        auto i = index < 0 ? index + n : index;
        if (i < 0 || i >= n) {
            throw index_out_of_bounds(index, n);
        }
        return i;
    }

private:
    std::shared_ptr<holder_> holder_;
};

} // namespace ragged
