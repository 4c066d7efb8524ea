#pragma once

#include <fileslice/detail/forward.hpp>
#include <fileslice/detail/macros.hpp>

#include <system_error>
#include <type_traits>
#include <utility>
#include <new>

namespace fsl {
    // Tagged union of a value or an error. Errors are usually std::error_code,
    // but any type works: try_reclaim() hands back a whole FileSlice.
    template <typename T, typename E>
    struct Expected {
        static_assert(!std::is_same_v<T, E>, "T and E must be distinct types");
        std::aligned_union_t<0, T, E> storage;
        enum Tag {
            tag_value,
            tag_error
        } tag;

        Expected(const T&) noexcept;
        Expected(T&&) noexcept;
        Expected(const E&) noexcept;
        Expected(E&&) noexcept;
        ~Expected() noexcept;

        Expected(const Expected&) noexcept;
        Expected(Expected&&) noexcept;
        Expected& operator =(const Expected&) noexcept;
        Expected& operator =(Expected&&) noexcept;

        fsl_nodiscard T&       value() noexcept;
        fsl_nodiscard const T& value() const noexcept;
        fsl_nodiscard T        unwrap() noexcept;
        fsl_nodiscard E&       error() noexcept;
        fsl_nodiscard const E& error() const noexcept;

        fsl_nodiscard bool is_value() const noexcept;
        fsl_nodiscard bool is_error() const noexcept;

        fsl_nodiscard explicit operator bool() const noexcept;
        fsl_nodiscard bool operator !() const noexcept;

    private:
        void _destroy() noexcept;
    };

    template <typename T, typename E>
    Expected<T, E>::Expected(const T& value) noexcept {
        new (&storage) T(value);
        tag = tag_value;
    }

    template <typename T, typename E>
    Expected<T, E>::Expected(T&& value) noexcept {
        new (&storage) T(std::move(value));
        tag = tag_value;
    }

    template <typename T, typename E>
    Expected<T, E>::Expected(const E& error) noexcept {
        new (&storage) E(error);
        tag = tag_error;
    }

    template <typename T, typename E>
    Expected<T, E>::Expected(E&& error) noexcept {
        new (&storage) E(std::move(error));
        tag = tag_error;
    }

    template <typename T, typename E>
    Expected<T, E>::~Expected() noexcept {
        _destroy();
    }

    template <typename T, typename E>
    Expected<T, E>::Expected(const Expected& other) noexcept {
        switch (tag = other.tag) {
            case tag_value: new (&storage) T(other.value()); break;
            case tag_error: new (&storage) E(other.error()); break;
        }
    }

    template <typename T, typename E>
    Expected<T, E>::Expected(Expected&& other) noexcept {
        switch (tag = other.tag) {
            case tag_value: new (&storage) T(std::move(other.value())); break;
            case tag_error: new (&storage) E(std::move(other.error())); break;
        }
    }

    template <typename T, typename E>
    Expected<T, E>& Expected<T, E>::operator =(const Expected& other) noexcept {
        if (this != &other) {
            _destroy();
            switch (tag = other.tag) {
                case tag_value: new (&storage) T(other.value()); break;
                case tag_error: new (&storage) E(other.error()); break;
            }
        }
        return *this;
    }

    template <typename T, typename E>
    Expected<T, E>& Expected<T, E>::operator =(Expected&& other) noexcept {
        if (this != &other) {
            _destroy();
            switch (tag = other.tag) {
                case tag_value: new (&storage) T(std::move(other.value())); break;
                case tag_error: new (&storage) E(std::move(other.error())); break;
            }
        }
        return *this;
    }

    template <typename T, typename E>
    fsl_nodiscard T& Expected<T, E>::value() noexcept {
        fsl_unlikely_if(tag != tag_value) {
            fsl_panic("called value() on error Expected<T, E>");
        }
        return *std::launder(reinterpret_cast<T*>(&storage));
    }

    template <typename T, typename E>
    fsl_nodiscard const T& Expected<T, E>::value() const noexcept {
        fsl_unlikely_if(tag != tag_value) {
            fsl_panic("called value() on error Expected<T, E>");
        }
        return *std::launder(reinterpret_cast<const T*>(&storage));
    }

    template <typename T, typename E>
    fsl_nodiscard T Expected<T, E>::unwrap() noexcept {
        return std::move(value());
    }

    template <typename T, typename E>
    fsl_nodiscard E& Expected<T, E>::error() noexcept {
        fsl_unlikely_if(tag != tag_error) {
            fsl_panic("called error() on value Expected<T, E>");
        }
        return *std::launder(reinterpret_cast<E*>(&storage));
    }

    template <typename T, typename E>
    fsl_nodiscard const E& Expected<T, E>::error() const noexcept {
        fsl_unlikely_if(tag != tag_error) {
            fsl_panic("called error() on value Expected<T, E>");
        }
        return *std::launder(reinterpret_cast<const E*>(&storage));
    }

    template <typename T, typename E>
    fsl_nodiscard bool Expected<T, E>::is_value() const noexcept {
        return tag == tag_value;
    }

    template <typename T, typename E>
    fsl_nodiscard bool Expected<T, E>::is_error() const noexcept {
        return tag == tag_error;
    }

    template <typename T, typename E>
    fsl_nodiscard Expected<T, E>::operator bool() const noexcept {
        return is_value();
    }

    template <typename T, typename E>
    fsl_nodiscard bool Expected<T, E>::operator !() const noexcept {
        return is_error();
    }

    template <typename T, typename E>
    void Expected<T, E>::_destroy() noexcept {
        switch (tag) {
            case tag_value: std::launder(reinterpret_cast<T*>(&storage))->~T(); break;
            case tag_error: std::launder(reinterpret_cast<E*>(&storage))->~E(); break;
        }
    }
} // namespace fsl
