// Copyright (c) 2026, Artport Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTPORT_CORE_ERROR_HANDLING_HPP
#define ARTPORT_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace artport
{

    /***********************
     * Artport exceptions *
     ***********************/

    /**
     * Every transport creation failure is a configuration error: none of them is transient,
     * so none of them is worth a retry.
     */
    enum class artport_error_code
    {
        unknown,
        unsupported_scheme,
        mixed_schemes,
        invalid_credentials_type,
        missing_credentials,
        unsupported_authentication,
        incompatible_credentials,
        invalid_connector,
        invalid_configuration,
    };

    /// @returns The name of the error code, as used in logs.
    [[nodiscard]] auto name_of(artport_error_code ec) noexcept -> std::string_view;

    class artport_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        artport_error(const std::string& msg, artport_error_code ec);
        artport_error(const char* msg, artport_error_code ec);

        [[nodiscard]] auto error_code() const noexcept -> artport_error_code;

    private:

        artport_error_code m_error_code;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = artport_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    auto make_unexpected(const char* msg, artport_error_code ec) -> tl::unexpected<artport_error>;

    auto make_unexpected(const std::string& msg, artport_error_code ec)
        -> tl::unexpected<artport_error>;

    template <class T, class E>
    auto forward_error(const tl::expected<T, E>& exp) -> tl::unexpected<E>;

    /** Returns the contained value, or throws the contained error. */
    template <class T, class E>
    auto extract(tl::expected<T, E>& exp) -> T&;

    template <class T, class E>
    auto extract(const tl::expected<T, E>& exp) -> const T&;

    template <class T, class E>
    auto extract(tl::expected<T, E>&& exp) -> T&&;

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    auto forward_error(const tl::expected<T, E>& exp) -> tl::unexpected<E>
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    auto extract(tl::expected<T, E>& exp) -> T&
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    auto extract(const tl::expected<T, E>& exp) -> const T&
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    auto extract(tl::expected<T, E>&& exp) -> T&&
    {
        return detail::extract_impl(std::move(exp));
    }
}

#endif
