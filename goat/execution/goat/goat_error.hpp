// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <goat/core/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
    #include <boost/outcome/experimental/status-code/status-code/status_error.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
    #include <boost/outcome/experimental/status-code/status_error.hpp>
#endif

#include <boost/outcome/config.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>

GOAT_NAMESPACE_BEGIN

enum class GoatTxError
{
    Success = 0,
    LengthMismatch,
    SelectorMismatch,
    UnknownModule,
    UnknownAction,
    MalformedField,
};

GOAT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<goat::GoatTxError>
    : quick_status_code_from_enum_defaults<goat::GoatTxError>
{
    static constexpr auto const domain_name = "Goat Transaction Error";
    static constexpr auto const domain_uuid =
        "8e2f4c61-7b3a-4f05-9d18-e6a0c5b2d374";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

GOAT_NAMESPACE_BEGIN

class length_mismatch_code_domain_;
using length_mismatch_code = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<
    length_mismatch_code_domain_>;

/**
 * GoatTxError::LengthMismatch together with the expected and actual payload
 * sizes. The value fits in the erased error of Result, and compares equal to
 * GoatTxError::LengthMismatch.
 */
class length_mismatch_code_domain_
    : public BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain
{
    friend length_mismatch_code;
    using base_ = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code_domain;

public:
    struct value_type
    {
        uint32_t expected{};
        uint32_t actual{};
    };

    using base_::string_ref;

    constexpr explicit length_mismatch_code_domain_(
        typename base_::unique_id_type id = 0x6c3e91d4a2b70f58) noexcept
        : base_(id)
    {
    }

    length_mismatch_code_domain_(length_mismatch_code_domain_ const &) =
        default;
    length_mismatch_code_domain_(length_mismatch_code_domain_ &&) = default;
    length_mismatch_code_domain_ &
    operator=(length_mismatch_code_domain_ const &) = default;
    length_mismatch_code_domain_ &
    operator=(length_mismatch_code_domain_ &&) = default;
    ~length_mismatch_code_domain_() = default;

    static inline constexpr length_mismatch_code_domain_ const &get();

    virtual string_ref name() const noexcept override
    {
        return string_ref("Goat Transaction Length Mismatch");
    }

#if BOOST_OUTCOME_VERSION_MAJOR > 2 ||                                         \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_MINOR > 2) ||   \
    (BOOST_OUTCOME_VERSION_MAJOR == 2 && BOOST_OUTCOME_VERSION_MINOR == 2 &&   \
     BOOST_OUTCOME_VERSION_PATCH > 2)
    virtual base_::payload_info_t payload_info() const noexcept override
    {
        return {
            sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
    }
#endif

protected:
    virtual bool _do_failure(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &)
        const noexcept override
    {
        return true;
    }

    virtual bool _do_equivalent(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code1,
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code2)
        const noexcept override
    {
        auto const &c1 = static_cast<length_mismatch_code const &>(code1);
        if (code2.domain() == *this) {
            auto const &c2 = static_cast<length_mismatch_code const &>(code2);
            return c1.value().expected == c2.value().expected &&
                   c1.value().actual == c2.value().actual;
        }
        if (code2.domain() ==
            BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
                quick_status_code_from_enum_domain<GoatTxError>) {
            auto const &c2 = static_cast<
                BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
                    quick_status_code_from_enum_code<GoatTxError> const &>(
                code2);
            return c2.value() == GoatTxError::LengthMismatch;
        }
        return false;
    }

    virtual BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::generic_code _generic_code(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &)
        const noexcept override
    {
        return BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::errc::unknown;
    }

    virtual string_ref _do_message(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &)
        const noexcept override
    {
        return string_ref("payload length mismatch");
    }

    BOOST_OUTCOME_SYSTEM_ERROR2_NORETURN virtual void _do_throw_exception(
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
        const override
    {
        auto const &c = static_cast<length_mismatch_code const &>(code);
        throw BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_error<
            length_mismatch_code_domain_>(c);
    }
};

constexpr length_mismatch_code_domain_ length_mismatch_code_domain;

inline constexpr length_mismatch_code_domain_ const &
length_mismatch_code_domain_::get()
{
    return length_mismatch_code_domain;
}

// sizes beyond uint32_t saturate
inline length_mismatch_code
make_length_mismatch(size_t const expected, size_t const actual) noexcept
{
    constexpr size_t max = std::numeric_limits<uint32_t>::max();
    return length_mismatch_code{length_mismatch_code_domain_::value_type{
        .expected = static_cast<uint32_t>(expected < max ? expected : max),
        .actual = static_cast<uint32_t>(actual < max ? actual : max)}};
}

/// Expected and actual sizes carried by a length mismatch error, if code is one
inline std::optional<length_mismatch_code_domain_::value_type>
length_mismatch_sizes(
    BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::status_code<void> const &code)
{
    if (code.domain() != length_mismatch_code_domain) {
        return std::nullopt;
    }
    return static_cast<length_mismatch_code const &>(code).value();
}

GOAT_NAMESPACE_END
