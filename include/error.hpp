#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <boost/outcome/std_result.hpp>
#include <boost/outcome/utils.hpp>

// Outcome ships with Boost; keep the short namespace alias used across the code base
namespace outcome_v2 = BOOST_OUTCOME_V2_NAMESPACE;

namespace probset
{

    enum class errc
    {
        GENERIC_ERROR = 0,
        INVALID_CONFIGURATION, // rejected by a `make` factory or a merge, nothing was built or changed
        FILTER_FULL,           // insert into a filter holding `capacity()` entries
        KEY_NOT_FOUND,         // remove of a fingerprint that is not stored
    };

    constexpr std::string_view to_string(errc code)
    {
        switch(code)
        {
        case errc::INVALID_CONFIGURATION:
            return "INVALID_CONFIGURATION";
        case errc::FILTER_FULL:
            return "FILTER_FULL";
        case errc::KEY_NOT_FOUND:
            return "KEY_NOT_FOUND";
        case errc::GENERIC_ERROR:
            break;
        }

        return "GENERIC_ERROR";
    }

    class error
    {
        std::string _error_msg{"Unknown error"};
        errc _error_code{errc::GENERIC_ERROR};

    public:
        error() = default;
        explicit error(std::string msg, errc error_code = errc::GENERIC_ERROR) : _error_msg(std::move(msg)), _error_code(error_code) {}

        [[nodiscard]] const std::string& to_string() const { return this->_error_msg; }
        [[nodiscard]] errc code() const { return this->_error_code; }
    };

    inline std::ostream& operator<<(std::ostream& os, const error& err)
    {
        return os << probset::to_string(err.code()) << ": " << err.to_string();
    }

    // Outcome hooks, found by ADL
    inline std::error_code make_error_code(const error& err) { return {static_cast<int32_t>(err.code()), std::generic_category()}; }

    inline void outcome_throw_as_system_error_with_payload(error err)
    {
        outcome_v2::try_throw_std_exception_from_error(std::error_code(0, std::generic_category()));

        throw std::runtime_error(std::string(probset::to_string(err.code())) + ": " + err.to_string());
    }

    template <typename T>
    using expected = outcome_v2::std_result<T, error>;

    // Result of an operation with nothing to return
    struct status
    {
        using error_t = std::variant<std::monostate, probset::error>;

        error_t err = std::monostate{};

        status() = default;
        status(probset::error err_) : err(std::move(err_)) {}

        inline operator bool() const
        {
            return std::holds_alternative<std::monostate>(this->err);
        }

        [[nodiscard]] inline const probset::error& error() const
        {
            if(!*this)
                return std::get<probset::error>(this->err);

            throw std::logic_error("status holds no error, check it before calling error()");
        }
    };

    inline probset::status ok()
    {
        return status{};
    }

} // namespace probset
