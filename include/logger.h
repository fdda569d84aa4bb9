#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace probset
{
    constexpr bool ENABLE_LOGGING = true;

    namespace detail
    {
        template <typename... Args>
        void emit(std::string_view tag, const Args&... args)
        {
            std::ostringstream oss;
            (oss << ... << args);

            std::cout << "[" << tag << "] " << oss.str() << std::endl;
        }
    } // namespace detail

    template <typename... Args>
    void log(const Args&... args)
    {
        if constexpr(ENABLE_LOGGING)
            detail::emit("probset", args...);
    }

    template <typename... Args>
    void log_always(const Args&... args)
    {
        detail::emit("probset", args...);
    }

    // Tags every line with the owning component, e.g. "[quotient_filter] Cleared filter"
    class logger
    {
        std::string _name;

    public:
        explicit logger(std::string name) : _name(std::move(name)) {}

        template <typename... Args>
        void log(const Args&... args) const
        {
            if constexpr(ENABLE_LOGGING)
                detail::emit(this->_name, args...);
        }

        // Not affected by ENABLE_LOGGING
        template <typename... Args>
        void log_always(const Args&... args) const
        {
            detail::emit(this->_name, args...);
        }

        [[nodiscard]] const std::string& name() const
        {
            return this->_name;
        }
    };
} // namespace probset
