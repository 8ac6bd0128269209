#include "Config.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace
{
    const boost::json::value *Find(const boost::json::object &o, std::string_view key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (v == nullptr || v->is_null())
        {
            return nullptr;
        }
        return v;
    }

    [[noreturn]] void TypeError(std::string_view key, const char *expected)
    {
        throw std::runtime_error("config: field '" + std::string(key) + "' must be " + expected);
    }

    int ToInt(const boost::json::value &v, std::string_view key)
    {
        std::int64_t n = 0;
        if (v.is_int64())
        {
            n = v.as_int64();
        }
        else if (v.is_uint64() && v.as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
        {
            n = static_cast<std::int64_t>(v.as_uint64());
        }
        else
        {
            TypeError(key, "an integer");
        }

        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
        {
            TypeError(key, "a 32-bit integer");
        }
        return static_cast<int>(n);
    }
}

namespace Config
{
    boost::json::object ParseObject(const std::string &text)
    {
        boost::json::error_code ec;
        boost::json::value jv = boost::json::parse(text, ec);
        if (ec)
        {
            throw std::runtime_error("config: invalid JSON: " + ec.message());
        }
        if (!jv.is_object())
        {
            throw std::runtime_error("config root must be an object");
        }
        return std::move(jv.as_object());
    }

    std::string RequireString(const boost::json::object &o, std::string_view key)
    {
        const boost::json::value *v = Find(o, key);
        if (v == nullptr)
        {
            throw std::runtime_error("config: missing field '" + std::string(key) + "'");
        }
        if (!v->is_string())
        {
            TypeError(key, "a string");
        }
        return boost::json::value_to<std::string>(*v);
    }

    int RequireInt(const boost::json::object &o, std::string_view key)
    {
        const boost::json::value *v = Find(o, key);
        if (v == nullptr)
        {
            throw std::runtime_error("config: missing field '" + std::string(key) + "'");
        }
        return ToInt(*v, key);
    }

    bool RequireBool(const boost::json::object &o, std::string_view key)
    {
        const boost::json::value *v = Find(o, key);
        if (v == nullptr)
        {
            throw std::runtime_error("config: missing field '" + std::string(key) + "'");
        }
        if (!v->is_bool())
        {
            TypeError(key, "a boolean");
        }
        return v->as_bool();
    }

    std::string OptionalString(const boost::json::object &o, std::string_view key, const std::string &def)
    {
        return Find(o, key) ? RequireString(o, key) : def;
    }

    int OptionalInt(const boost::json::object &o, std::string_view key, int def)
    {
        return Find(o, key) ? RequireInt(o, key) : def;
    }

    bool OptionalBool(const boost::json::object &o, std::string_view key, bool def)
    {
        return Find(o, key) ? RequireBool(o, key) : def;
    }
}
