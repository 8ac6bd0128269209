#pragma once

// Config.hpp - доступ к полям JSON-конфига (Boost.JSON) с проверкой типов.

#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace Config
{
    // Разобрать текст в JSON-объект; корень обязан быть объектом.
    boost::json::object ParseObject(const std::string &text);

    // Обязательные поля: бросают std::runtime_error при отсутствии или неверном типе.
    std::string RequireString(const boost::json::object &o, std::string_view key);
    int         RequireInt(const boost::json::object &o, std::string_view key);
    bool        RequireBool(const boost::json::object &o, std::string_view key);

    // Необязательные: отсутствие или null даёт def, неверный тип бросает.
    std::string OptionalString(const boost::json::object &o, std::string_view key, const std::string &def);
    int         OptionalInt(const boost::json::object &o, std::string_view key, int def);
    bool        OptionalBool(const boost::json::object &o, std::string_view key, bool def);
}
