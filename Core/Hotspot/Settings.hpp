#pragma once

#include "HotspotController.hpp"
#include "NatCoordinator.hpp"
#include "NatHelperRunner.hpp"
#include "NmPlatform.hpp"
#include "StatusReconciler.hpp"
#include "Types.hpp"
#include "Core/Logger.hpp"

#include <string>

#include <boost/json.hpp>

/**
 * @file Settings.hpp
 * @brief JSON-представления: конфиг хотспота, параметры ядра, снимок сессии, события.
 */

/**
 * @brief Все параметры ядра одной структурой (C ABI принимает их JSON-ом).
 */
struct HotspotParams
{
    HotspotController::Params  controller;
    NatCoordinator::Params     nat;
    StatusReconciler::Params   reconciler;
    PkexecHelperRunner::Params helper;
    NmPlatform::Params         platform;
    Logger::Options            log;
};

namespace Settings
{
    /**
     * @brief Разобрать конфиг; отсутствующие поля берутся по умолчанию.
     * @throws HotspotError InvalidConfig при неверном JSON или типе поля.
     */
    HotspotConfig ParseHotspotConfig(const boost::json::object &o);
    HotspotConfig ParseHotspotConfig(const std::string &text);

    boost::json::object ToJson(const HotspotConfig &config);

    /**
     * @brief Параметры ядра.
     * @throws std::runtime_error при неверном типе поля.
     */
    HotspotParams ParseParams(const boost::json::object &o);

    // Без пароля
    boost::json::object ToJson(const HotspotSession &session);
    boost::json::object ToJson(const HotspotController::Event &event);
    boost::json::object ToJson(const Result &result);

    // $XDG_CONFIG_HOME/hotspot-forge/config.json (или ~/.config/...)
    std::string DefaultConfigPath();

    // Нет файла или он битый - конфиг по умолчанию.
    HotspotConfig LoadHotspotConfig(const std::string &path);

    // Создаёт каталоги; запись через временный файл. Бросает std::runtime_error.
    void SaveHotspotConfig(const std::string &path, const HotspotConfig &config);
}
