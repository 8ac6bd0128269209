#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file Types.hpp
 * @brief Модель данных ядра хотспота: интерфейсы, роли, конфиг, сессия.
 */

/**
 * @brief Состояние линка/подключения интерфейса по данным NetworkManager.
 */
enum class LinkState
{
    Down,
    Connecting,
    Connected,
    ApActive,
};

/**
 * @brief Снимок сетевого интерфейса; пересобирается при каждом сканировании.
 */
struct NetworkInterface
{
    std::string name;                     ///< Имя интерфейса ядра.
    bool        wifi          = false;    ///< WiFi-capable.
    LinkState   state         = LinkState::Down;
    bool        default_route = false;    ///< Через него идёт маршрут по умолчанию.
};

/**
 * @brief Назначенные роли. uplink != hotspot, оба WiFi.
 */
struct InterfaceRoles
{
    NetworkInterface uplink;
    NetworkInterface hotspot;
};

/**
 * @brief Подсказки пользователя для выбора ролей (пустое имя = авто).
 */
struct RoleHints
{
    std::string uplink;
    std::string hotspot;
    bool        force_uplink = false; ///< Разрешить uplink без маршрута по умолчанию.
};

enum class Band
{
    Bg, ///< 2.4 GHz
    A,  ///< 5 GHz
};

/**
 * @brief Параметры точки доступа. Неизменяемы в пределах сессии.
 */
struct HotspotConfig
{
    std::string ssid            = "HotspotForge";
    std::string passphrase      = "changeme123";
    Band        band            = Band::Bg;
    int         channel         = 0;           ///< 0 = авто.
    bool        nat_enabled     = true;
    std::string connection_name = "HotspotForge";
    std::string gateway_cidr    = "192.168.44.1/24";
    RoleHints   hints;
};

/**
 * @brief Проверить конфиг. Бросает HotspotError(InvalidConfig) с именем поля в step.
 */
void ValidateConfig(const HotspotConfig &config);

enum class HotspotState
{
    Idle,
    Starting,
    Active,
    Stopping,
    Failed,
};

/**
 * @brief Состояние NAT в рамках сессии.
 */
enum class NatStatus
{
    Disabled,    ///< nat_enabled = false
    Pending,     ///< запрос к помощнику в полёте
    Installed,
    Unavailable, ///< помощник недоступен: деградация, хотспот работает
    Failed,      ///< помощник отработал с ошибкой
    Removed,
};

/**
 * @brief Пара интерфейсов, от которой выводится набор NAT-правил.
 */
struct NatRuleSet
{
    std::string hotspot_if;
    std::string uplink_if;

    static NatRuleSet From(const InterfaceRoles &roles);

    bool operator==(const NatRuleSet &other) const = default;
};

/**
 * @brief Сессия хотспота. Единственный владелец - контроллер; наружу отдаётся копия.
 */
struct HotspotSession
{
    std::uint64_t                         id = 0;
    HotspotConfig                         config;
    InterfaceRoles                        roles;
    HotspotState                          state = HotspotState::Idle;
    std::chrono::system_clock::time_point started_at{};
    NatStatus                             nat   = NatStatus::Disabled;
    std::string                           failure;   ///< Причина Failed.
    std::vector<std::string>              clients;   ///< IPv4-соседи на hotspot-интерфейсе.
};

enum class DriftKind
{
    InterfaceLost,
    AccessPointDown,
    NatMismatch,
};

/**
 * @brief Расхождение живого состояния с сессией.
 */
struct DriftReport
{
    DriftKind                 kind = DriftKind::InterfaceLost;
    std::string               ifname;
    std::string               detail;
    std::optional<NatRuleSet> installed; ///< Чужая пара, если NAT стоит не для нас.
};

const char *ToString(LinkState state);
const char *ToString(HotspotState state);
const char *ToString(NatStatus status);
const char *ToString(Band band);
const char *ToString(DriftKind kind);

std::optional<Band> ParseBand(const std::string &text);
