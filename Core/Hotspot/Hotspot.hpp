#pragma once

// Hotspot.hpp - экспортируемый C ABI для UI (панельный апплет, страница настроек).
// Хэндл непрозрачный, глобального состояния нет. JSON - UTF-8, строки с нулём на конце.

#include <cstdint>

#define EXPORT extern "C" __attribute__((visibility("default")))

// Вызывается на управляющем потоке ядра; строка валидна только внутри вызова.
typedef void (*HotspotEventFn)(const char *event_json, void *user);

// params_json может быть nullptr или "{}". nullptr при ошибке.
EXPORT void *Hotspot_Create(const char *params_json);
EXPORT void  Hotspot_Destroy(void *handle);

// Возвращают ErrorCode (0 - Ok). Подробности - Hotspot_LastResult.
EXPORT int32_t Hotspot_Activate(void *handle, const char *config_json);
EXPORT int32_t Hotspot_Deactivate(void *handle);
EXPORT int32_t Hotspot_Reset(void *handle);

// HotspotState: 0 idle, 1 starting, 2 active, 3 stopping, 4 failed; -1 - плохой хэндл
EXPORT int32_t Hotspot_State(void *handle);

// Копирует JSON в buf (обрезая по size). Возвращает нужный размер с нулём; -1 - плохой хэндл.
EXPORT int32_t Hotspot_Snapshot(void *handle, char *buf, int32_t size);
EXPORT int32_t Hotspot_LastResult(void *handle, char *buf, int32_t size);

// id подписки (> 0) или -1
EXPORT int32_t Hotspot_Subscribe(void *handle, HotspotEventFn fn, void *user);
EXPORT int32_t Hotspot_Unsubscribe(void *handle, int32_t id);
