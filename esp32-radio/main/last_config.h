#pragma once
// Last listened configuration, persisted in NVS (namespace "radio").
// Loaded once at boot and re-saved after every station or volume change.

#include "esp_err.h"

#include <cstdint>

enum class RadioSource : uint8_t {
    FM       = 0,
    WEBRADIO = 1,
};

constexpr int STATION_ID_MAX = 32;  // including terminator

struct LastConfig {
    RadioSource source;
    char        station[STATION_ID_MAX];
    uint8_t     volume;
};

const char* radio_source_name(RadioSource s);
// false for anything but "fm" / "webradio".
bool radio_source_parse(const char* name, RadioSource* out);

// Defaults from g_cfg (fm / france_info / 50).
LastConfig last_config_defaults();

// On any failure *out holds the defaults and the error is returned (and logged).
esp_err_t last_config_load(LastConfig* out);
esp_err_t last_config_save(const LastConfig& cfg);
