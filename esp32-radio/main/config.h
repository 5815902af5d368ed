#pragma once
// Configuration for the radio firmware.
// Defaults are set at compile time and copied into g_cfg at boot.
// WiFi credentials come from the build (sdkconfig / -D flags).

#include <cstdint>

#ifndef CONFIG_RADIO_WIFI_SSID
#define CONFIG_RADIO_WIFI_SSID ""
#endif
#ifndef CONFIG_RADIO_WIFI_PSK
#define CONFIG_RADIO_WIFI_PSK ""
#endif

struct RadioConfig {
    // -- Decoder SPI --
    uint32_t spi_slow_hz;     // bring-up clock (before CLOCKF multiplier)
    uint32_t spi_fast_hz;     // steady-state clock
    uint16_t chunk_size;      // bytes per SDI write (DREQ guarantees 32)
    uint16_t dreq_max_polls;  // 1 ms per poll

    // -- Audio defaults --
    uint8_t  default_volume;  // 0..100, 100 = loudest
    int8_t   default_balance; // -100..100

    // -- Persistence defaults (first boot) --
    const char* default_source;   // "fm" | "webradio"
    const char* default_station;  // station id

    // -- Network --
    uint8_t     wifi_max_retries;
    uint16_t    http_max_payload; // POST bodies above this get 413
    const char* ntp_server;
};

constexpr RadioConfig CFG_DEFAULTS = {
    // Decoder SPI
    .spi_slow_hz = 1'000'000,
    .spi_fast_hz = 4'000'000,
    .chunk_size = 32,
    .dreq_max_polls = 2000,  // ~2 s

    // Audio
    .default_volume = 50,
    .default_balance = 0,

    // Persistence
    .default_source = "fm",
    .default_station = "france_info",

    // Network
    .wifi_max_retries = 10,
    .http_max_payload = 128,
    .ntp_server = "pool.ntp.org",
};

// Mutable runtime config (defined in config.cpp).
extern RadioConfig g_cfg;

// Log the active configuration at info level.
void config_log();
