#include "config.h"

#include "esp_log.h"

static const char* TAG = "config";

// Mutable runtime config, initialized from CFG_DEFAULTS.
RadioConfig g_cfg = CFG_DEFAULTS;

void config_log()
{
    ESP_LOGI(TAG, "spi: slow=%lu Hz fast=%lu Hz, chunk=%u, dreq polls=%u",
             static_cast<unsigned long>(g_cfg.spi_slow_hz),
             static_cast<unsigned long>(g_cfg.spi_fast_hz),
             g_cfg.chunk_size, g_cfg.dreq_max_polls);
    ESP_LOGI(TAG, "audio: volume=%u balance=%d, default %s/%s",
             g_cfg.default_volume, g_cfg.default_balance,
             g_cfg.default_source, g_cfg.default_station);
    ESP_LOGI(TAG, "net: ssid='%s' retries=%u ntp=%s",
             CONFIG_RADIO_WIFI_SSID, g_cfg.wifi_max_retries, g_cfg.ntp_server);
}
