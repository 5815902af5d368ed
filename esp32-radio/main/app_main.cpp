// Network radio: app_main
// Full system: NVS restore + LED + FM tuner + WiFi/NTP + VS1053 + HTTP control.

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"
#include "nvs_flash.h"

#include "config.h"
#include "pin_map.h"
#include "decoder_service.h"
#include "esp_decoder_port.h"
#include "http_control.h"
#include "last_config.h"
#include "led.h"
#include "radio_err.h"
#include "stations.h"
#include "tuner.h"
#include "wifi.h"

#include <memory>

static const char* TAG = "radio";

static constexpr float FALLBACK_FM_MHZ = 105.5f;  // France Info

static void nvs_init()
{
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_LOGW(TAG, "NVS partition needs erase (%s)", esp_err_to_name(err));
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    ESP_ERROR_CHECK(err);
}

extern "C" void app_main()
{
    ESP_LOGI(TAG, "Radio booting...");
    config_log();

    // ---- Phase 1: persistent state + status LED ----
    nvs_init();
    LastConfig last;
    esp_err_t err = last_config_load(&last);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "starting from defaults: %s/%s", radio_source_name(last.source), last.station);
    }

    err = led_init();
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "LED init failed (%s), continuing without status LED", esp_err_to_name(err));
    }

    // ---- Phase 2: FM tuner ----
    float mhz = FALLBACK_FM_MHZ;
    if (!station_fm_frequency(last.station, &mhz) || mhz <= 0.0f) {
        mhz = FALLBACK_FM_MHZ;
    }
    ESP_ERROR_CHECK(tuner_init(mhz));

    // ---- Phase 3: network ----
    ESP_ERROR_CHECK(wifi_connect(CONFIG_RADIO_WIFI_SSID, CONFIG_RADIO_WIFI_PSK));
    err = time_sync_start(g_cfg.ntp_server);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "SNTP unavailable: %s", esp_err_to_name(err));
    }

    // ---- Phase 4: decoder ----
    const EspDecoderPortPins pins = {
        .host = SPI2_HOST,
        .sclk = PIN_VS_SCLK,
        .miso = PIN_VS_MISO,
        .mosi = PIN_VS_MOSI,
        .xcs = PIN_VS_XCS,
        .xdcs = PIN_VS_XDCS,
        .dreq = PIN_VS_DREQ,
    };
    auto port = std::make_unique<EspDecoderPort>(pins, g_cfg.spi_slow_hz, g_cfg.spi_fast_hz);
    ESP_ERROR_CHECK(port->init());

    err = decoder_service_start(std::move(port), last.volume);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "decoder degraded: %s, FM still available", radio_err_to_name(err));
    }

    // ---- Phase 5: control surface ----
    ESP_ERROR_CHECK(http_control_start(last));
    err = led_set_rgb(0, 50, 0);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "LED update failed: %s", esp_err_to_name(err));
    }

    ESP_LOGI(TAG, "Radio up.");

    char now[32];
    while (true) {
        time_format_now(now, sizeof(now));
        ESP_LOGI(TAG, "Time: %s", now);
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
