#include "led.h"
#include "pin_map.h"

#include "esp_check.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "led_strip.h"

static const char* TAG = "led";
static led_strip_handle_t strip = nullptr;

static constexpr uint8_t  LED_LEVEL      = 50;
static constexpr uint32_t BLINK_OFF_MS   = 100;

esp_err_t led_init()
{
    led_strip_config_t strip_cfg = {
        .strip_gpio_num = PIN_LED_DATA,
        .max_leds = 1,
        .led_pixel_format = LED_PIXEL_FORMAT_GRB,
        .led_model = LED_MODEL_WS2812,
        .flags = { .invert_out = false },
    };

    led_strip_rmt_config_t rmt_cfg = {
        .clk_src = RMT_CLK_SRC_DEFAULT,
        .resolution_hz = 10'000'000,  // 10 MHz
        .mem_block_symbols = 64,
        .flags = { .with_dma = false },
    };

    ESP_RETURN_ON_ERROR(led_strip_new_rmt_device(&strip_cfg, &rmt_cfg, &strip), TAG, "RMT LED init failed");
    ESP_RETURN_ON_ERROR(led_set_rgb(LED_LEVEL, 0, 0), TAG, "boot colour failed");
    ESP_LOGI(TAG, "WS2812B LED initialized on GPIO %d", PIN_LED_DATA);
    return ESP_OK;
}

esp_err_t led_set_rgb(uint8_t r, uint8_t g, uint8_t b)
{
    if (!strip) return ESP_ERR_INVALID_STATE;
    ESP_RETURN_ON_ERROR(led_strip_set_pixel(strip, 0, r, g, b), TAG, "set pixel failed");
    return led_strip_refresh(strip);
}

esp_err_t led_off()
{
    if (!strip) return ESP_ERR_INVALID_STATE;
    ESP_RETURN_ON_ERROR(led_strip_clear(strip), TAG, "clear failed");
    return led_strip_refresh(strip);
}

esp_err_t led_blink_station()
{
    ESP_RETURN_ON_ERROR(led_off(), TAG, "blink off failed");
    vTaskDelay(pdMS_TO_TICKS(BLINK_OFF_MS));
    return led_set_rgb(0, LED_LEVEL, 0);
}
