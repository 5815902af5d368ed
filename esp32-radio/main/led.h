#pragma once
// Single WS2812B RGB LED for status indication.
// Red at boot, green once the HTTP server is up, blink on station change.

#include "esp_err.h"

#include <cstdint>

esp_err_t led_init();
esp_err_t led_set_rgb(uint8_t r, uint8_t g, uint8_t b);
esp_err_t led_off();
// Off for ~100 ms, then back to green.
esp_err_t led_blink_station();
