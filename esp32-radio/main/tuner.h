#pragma once
// FM tuner (TEA5767) on I²C bus 0, 400 kHz.

#include "esp_err.h"

esp_err_t tuner_init(float mhz);
// ESP_ERR_INVALID_ARG outside 87.5–108.0 MHz.
esp_err_t tuner_set_frequency(float mhz);
esp_err_t tuner_mute(bool mute);
float tuner_frequency();
