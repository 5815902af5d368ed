#pragma once
// GPIO assignments for ESP32-C3 DevKitM radio board
// All pin choices in one place. Adjust to match your PCB/wiring.

#include "driver/gpio.h"

// ---- VS1053 decoder (SPI2_HOST, software chip selects) ----
constexpr gpio_num_t PIN_VS_SCLK     = GPIO_NUM_4;
constexpr gpio_num_t PIN_VS_MISO     = GPIO_NUM_5;
constexpr gpio_num_t PIN_VS_MOSI     = GPIO_NUM_1;
constexpr gpio_num_t PIN_VS_XCS      = GPIO_NUM_10;  // command select (active LOW)
constexpr gpio_num_t PIN_VS_XDCS     = GPIO_NUM_2;   // data select (active LOW)
constexpr gpio_num_t PIN_VS_DREQ     = GPIO_NUM_3;   // input: HIGH = 32+ bytes of FIFO space

// ---- FM tuner (TEA5767), I²C bus 0 ----
constexpr gpio_num_t PIN_TUNER_SDA   = GPIO_NUM_6;
constexpr gpio_num_t PIN_TUNER_SCL   = GPIO_NUM_7;

// ---- WS2812B status LED ----
constexpr gpio_num_t PIN_LED_DATA    = GPIO_NUM_8;
