#pragma once
// TEA5767 FM tuner: write-frame encoding.
// The chip takes a single 5-byte write; there are no addressable registers.

#include "esp_err.h"

#include <cstddef>
#include <cstdint>

constexpr uint8_t TEA5767_ADDR       = 0x60;
constexpr size_t  TEA5767_FRAME_LEN  = 5;
constexpr float   TEA5767_MIN_MHZ    = 87.5f;  // EU/US band limits
constexpr float   TEA5767_MAX_MHZ    = 108.0f;

struct Tea5767Frame {
    uint8_t bytes[TEA5767_FRAME_LEN];
};

// PLL word for high-side injection with the 32.768 kHz crystal.
uint16_t tea5767_pll(float mhz);

// ESP_ERR_INVALID_ARG when mhz is outside the band.
esp_err_t tea5767_encode(float mhz, bool mute, Tea5767Frame* out);
