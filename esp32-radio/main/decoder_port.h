#pragma once
// Board port for the VS1053 decoder.
// The driver only touches hardware through this interface: two active-low
// select lines, the DREQ input, one SPI bus at two clock rates, and a delay.
// EspDecoderPort implements it on ESP-IDF; host tests use a scripted fake.

#include "esp_err.h"

#include <cstddef>
#include <cstdint>

enum class DecoderLine : uint8_t {
    XCS  = 0,  // command (SCI) select
    XDCS = 1,  // data (SDI) select
};

enum class BusSpeed : uint8_t {
    SLOW = 0,  // before the clock multiplier is raised
    FAST = 1,
};

class DecoderPort {
public:
    virtual ~DecoderPort() = default;

    // Drive a select line. high = released (selects are active-low).
    virtual esp_err_t set_line(DecoderLine line, bool high) = 0;

    // Sample DREQ. ready = true when the chip can accept 32+ bytes.
    virtual esp_err_t get_data_ready(bool* ready) = 0;

    // One SPI exchange: clock out tx_len bytes, then clock in rx_len bytes
    // (rx may be nullptr when rx_len is 0).
    virtual esp_err_t transfer(BusSpeed speed, const uint8_t* tx, size_t tx_len,
                               uint8_t* rx, size_t rx_len) = 0;

    virtual void delay_ms(uint32_t ms) = 0;
};
