#pragma once
// Mode gate over the VS1053 select lines.
// Command mode = XCS low, data mode = XDCS low. Entering one mode releases
// the other select first, so both are never low while bytes move.
// A line that cannot be driven yields RADIO_ERR_PIN_FAULT; the gate stays usable.

#include "decoder_port.h"

#include <cstdint>

enum class GateMode : uint8_t {
    IDLE    = 0,
    COMMAND = 1,
    DATA    = 2,
};

class PinGate {
public:
    explicit PinGate(DecoderPort& port) : port_(port) {}

    esp_err_t select_command();
    esp_err_t deselect_command();
    esp_err_t select_data();
    esp_err_t deselect_data();

    // Hardware reset only: drive both selects to the same level.
    esp_err_t drive_both(bool high);

    GateMode mode() const { return mode_; }

private:
    esp_err_t drive(DecoderLine line, bool high);

    DecoderPort& port_;
    GateMode mode_ = GateMode::IDLE;
};

// Holds one mode for the lifetime of a scope. release() ends the mode and
// reports the result; if the scope unwinds first (error path) the destructor
// releases and logs any failure.
class ScopedSelect {
public:
    ScopedSelect(PinGate& gate, GateMode mode);
    ~ScopedSelect();

    ScopedSelect(const ScopedSelect&) = delete;
    ScopedSelect& operator=(const ScopedSelect&) = delete;

    // Result of entering the mode.
    esp_err_t status() const { return status_; }

    esp_err_t release();

private:
    PinGate& gate_;
    GateMode mode_;
    esp_err_t status_;
    bool held_ = true;
};

// Poll DREQ once per millisecond, up to max_polls times.
// ESP_OK as soon as it reads ready, RADIO_ERR_DATA_TIMEOUT when the bound is
// exhausted, RADIO_ERR_PIN_FAULT if the line cannot be read.
esp_err_t await_data_ready(DecoderPort& port, uint32_t max_polls);
