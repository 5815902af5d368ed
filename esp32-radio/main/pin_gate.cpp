#include "pin_gate.h"
#include "radio_err.h"

#include "esp_log.h"

static const char* TAG = "gate";

static const char* line_name(DecoderLine line)
{
    return line == DecoderLine::XCS ? "XCS" : "XDCS";
}

esp_err_t PinGate::drive(DecoderLine line, bool high)
{
    esp_err_t err = port_.set_line(line, high);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "%s -> %s failed: %s", line_name(line), high ? "HIGH" : "LOW",
                 esp_err_to_name(err));
        return RADIO_ERR_PIN_FAULT;
    }
    return ESP_OK;
}

esp_err_t PinGate::select_command()
{
    esp_err_t err = drive(DecoderLine::XDCS, true);
    if (err != ESP_OK) {
        return err;
    }
    mode_ = GateMode::IDLE;
    err = drive(DecoderLine::XCS, false);
    if (err != ESP_OK) {
        return err;
    }
    mode_ = GateMode::COMMAND;
    return ESP_OK;
}

esp_err_t PinGate::deselect_command()
{
    esp_err_t err = drive(DecoderLine::XCS, true);
    if (err != ESP_OK) {
        return err;
    }
    if (mode_ == GateMode::COMMAND) {
        mode_ = GateMode::IDLE;
    }
    return ESP_OK;
}

esp_err_t PinGate::select_data()
{
    esp_err_t err = drive(DecoderLine::XCS, true);
    if (err != ESP_OK) {
        return err;
    }
    mode_ = GateMode::IDLE;
    err = drive(DecoderLine::XDCS, false);
    if (err != ESP_OK) {
        return err;
    }
    mode_ = GateMode::DATA;
    return ESP_OK;
}

esp_err_t PinGate::deselect_data()
{
    esp_err_t err = drive(DecoderLine::XDCS, true);
    if (err != ESP_OK) {
        return err;
    }
    if (mode_ == GateMode::DATA) {
        mode_ = GateMode::IDLE;
    }
    return ESP_OK;
}

esp_err_t PinGate::drive_both(bool high)
{
    esp_err_t err = drive(DecoderLine::XCS, high);
    if (err != ESP_OK) {
        return err;
    }
    err = drive(DecoderLine::XDCS, high);
    if (err != ESP_OK) {
        return err;
    }
    mode_ = GateMode::IDLE;
    return ESP_OK;
}

// ---- ScopedSelect ----

ScopedSelect::ScopedSelect(PinGate& gate, GateMode mode)
    : gate_(gate)
    , mode_(mode)
{
    switch (mode_) {
    case GateMode::COMMAND: status_ = gate_.select_command(); break;
    case GateMode::DATA:    status_ = gate_.select_data(); break;
    default:
        status_ = ESP_ERR_INVALID_ARG;
        held_ = false;
        break;
    }
}

ScopedSelect::~ScopedSelect()
{
    if (!held_) {
        return;
    }
    esp_err_t err = release();
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "select release on unwind failed: %s", radio_err_to_name(err));
    }
}

esp_err_t ScopedSelect::release()
{
    if (!held_) {
        return ESP_OK;
    }
    held_ = false;
    return (mode_ == GateMode::COMMAND) ? gate_.deselect_command() : gate_.deselect_data();
}

// ---- Data-ready monitor ----

esp_err_t await_data_ready(DecoderPort& port, uint32_t max_polls)
{
    for (uint32_t i = 0; i < max_polls; i++) {
        bool ready = false;
        esp_err_t err = port.get_data_ready(&ready);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "DREQ read failed: %s", esp_err_to_name(err));
            return RADIO_ERR_PIN_FAULT;
        }
        if (ready) {
            return ESP_OK;
        }
        port.delay_ms(1);
    }
    ESP_LOGW(TAG, "DREQ not ready after %lu polls", static_cast<unsigned long>(max_polls));
    return RADIO_ERR_DATA_TIMEOUT;
}
