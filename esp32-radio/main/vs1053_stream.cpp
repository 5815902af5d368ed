// SDI (audio data) side of the VS1053 driver.

#include "vs1053.h"
#include "radio_err.h"

#include "esp_check.h"
#include "esp_log.h"

#include <cstring>

static const char* TAG = "vs1053";

static constexpr size_t   FILLER_CHUNK       = 32;
static constexpr size_t   FILLER_UNIT_BYTES  = 2;
static constexpr size_t   START_FILL_UNITS   = 10;
static constexpr size_t   STOP_FILL_UNITS    = 2052;
static constexpr size_t   CANCEL_FILL_UNITS  = 32;
static constexpr uint32_t CANCEL_MAX_ROUNDS  = 200;
static constexpr uint32_t CANCEL_POLL_MS     = 10;

esp_err_t Vs1053::sdi_write(const uint8_t* data, size_t len, size_t chunk_size, bool repeat)
{
    ScopedSelect sel(gate_, GateMode::DATA);
    if (sel.status() != ESP_OK) {
        return sel.status();
    }

    const uint8_t* cursor = data;
    size_t remaining = len;
    while (remaining > 0) {
        esp_err_t err = await_ready();
        if (err != ESP_OK) {
            return err;
        }
        size_t n = remaining > chunk_size ? chunk_size : remaining;
        err = port_->transfer(speed_, cursor, n, nullptr, 0);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "SDI write of %u bytes failed: %s", static_cast<unsigned>(n),
                     esp_err_to_name(err));
            return RADIO_ERR_BUS_FAULT;
        }
        remaining -= n;
        if (!repeat) {
            cursor += n;
        }
    }

    esp_err_t err = await_ready();
    if (err != ESP_OK) {
        return err;
    }
    return sel.release();
}

esp_err_t Vs1053::write_stream(const uint8_t* data, size_t len, size_t chunk_size)
{
    ESP_RETURN_ON_FALSE(chunk_size > 0, ESP_ERR_INVALID_ARG, TAG, "chunk size must be > 0");
    if (len == 0) {
        return ESP_OK;
    }
    ESP_RETURN_ON_FALSE(data != nullptr, ESP_ERR_INVALID_ARG, TAG, "null stream buffer");
    return sdi_write(data, len, chunk_size, false);
}

esp_err_t Vs1053::play_chunk(const uint8_t* data, size_t len)
{
    return write_stream(data, len, opts_.chunk_size);
}

// Pads the decoder pipeline with the chip's end-fill byte.
esp_err_t Vs1053::flush_with_fillers(size_t units)
{
    uint8_t efb = 0;
    esp_err_t err = read_end_fill_byte(&efb);
    if (err != ESP_OK) {
        return err;
    }
    end_fill_byte_ = efb;
    if (units == 0) {
        return ESP_OK;
    }

    uint8_t fill[FILLER_CHUNK];
    memset(fill, efb, sizeof(fill));
    return sdi_write(fill, units * FILLER_UNIT_BYTES, FILLER_CHUNK, true);
}

esp_err_t Vs1053::start_song()
{
    return flush_with_fillers(START_FILL_UNITS);
}

esp_err_t Vs1053::stop_song()
{
    ESP_RETURN_ON_ERROR(flush_with_fillers(STOP_FILL_UNITS), TAG, "stop: pre-cancel fill");
    port_->delay_ms(CANCEL_POLL_MS);
    ESP_RETURN_ON_ERROR(write_register(speed_, SciReg::MODE,
                                       mode_register_value({ .reset = false, .cancel = true, .line1 = false })),
                        TAG, "stop: MODE cancel write");

    for (uint32_t i = 0; i < CANCEL_MAX_ROUNDS; i++) {
        ESP_RETURN_ON_ERROR(flush_with_fillers(CANCEL_FILL_UNITS), TAG, "stop: cancel fill");
        uint16_t mode = 0;
        ESP_RETURN_ON_ERROR(read_register(SciReg::MODE, &mode), TAG, "stop: MODE read");
        if ((mode & (1u << SM_CANCEL)) == 0) {
            ESP_RETURN_ON_ERROR(flush_with_fillers(STOP_FILL_UNITS), TAG, "stop: post-cancel fill");
            ESP_LOGI(TAG, "Song stopped correctly after %lu msec",
                     static_cast<unsigned long>(i * CANCEL_POLL_MS));
            return ESP_OK;
        }
        port_->delay_ms(CANCEL_POLL_MS);
    }

    ESP_LOGW(TAG, "Song stopped incorrectly (CANCEL never cleared)");
    return dump_registers("Song stopped incorrectly!");
}
