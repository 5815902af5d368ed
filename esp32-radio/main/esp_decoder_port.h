#pragma once
// ESP-IDF implementation of DecoderPort.
// XCS/XDCS are plain GPIO outputs (software chip selects) so one SPI host can
// carry two device configurations: slow for bring-up, fast after CLOCKF.

#include "decoder_port.h"

#include "driver/gpio.h"
#include "driver/spi_master.h"

struct EspDecoderPortPins {
    spi_host_device_t host;
    gpio_num_t sclk;
    gpio_num_t miso;
    gpio_num_t mosi;
    gpio_num_t xcs;
    gpio_num_t xdcs;
    gpio_num_t dreq;
};

class EspDecoderPort : public DecoderPort {
public:
    EspDecoderPort(const EspDecoderPortPins& pins, uint32_t slow_hz, uint32_t fast_hz);
    ~EspDecoderPort() override;

    // Configure GPIO and SPI. Must succeed before the driver is used.
    esp_err_t init();

    esp_err_t set_line(DecoderLine line, bool high) override;
    esp_err_t get_data_ready(bool* ready) override;
    esp_err_t transfer(BusSpeed speed, const uint8_t* tx, size_t tx_len,
                       uint8_t* rx, size_t rx_len) override;
    void delay_ms(uint32_t ms) override;

private:
    EspDecoderPortPins pins_;
    uint32_t slow_hz_;
    uint32_t fast_hz_;
    bool bus_ready_ = false;
    spi_device_handle_t slow_dev_ = nullptr;
    spi_device_handle_t fast_dev_ = nullptr;
};
