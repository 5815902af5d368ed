#include "esp_decoder_port.h"

#include "esp_check.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <cstring>

static const char* TAG = "port";

// Largest exchange that fits in the transaction's inline tx/rx words.
static constexpr size_t INLINE_MAX = 4;

EspDecoderPort::EspDecoderPort(const EspDecoderPortPins& pins, uint32_t slow_hz, uint32_t fast_hz)
    : pins_(pins)
    , slow_hz_(slow_hz)
    , fast_hz_(fast_hz)
{
}

EspDecoderPort::~EspDecoderPort()
{
    if (slow_dev_) {
        spi_bus_remove_device(slow_dev_);
    }
    if (fast_dev_) {
        spi_bus_remove_device(fast_dev_);
    }
    if (bus_ready_) {
        spi_bus_free(pins_.host);
    }
}

static esp_err_t add_device(spi_host_device_t host, uint32_t hz, spi_device_handle_t* out)
{
    spi_device_interface_config_t dev = {};
    dev.mode = 0;
    dev.clock_speed_hz = static_cast<int>(hz);
    dev.spics_io_num = -1;  // XCS/XDCS are driven by hand
    dev.queue_size = 1;
    return spi_bus_add_device(host, &dev, out);
}

esp_err_t EspDecoderPort::init()
{
    // Select lines: outputs, released (HIGH)
    gpio_config_t out_cfg = {};
    out_cfg.pin_bit_mask = (1ULL << pins_.xcs) | (1ULL << pins_.xdcs);
    out_cfg.mode = GPIO_MODE_OUTPUT;
    out_cfg.pull_up_en = GPIO_PULLUP_DISABLE;
    out_cfg.pull_down_en = GPIO_PULLDOWN_DISABLE;
    out_cfg.intr_type = GPIO_INTR_DISABLE;
    ESP_RETURN_ON_ERROR(gpio_config(&out_cfg), TAG, "select pins config failed");
    ESP_RETURN_ON_ERROR(gpio_set_level(pins_.xcs, 1), TAG, "XCS release failed");
    ESP_RETURN_ON_ERROR(gpio_set_level(pins_.xdcs, 1), TAG, "XDCS release failed");

    // DREQ: input, pulled down so a missing chip reads not-ready
    gpio_config_t in_cfg = {};
    in_cfg.pin_bit_mask = 1ULL << pins_.dreq;
    in_cfg.mode = GPIO_MODE_INPUT;
    in_cfg.pull_up_en = GPIO_PULLUP_DISABLE;
    in_cfg.pull_down_en = GPIO_PULLDOWN_ENABLE;
    in_cfg.intr_type = GPIO_INTR_DISABLE;
    ESP_RETURN_ON_ERROR(gpio_config(&in_cfg), TAG, "DREQ pin config failed");

    spi_bus_config_t bus = {};
    bus.mosi_io_num = pins_.mosi;
    bus.miso_io_num = pins_.miso;
    bus.sclk_io_num = pins_.sclk;
    bus.quadwp_io_num = -1;
    bus.quadhd_io_num = -1;
    bus.max_transfer_sz = 64;
    ESP_RETURN_ON_ERROR(spi_bus_initialize(pins_.host, &bus, SPI_DMA_CH_AUTO), TAG, "SPI bus init failed");
    bus_ready_ = true;

    ESP_RETURN_ON_ERROR(add_device(pins_.host, slow_hz_, &slow_dev_), TAG, "slow SPI device add failed");
    ESP_RETURN_ON_ERROR(add_device(pins_.host, fast_hz_, &fast_dev_), TAG, "fast SPI device add failed");

    ESP_LOGI(TAG, "SPI ready: SCLK=%d MOSI=%d MISO=%d, XCS=%d XDCS=%d DREQ=%d, %lu/%lu Hz",
             pins_.sclk, pins_.mosi, pins_.miso, pins_.xcs, pins_.xdcs, pins_.dreq,
             static_cast<unsigned long>(slow_hz_), static_cast<unsigned long>(fast_hz_));
    return ESP_OK;
}

esp_err_t EspDecoderPort::set_line(DecoderLine line, bool high)
{
    gpio_num_t pin = (line == DecoderLine::XCS) ? pins_.xcs : pins_.xdcs;
    return gpio_set_level(pin, high ? 1 : 0);
}

esp_err_t EspDecoderPort::get_data_ready(bool* ready)
{
    if (!bus_ready_) {
        return ESP_ERR_INVALID_STATE;
    }
    *ready = gpio_get_level(pins_.dreq) != 0;
    return ESP_OK;
}

esp_err_t EspDecoderPort::transfer(BusSpeed speed, const uint8_t* tx, size_t tx_len,
                                   uint8_t* rx, size_t rx_len)
{
    spi_device_handle_t dev = (speed == BusSpeed::FAST) ? fast_dev_ : slow_dev_;
    if (!dev) {
        return ESP_ERR_INVALID_STATE;
    }

    spi_transaction_t t = {};
    if (rx_len > 0) {
        // SCI read: full duplex, response clocked in after the command bytes
        size_t total = tx_len + rx_len;
        if (total > INLINE_MAX || rx == nullptr) {
            return ESP_ERR_INVALID_ARG;
        }
        t.flags = SPI_TRANS_USE_TXDATA | SPI_TRANS_USE_RXDATA;
        t.length = total * 8;
        t.rxlength = total * 8;
        memcpy(t.tx_data, tx, tx_len);
        esp_err_t err = spi_device_polling_transmit(dev, &t);
        if (err != ESP_OK) {
            return err;
        }
        memcpy(rx, t.rx_data + tx_len, rx_len);
        return ESP_OK;
    }

    if (tx_len == 0) {
        return ESP_OK;
    }
    t.length = tx_len * 8;
    t.tx_buffer = tx;
    return spi_device_polling_transmit(dev, &t);
}

void EspDecoderPort::delay_ms(uint32_t ms)
{
    vTaskDelay(pdMS_TO_TICKS(ms));
}
