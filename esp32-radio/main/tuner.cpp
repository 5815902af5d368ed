#include "tuner.h"
#include "pin_map.h"
#include "tea5767.h"

#include "driver/i2c_master.h"
#include "esp_check.h"
#include "esp_log.h"

static const char* TAG = "tuner";

static constexpr uint32_t I2C_SPEED_HZ  = 400'000;
static constexpr int      I2C_TIMEOUT_MS = 50;

static i2c_master_bus_handle_t s_bus = nullptr;
static i2c_master_dev_handle_t s_dev = nullptr;
static float s_mhz = 0.0f;
static bool  s_muted = false;

static esp_err_t send_frame(float mhz, bool mute)
{
    ESP_RETURN_ON_FALSE(s_dev != nullptr, ESP_ERR_INVALID_STATE, TAG, "tuner not initialized");
    Tea5767Frame frame;
    ESP_RETURN_ON_ERROR(tea5767_encode(mhz, mute, &frame), TAG, "%.1f MHz out of band", mhz);
    ESP_RETURN_ON_ERROR(i2c_master_transmit(s_dev, frame.bytes, TEA5767_FRAME_LEN, I2C_TIMEOUT_MS),
                        TAG, "frame write failed");
    s_mhz = mhz;
    s_muted = mute;
    return ESP_OK;
}

esp_err_t tuner_init(float mhz)
{
    i2c_master_bus_config_t bus_cfg = {};
    bus_cfg.i2c_port = I2C_NUM_0;
    bus_cfg.sda_io_num = PIN_TUNER_SDA;
    bus_cfg.scl_io_num = PIN_TUNER_SCL;
    bus_cfg.clk_source = I2C_CLK_SRC_DEFAULT;
    bus_cfg.glitch_ignore_cnt = 7;
    bus_cfg.flags.enable_internal_pullup = true;
    ESP_RETURN_ON_ERROR(i2c_new_master_bus(&bus_cfg, &s_bus), TAG, "i2c_new_master_bus failed");

    i2c_device_config_t dev_cfg = {};
    dev_cfg.dev_addr_length = I2C_ADDR_BIT_LEN_7;
    dev_cfg.device_address = TEA5767_ADDR;
    dev_cfg.scl_speed_hz = I2C_SPEED_HZ;
    ESP_RETURN_ON_ERROR(i2c_master_bus_add_device(s_bus, &dev_cfg, &s_dev), TAG,
                        "i2c_master_bus_add_device failed");

    ESP_RETURN_ON_ERROR(send_frame(mhz, false), TAG, "initial tune failed");
    ESP_LOGI(TAG, "TEA5767 tuned to %.1f MHz (SDA=%d SCL=%d)", mhz, PIN_TUNER_SDA, PIN_TUNER_SCL);
    return ESP_OK;
}

esp_err_t tuner_set_frequency(float mhz)
{
    ESP_RETURN_ON_ERROR(send_frame(mhz, s_muted), TAG, "tune to %.1f MHz failed", mhz);
    ESP_LOGI(TAG, "tuned to %.1f MHz", mhz);
    return ESP_OK;
}

esp_err_t tuner_mute(bool mute)
{
    return send_frame(s_mhz, mute);
}

float tuner_frequency()
{
    return s_mhz;
}
