#include "decoder_service.h"
#include "config.h"
#include "radio_err.h"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

static const char* TAG = "decoder";

static SemaphoreHandle_t s_mutex = nullptr;
static std::unique_ptr<Vs1053> s_decoder;

namespace {

// Holds s_mutex for the enclosing scope.
class DecoderLock {
public:
    DecoderLock() { xSemaphoreTake(s_mutex, portMAX_DELAY); }
    ~DecoderLock() { xSemaphoreGive(s_mutex); }
    DecoderLock(const DecoderLock&) = delete;
    DecoderLock& operator=(const DecoderLock&) = delete;
};

} // namespace

esp_err_t decoder_service_start(std::unique_ptr<DecoderPort> port, uint8_t volume)
{
    if (!port) {
        return ESP_ERR_INVALID_ARG;
    }
    if (!s_mutex) {
        s_mutex = xSemaphoreCreateMutex();
        if (!s_mutex) {
            ESP_LOGE(TAG, "mutex alloc failed");
            return ESP_ERR_NO_MEM;
        }
    }

    DecoderLock lock;
    const Vs1053Options opts = {
        .chunk_size = g_cfg.chunk_size,
        .dreq_max_polls = g_cfg.dreq_max_polls,
        .volume = volume,
        .balance = g_cfg.default_balance,
    };
    s_decoder = std::make_unique<Vs1053>(std::move(port), opts);

    esp_err_t advisory = s_decoder->begin();
    if (advisory == RADIO_ERR_CHIP_ABSENT) {
        ESP_LOGW(TAG, "no VS1053 detected, audio disabled");
        return advisory;
    }
    if (advisory != ESP_OK && advisory != RADIO_ERR_SELF_TEST_FAILED) {
        ESP_LOGE(TAG, "bring-up failed: %s", radio_err_to_name(advisory));
        return advisory;
    }

    esp_err_t err = s_decoder->switch_to_mp3_mode();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "MP3 mode switch failed: %s", radio_err_to_name(err));
        return err;
    }
    err = s_decoder->set_volume(volume);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "initial volume failed: %s", radio_err_to_name(err));
        return err;
    }

    ESP_LOGI(TAG, "decoder %s, volume %u", decoder_state_name(s_decoder->state()), volume);
    return advisory;
}

void decoder_service_stop()
{
    if (!s_mutex) {
        return;
    }
    {
        DecoderLock lock;
        s_decoder.reset();
    }
    vSemaphoreDelete(s_mutex);
    s_mutex = nullptr;
}

esp_err_t decoder_set_volume(uint8_t volume)
{
    if (!s_mutex) return ESP_ERR_INVALID_STATE;
    DecoderLock lock;
    if (!s_decoder) return ESP_ERR_INVALID_STATE;
    return s_decoder->set_volume(volume);
}

uint8_t decoder_get_volume()
{
    if (!s_mutex) return 0;
    DecoderLock lock;
    return s_decoder ? s_decoder->get_volume() : 0;
}

esp_err_t decoder_play(const uint8_t* data, size_t len)
{
    if (!s_mutex) return ESP_ERR_INVALID_STATE;
    DecoderLock lock;
    if (!s_decoder) return ESP_ERR_INVALID_STATE;
    return s_decoder->play_chunk(data, len);
}

esp_err_t decoder_stop()
{
    if (!s_mutex) return ESP_ERR_INVALID_STATE;
    DecoderLock lock;
    if (!s_decoder) return ESP_ERR_INVALID_STATE;
    return s_decoder->stop_song();
}

DecoderState decoder_state()
{
    if (!s_mutex) return DecoderState::POWERED_OFF;
    DecoderLock lock;
    return s_decoder ? s_decoder->state() : DecoderState::POWERED_OFF;
}
