#include "last_config.h"
#include "config.h"

#include "esp_check.h"
#include "esp_log.h"
#include "nvs.h"

#include <cstring>

static const char* TAG = "store";

static constexpr const char* NVS_NAMESPACE = "radio";
static constexpr const char* KEY_SOURCE    = "source";
static constexpr const char* KEY_STATION   = "station";
static constexpr const char* KEY_VOLUME    = "volume";

const char* radio_source_name(RadioSource s)
{
    return s == RadioSource::WEBRADIO ? "webradio" : "fm";
}

bool radio_source_parse(const char* name, RadioSource* out)
{
    if (name == nullptr) {
        return false;
    }
    if (strcmp(name, "fm") == 0) {
        *out = RadioSource::FM;
        return true;
    }
    if (strcmp(name, "webradio") == 0) {
        *out = RadioSource::WEBRADIO;
        return true;
    }
    return false;
}

LastConfig last_config_defaults()
{
    LastConfig c = {};
    if (!radio_source_parse(g_cfg.default_source, &c.source)) {
        c.source = RadioSource::FM;
    }
    strlcpy(c.station, g_cfg.default_station, sizeof(c.station));
    c.volume = g_cfg.default_volume;
    return c;
}

static esp_err_t load_from(nvs_handle_t h, LastConfig* c)
{
    char source[16] = {};
    size_t len = sizeof(source);
    ESP_RETURN_ON_ERROR(nvs_get_str(h, KEY_SOURCE, source, &len), TAG, "read %s", KEY_SOURCE);
    ESP_RETURN_ON_FALSE(radio_source_parse(source, &c->source), ESP_ERR_INVALID_STATE, TAG,
                        "bad stored source '%s'", source);

    len = sizeof(c->station);
    ESP_RETURN_ON_ERROR(nvs_get_str(h, KEY_STATION, c->station, &len), TAG, "read %s", KEY_STATION);
    ESP_RETURN_ON_ERROR(nvs_get_u8(h, KEY_VOLUME, &c->volume), TAG, "read %s", KEY_VOLUME);
    return ESP_OK;
}

esp_err_t last_config_load(LastConfig* out)
{
    *out = last_config_defaults();

    nvs_handle_t h;
    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &h);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "no saved config (%s), using defaults", esp_err_to_name(err));
        return err;
    }

    LastConfig loaded = *out;
    err = load_from(h, &loaded);
    nvs_close(h);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "saved config unusable (%s), using defaults", esp_err_to_name(err));
        return err;
    }

    *out = loaded;
    ESP_LOGI(TAG, "loaded: %s/%s vol=%u", radio_source_name(out->source), out->station, out->volume);
    return ESP_OK;
}

esp_err_t last_config_save(const LastConfig& cfg)
{
    nvs_handle_t h;
    ESP_RETURN_ON_ERROR(nvs_open(NVS_NAMESPACE, NVS_READWRITE, &h), TAG, "nvs_open failed");

    esp_err_t err = nvs_set_str(h, KEY_SOURCE, radio_source_name(cfg.source));
    if (err == ESP_OK) {
        err = nvs_set_str(h, KEY_STATION, cfg.station);
    }
    if (err == ESP_OK) {
        err = nvs_set_u8(h, KEY_VOLUME, cfg.volume);
    }
    if (err == ESP_OK) {
        err = nvs_commit(h);
    }
    nvs_close(h);

    if (err != ESP_OK) {
        ESP_LOGW(TAG, "save failed: %s", esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "saved: %s/%s vol=%u", radio_source_name(cfg.source), cfg.station, cfg.volume);
    return ESP_OK;
}
