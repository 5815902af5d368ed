#include "radio_form.h"

#include "cJSON.h"

#include <cstring>

namespace {

// Frees the parsed tree on scope exit.
class JsonDoc {
public:
    JsonDoc(const char* body, size_t len) : root_(cJSON_ParseWithLength(body, len)) {}
    ~JsonDoc() { cJSON_Delete(root_); }
    JsonDoc(const JsonDoc&) = delete;
    JsonDoc& operator=(const JsonDoc&) = delete;

    const cJSON* root() const { return root_; }

private:
    cJSON* root_;
};

} // namespace

esp_err_t radio_form_parse(const char* body, size_t len, RadioForm* out)
{
    if (body == nullptr || len == 0) {
        return ESP_ERR_INVALID_ARG;
    }
    JsonDoc doc(body, len);
    if (!cJSON_IsObject(doc.root())) {
        return ESP_ERR_INVALID_ARG;
    }

    const cJSON* station = cJSON_GetObjectItemCaseSensitive(doc.root(), "station");
    const cJSON* webradio = cJSON_GetObjectItemCaseSensitive(doc.root(), "is_webradio");
    if (!cJSON_IsString(station) || !cJSON_IsBool(webradio)) {
        return ESP_ERR_INVALID_ARG;
    }
    size_t id_len = strlen(station->valuestring);
    if (id_len >= sizeof(out->station)) {
        return ESP_ERR_INVALID_ARG;
    }

    memcpy(out->station, station->valuestring, id_len + 1);
    out->is_webradio = cJSON_IsTrue(webradio);
    return ESP_OK;
}

esp_err_t volume_form_parse(const char* body, size_t len, uint8_t* volume)
{
    if (body == nullptr || len == 0) {
        return ESP_ERR_INVALID_ARG;
    }
    JsonDoc doc(body, len);
    const cJSON* v = cJSON_GetObjectItemCaseSensitive(doc.root(), "volume");
    if (!cJSON_IsNumber(v)) {
        return ESP_ERR_INVALID_ARG;
    }
    double d = cJSON_GetNumberValue(v);
    if (d < 0 || d > 100) {
        return ESP_ERR_INVALID_ARG;
    }
    *volume = static_cast<uint8_t>(d);
    return ESP_OK;
}
