#pragma once
// JSON bodies accepted by the HTTP control surface.
//   {"station": "<id>", "is_webradio": bool}
//   {"volume": 0..100}

#include "last_config.h"

#include "esp_err.h"

#include <cstddef>
#include <cstdint>

struct RadioForm {
    char station[STATION_ID_MAX];
    bool is_webradio;
};

// ESP_ERR_INVALID_ARG for malformed JSON, missing/mistyped fields, or an
// over-long station id.
esp_err_t radio_form_parse(const char* body, size_t len, RadioForm* out);
esp_err_t volume_form_parse(const char* body, size_t len, uint8_t* volume);
