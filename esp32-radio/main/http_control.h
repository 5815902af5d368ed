#pragma once
// HTTP control surface (esp_http_server).
//   GET  /                 greeting
//   GET  /radio            control page
//   POST /post-radio-form  select FM or web station
//   POST /volume           set decoder volume

#include "last_config.h"

#include "esp_err.h"

// initial: the configuration restored at boot; updated and persisted by the handlers.
esp_err_t http_control_start(const LastConfig& initial);
