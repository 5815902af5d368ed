#pragma once
// WiFi station + SNTP.

#include "esp_err.h"

#include <cstddef>

// Blocks until an IP is obtained or the retry budget is spent.
// Empty SSID → ESP_ERR_INVALID_ARG; empty PSK → open network.
esp_err_t wifi_connect(const char* ssid, const char* psk);

esp_err_t time_sync_start(const char* server);
// Formats UTC "dd/mm/YYYY HH:MM:SS" into buf.
void time_format_now(char* buf, size_t len);
