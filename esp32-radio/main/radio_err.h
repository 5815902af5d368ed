#pragma once
// Error codes for the radio firmware.
// Stock ESP-IDF codes (ESP_OK, ESP_ERR_INVALID_ARG, ...) are used where they
// fit; decoder-specific faults live in their own block.

#include "esp_err.h"

#define RADIO_ERR_BASE              0x1D000
#define RADIO_ERR_PIN_FAULT         (RADIO_ERR_BASE + 1)  // a select/DREQ line could not be driven or read
#define RADIO_ERR_BUS_FAULT         (RADIO_ERR_BASE + 2)  // SPI transaction failed
#define RADIO_ERR_DATA_TIMEOUT      (RADIO_ERR_BASE + 3)  // DREQ never asserted within the poll bound
#define RADIO_ERR_SELF_TEST_FAILED  (RADIO_ERR_BASE + 4)  // VOL round-trip mismatches (advisory)
#define RADIO_ERR_CHIP_ABSENT       (RADIO_ERR_BASE + 5)  // DREQ low at self-test entry (advisory)

// Name for any esp_err_t, including the radio block.
const char* radio_err_to_name(esp_err_t err);
