#pragma once
// Process-wide VS1053 instance behind a FreeRTOS mutex.
// The HTTP handlers and the main loop call these; each call holds the mutex
// for the whole driver operation.

#include "decoder_port.h"
#include "vs1053.h"

#include "esp_err.h"

#include <cstddef>
#include <cstdint>
#include <memory>

// Bring the chip up (reset, self-tests, MP3 mode) and apply the volume.
// Returns the advisory RADIO_ERR_SELF_TEST_FAILED / RADIO_ERR_CHIP_ABSENT when
// bring-up degraded; the service stays usable either way.
esp_err_t decoder_service_start(std::unique_ptr<DecoderPort> port, uint8_t volume);
// Releases the instance (tests, shutdown).
void decoder_service_stop();

esp_err_t decoder_set_volume(uint8_t volume);
uint8_t decoder_get_volume();
esp_err_t decoder_play(const uint8_t* data, size_t len);
esp_err_t decoder_stop();
DecoderState decoder_state();
