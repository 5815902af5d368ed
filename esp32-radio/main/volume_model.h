#pragma once
// Volume/balance → VS1053 SCI_VOL mapping.
// User volume 0..100 (100 = loudest), balance -100..100. The chip wants
// attenuation per channel in 0.5 dB steps, 0x00 loudest, 0xFE quietest.

#include <cstdint>

constexpr uint8_t VOLUME_MAX      = 100;
constexpr int8_t  BALANCE_LIMIT   = 100;
constexpr uint8_t ATTENUATION_MAX = 0xFE;

struct VolumeBytes {
    uint8_t left;
    uint8_t right;
};

uint8_t clamp_volume(int volume);
int8_t  clamp_balance(int balance);

// Negative balance boosts the right channel, positive cuts the left one.
VolumeBytes volume_model(uint8_t volume, int8_t balance);

inline uint16_t volume_register_value(VolumeBytes b)
{
    return static_cast<uint16_t>((b.left << 8) | b.right);
}
