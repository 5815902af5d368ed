#include "volume_model.h"

uint8_t clamp_volume(int volume)
{
    if (volume < 0) return 0;
    if (volume > VOLUME_MAX) return VOLUME_MAX;
    return static_cast<uint8_t>(volume);
}

int8_t clamp_balance(int balance)
{
    if (balance < -BALANCE_LIMIT) return -BALANCE_LIMIT;
    if (balance > BALANCE_LIMIT) return BALANCE_LIMIT;
    return static_cast<int8_t>(balance);
}

// 0..100 → 0xFE..0x00, rounded to nearest
static uint8_t to_attenuation(int level)
{
    int in = clamp_volume(level);
    return static_cast<uint8_t>(((VOLUME_MAX - in) * ATTENUATION_MAX + VOLUME_MAX / 2) / VOLUME_MAX);
}

VolumeBytes volume_model(uint8_t volume, int8_t balance)
{
    int v = clamp_volume(volume);
    int b = clamp_balance(balance);
    int left = v;
    int right = v;

    if (b < 0) {
        right = v - b;  // saturates at 100 in to_attenuation
    } else if (b > 0) {
        left = v - b;   // saturates at 0
    }
    return { .left = to_attenuation(left), .right = to_attenuation(right) };
}
