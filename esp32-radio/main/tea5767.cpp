#include "tea5767.h"

// ---- Frame bits ----
// byte 1
static constexpr uint8_t B1_MUTE = 0x80;
// byte 3
static constexpr uint8_t B3_HLSI = 0x10;  // high-side LO injection
static constexpr uint8_t B3_MS   = 0x08;  // 1 = forced mono
// byte 4
static constexpr uint8_t B4_BL   = 0x20;  // 1 = Japan band
static constexpr uint8_t B4_XTAL = 0x10;  // 32.768 kHz crystal

static constexpr uint32_t IF_HZ       = 225'000;
static constexpr uint32_t XTAL_REF_HZ = 32'768;

uint16_t tea5767_pll(float mhz)
{
    // Round to the nearest kHz first so 105.5f lands on 105500 kHz.
    uint32_t f_hz = static_cast<uint32_t>(mhz * 1000.0f + 0.5f) * 1000u;
    return static_cast<uint16_t>((4u * (f_hz + IF_HZ)) / XTAL_REF_HZ);
}

esp_err_t tea5767_encode(float mhz, bool mute, Tea5767Frame* out)
{
    if (!(mhz >= TEA5767_MIN_MHZ && mhz <= TEA5767_MAX_MHZ)) {
        return ESP_ERR_INVALID_ARG;
    }
    uint16_t pll = tea5767_pll(mhz);

    out->bytes[0] = static_cast<uint8_t>((mute ? B1_MUTE : 0) | ((pll >> 8) & 0x3F));
    out->bytes[1] = static_cast<uint8_t>(pll & 0xFF);
    out->bytes[2] = B3_HLSI & ~B3_MS;  // stereo
    out->bytes[3] = B4_XTAL & ~B4_BL;  // EU/US band
    out->bytes[4] = 0x00;
    return ESP_OK;
}
