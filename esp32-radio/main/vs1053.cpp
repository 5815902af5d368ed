#include "vs1053.h"
#include "radio_err.h"

#include "esp_check.h"
#include "esp_log.h"

#include <utility>

static const char* TAG = "vs1053";

// ---- SCI opcodes ----
static constexpr uint8_t SCI_OP_WRITE = 0x02;
static constexpr uint8_t SCI_OP_READ  = 0x03;

// ---- Reset timing (datasheet) ----
static constexpr uint32_t RESET_RELEASE_MS = 100;
static constexpr uint32_t RESET_ASSERT_MS  = 500;
static constexpr uint32_t RESET_SETTLE_MS  = 500;

// ---- Bring-up values ----
static constexpr uint16_t AUDATA_44K1_STEREO = 44101;
static constexpr uint16_t CLOCKF_MULT_3_0    = 6 << 12;  // SC_MULT = 3.0x → 12.288 MHz × 3

// ---- Self-test sweep ----
static constexpr uint32_t SWEEP_END        = 0xFFFF;
static constexpr uint32_t SWEEP_STEP_SLOW  = 300;
static constexpr uint32_t SWEEP_STEP_FAST  = 3;
static constexpr uint32_t SWEEP_MAX_BAD    = 20;
static constexpr uint32_t SWEEP_RETRY_MS   = 10;

// ---- Scratch (WRAM) addresses ----
static constexpr uint16_t WRAM_END_FILL_BYTE = 0x1E06;
static constexpr uint16_t GPIO_DDR_RW        = 0xC017;
static constexpr uint16_t GPIO_ODATA_RW      = 0xC019;

const char* decoder_state_name(DecoderState s)
{
    switch (s) {
    case DecoderState::POWERED_OFF:    return "POWERED_OFF";
    case DecoderState::RESETTING:      return "RESETTING";
    case DecoderState::AWAITING_READY: return "AWAITING_READY";
    case DecoderState::SLOW_SELF_TEST: return "SLOW_SELF_TEST";
    case DecoderState::CLOCK_BOOSTED:  return "CLOCK_BOOSTED";
    case DecoderState::FAST_SELF_TEST: return "FAST_SELF_TEST";
    case DecoderState::READY:          return "READY";
    case DecoderState::DEGRADED:       return "DEGRADED";
    }
    return "?";
}

Vs1053::Vs1053(std::unique_ptr<DecoderPort> port, const Vs1053Options& opts)
    : port_(std::move(port))
    , gate_(*port_)
    , opts_(opts)
    , volume_(clamp_volume(opts.volume))
    , balance_(clamp_balance(opts.balance))
{
}

void Vs1053::set_state(DecoderState s)
{
    if (s != state_) {
        ESP_LOGD(TAG, "state %s -> %s", decoder_state_name(state_), decoder_state_name(s));
        state_ = s;
    }
}

esp_err_t Vs1053::await_ready()
{
    return await_data_ready(*port_, opts_.dreq_max_polls);
}

// ---- Register access ----

esp_err_t Vs1053::read_register(SciReg reg, uint16_t* value)
{
    ScopedSelect sel(gate_, GateMode::COMMAND);
    if (sel.status() != ESP_OK) {
        return sel.status();
    }

    const uint8_t tx[2] = { SCI_OP_READ, static_cast<uint8_t>(reg) };
    uint8_t rx[2] = {};
    esp_err_t err = port_->transfer(speed_, tx, sizeof(tx), rx, sizeof(rx));
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "SCI read 0x%X failed: %s", static_cast<unsigned>(reg), esp_err_to_name(err));
        return RADIO_ERR_BUS_FAULT;
    }

    err = await_ready();
    if (err != ESP_OK) {
        return err;
    }
    err = sel.release();
    if (err != ESP_OK) {
        return err;
    }
    *value = static_cast<uint16_t>((rx[0] << 8) | rx[1]);
    return ESP_OK;
}

esp_err_t Vs1053::write_register(BusSpeed speed, SciReg reg, uint16_t value)
{
    esp_err_t err = await_ready();
    if (err != ESP_OK) {
        return err;
    }

    ScopedSelect sel(gate_, GateMode::COMMAND);
    if (sel.status() != ESP_OK) {
        return sel.status();
    }

    const uint8_t tx[4] = {
        SCI_OP_WRITE,
        static_cast<uint8_t>(reg),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value & 0xFF),
    };
    err = port_->transfer(speed, tx, sizeof(tx), nullptr, 0);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "SCI write 0x%X=0x%04X failed: %s", static_cast<unsigned>(reg), value,
                 esp_err_to_name(err));
        return RADIO_ERR_BUS_FAULT;
    }

    err = await_ready();
    if (err != ESP_OK) {
        return err;
    }
    return sel.release();
}

esp_err_t Vs1053::scratch_write(uint16_t address, uint16_t data)
{
    esp_err_t err = write_register(speed_, SciReg::WRAMADDR, address);
    if (err != ESP_OK) {
        return err;
    }
    return write_register(speed_, SciReg::WRAM, data);
}

esp_err_t Vs1053::scratch_read(uint16_t address, uint16_t* data)
{
    esp_err_t err = write_register(speed_, SciReg::WRAMADDR, address);
    if (err != ESP_OK) {
        return err;
    }
    return read_register(SciReg::WRAM, data);
}

esp_err_t Vs1053::read_end_fill_byte(uint8_t* efb)
{
    uint16_t raw = 0;
    esp_err_t err = scratch_read(WRAM_END_FILL_BYTE, &raw);
    if (err != ESP_OK) {
        return err;
    }
    *efb = static_cast<uint8_t>(raw & 0xFF);
    return ESP_OK;
}

// ---- Self-test ----
// Round-trip VOL through write + two reads. A missing chip keeps DREQ low,
// so check that first instead of waiting out every poll bound.

esp_err_t Vs1053::self_test(SelfTestProbe probe, SelfTestReport* report)
{
    bool ready = false;
    if (port_->get_data_ready(&ready) != ESP_OK) {
        ESP_LOGW(TAG, "DREQ unreadable at self-test entry");
        return RADIO_ERR_PIN_FAULT;
    }
    if (!ready) {
        ESP_LOGW(TAG, "VS1053 not properly installed (DREQ low)");
        if (report) {
            *report = { .steps = 0, .bad_steps = 0 };
        }
        return RADIO_ERR_CHIP_ABSENT;
    }

    const bool fast = (probe == SelfTestProbe::FAST_PROBE);
    const uint32_t step = fast ? SWEEP_STEP_FAST : SWEEP_STEP_SLOW;
    const BusSpeed speed = fast ? BusSpeed::FAST : BusSpeed::SLOW;
    ESP_LOGI(TAG, "%s SPI: testing read/write registers...", fast ? "Fast" : "Slow");

    uint32_t steps = 0;
    uint32_t bad = 0;
    for (uint32_t i = 0; i < SWEEP_END && bad < SWEEP_MAX_BAD; i += step) {
        const uint16_t sb = static_cast<uint16_t>(i);
        uint16_t r1 = 0;
        uint16_t r2 = 0;
        steps++;

        esp_err_t err = write_register(speed, SciReg::VOL, sb);
        if (err == ESP_OK) {
            err = read_register(SciReg::VOL, &r1);
        }
        if (err == ESP_OK) {
            err = read_register(SciReg::VOL, &r2);
        }

        if (err != ESP_OK || r1 != r2 || r1 != sb) {
            ESP_LOGW(TAG, "VS1053 error retry SB:%04X R1:%04X R2:%04X (%s)", sb, r1, r2,
                     radio_err_to_name(err));
            bad++;
            port_->delay_ms(SWEEP_RETRY_MS);
        }
    }

    if (report) {
        *report = { .steps = steps, .bad_steps = bad };
    }
    if (bad > 0) {
        ESP_LOGW(TAG, "self-test: %lu bad of %lu steps", static_cast<unsigned long>(bad),
                 static_cast<unsigned long>(steps));
        return RADIO_ERR_SELF_TEST_FAILED;
    }
    ESP_LOGI(TAG, "self-test passed (%lu steps)", static_cast<unsigned long>(steps));
    return ESP_OK;
}

// ---- Lifecycle ----

esp_err_t Vs1053::hardware_reset()
{
    set_state(DecoderState::RESETTING);
    ESP_RETURN_ON_ERROR(gate_.drive_both(true), TAG, "reset: release selects");
    port_->delay_ms(RESET_RELEASE_MS);
    ESP_LOGI(TAG, "Reset VS1053...");
    ESP_RETURN_ON_ERROR(gate_.drive_both(false), TAG, "reset: assert selects");
    port_->delay_ms(RESET_ASSERT_MS);
    ESP_LOGI(TAG, "End reset VS1053...");
    ESP_RETURN_ON_ERROR(gate_.drive_both(true), TAG, "reset: release selects");
    port_->delay_ms(RESET_SETTLE_MS);
    return ESP_OK;
}

esp_err_t Vs1053::begin()
{
    speed_ = BusSpeed::SLOW;
    ESP_RETURN_ON_ERROR(hardware_reset(), TAG, "hardware reset failed");

    set_state(DecoderState::AWAITING_READY);
    set_state(DecoderState::SLOW_SELF_TEST);
    esp_err_t err = self_test(SelfTestProbe::SLOW_PROBE);
    if (err != ESP_OK) {
        set_state(DecoderState::DEGRADED);
        ESP_LOGW(TAG, "slow self-test: %s, continuing without clock boost", radio_err_to_name(err));
        return err;
    }

    ESP_RETURN_ON_ERROR(write_register(BusSpeed::SLOW, SciReg::AUDATA, AUDATA_44K1_STEREO),
                        TAG, "AUDATA write failed");
    ESP_RETURN_ON_ERROR(write_register(BusSpeed::SLOW, SciReg::CLOCKF, CLOCKF_MULT_3_0),
                        TAG, "CLOCKF write failed");
    speed_ = BusSpeed::FAST;
    set_state(DecoderState::CLOCK_BOOSTED);

    ESP_RETURN_ON_ERROR(write_register(speed_, SciReg::MODE,
                                       mode_register_value({ .reset = false, .cancel = false, .line1 = true })),
                        TAG, "MODE write failed");

    set_state(DecoderState::FAST_SELF_TEST);
    err = self_test(SelfTestProbe::FAST_PROBE);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "fast self-test: %s (ignored)", radio_err_to_name(err));
    }

    port_->delay_ms(10);
    ESP_RETURN_ON_ERROR(await_ready(), TAG, "DREQ after clock boost");
    ESP_RETURN_ON_ERROR(read_end_fill_byte(&end_fill_byte_), TAG, "end-fill byte read failed");
    ESP_LOGI(TAG, "endFillByte is %02X", end_fill_byte_);

    ESP_RETURN_ON_ERROR(dump_registers("After last clocksetting"), TAG, "register dump failed");
    port_->delay_ms(100);
    set_state(DecoderState::READY);
    return ESP_OK;
}

esp_err_t Vs1053::soft_reset()
{
    ESP_LOGI(TAG, "Performing soft-reset");
    ESP_RETURN_ON_ERROR(write_register(speed_, SciReg::MODE,
                                       mode_register_value({ .reset = true, .cancel = false, .line1 = false })),
                        TAG, "MODE reset write failed");
    port_->delay_ms(10);
    return await_ready();
}

esp_err_t Vs1053::switch_to_mp3_mode()
{
    ESP_RETURN_ON_ERROR(scratch_write(GPIO_DDR_RW, 3), TAG, "GPIO DDR write failed");
    ESP_RETURN_ON_ERROR(scratch_write(GPIO_ODATA_RW, 0), TAG, "GPIO ODATA write failed");
    port_->delay_ms(100);
    ESP_LOGI(TAG, "Switched to mp3 mode");
    return soft_reset();
}

// ---- Audio controls ----

esp_err_t Vs1053::set_volume(uint8_t volume)
{
    volume_ = clamp_volume(volume);
    VolumeBytes b = volume_model(volume_, balance_);
    return write_register(speed_, SciReg::VOL, volume_register_value(b));
}

void Vs1053::set_balance(int balance)
{
    balance_ = clamp_balance(balance);
}

esp_err_t Vs1053::set_tone(const uint8_t nibbles[4])
{
    uint16_t value = 0;
    for (int i = 0; i < 4; i++) {
        value = static_cast<uint16_t>((value << 4) | (nibbles[i] & 0x0F));
    }
    return write_register(speed_, SciReg::BASS, value);
}

bool Vs1053::is_chip_connected()
{
    uint16_t status = 0;
    if (read_register(SciReg::STATUS, &status) != ESP_OK) {
        return false;
    }
    return !(status == 0x0000 || status == 0xFFFF);
}

esp_err_t Vs1053::get_chip_version(uint8_t* version)
{
    uint16_t status = 0;
    esp_err_t err = read_register(SciReg::STATUS, &status);
    if (err != ESP_OK) {
        return err;
    }
    *version = static_cast<uint8_t>((status & 0x00F0) >> 4);
    return ESP_OK;
}

esp_err_t Vs1053::get_decoded_time(uint16_t* seconds)
{
    return read_register(SciReg::DECODE_TIME, seconds);
}

// DECODE_TIME must be written twice to stick.
esp_err_t Vs1053::clear_decoded_time()
{
    esp_err_t err = write_register(speed_, SciReg::DECODE_TIME, 0);
    if (err != ESP_OK) {
        return err;
    }
    return write_register(speed_, SciReg::DECODE_TIME, 0);
}

esp_err_t Vs1053::dump_registers(const char* header)
{
    uint16_t regs[SCI_NUM_REGISTERS] = {};
    for (uint8_t i = 0; i < SCI_NUM_REGISTERS; i++) {
        esp_err_t err = read_register(static_cast<SciReg>(i), &regs[i]);
        if (err != ESP_OK) {
            return err;
        }
    }
    ESP_LOGD(TAG, "%s", header);
    ESP_LOGD(TAG, "REG   Contents");
    ESP_LOGD(TAG, "---   -----");
    for (uint8_t i = 0; i < SCI_NUM_REGISTERS; i++) {
        ESP_LOGD(TAG, "%3X - %5X", i, regs[i]);
    }
    return ESP_OK;
}
