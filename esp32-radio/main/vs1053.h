#pragma once
// VS1053 MP3 decoder driver.
// Register (SCI) and stream (SDI) protocol over a DecoderPort, plus chip
// bring-up. One instance per chip; not thread-safe (decoder_service wraps it
// in a mutex).

#include "decoder_port.h"
#include "pin_gate.h"
#include "volume_model.h"

#include <cstddef>
#include <cstdint>
#include <memory>

// ---- SCI registers ----
enum class SciReg : uint8_t {
    MODE        = 0x0,
    STATUS      = 0x1,
    BASS        = 0x2,
    CLOCKF      = 0x3,
    DECODE_TIME = 0x4,
    AUDATA      = 0x5,
    WRAM        = 0x6,
    WRAMADDR    = 0x7,
    HDAT0       = 0x8,
    HDAT1       = 0x9,
    AIADDR      = 0xA,
    VOL         = 0xB,
    AICTRL0     = 0xC,
    AICTRL1     = 0xD,
    AICTRL2     = 0xE,
    AICTRL3     = 0xF,
};
constexpr uint8_t SCI_NUM_REGISTERS = 16;

// ---- SCI_MODE bit numbers ----
constexpr uint8_t SM_RESET  = 2;
constexpr uint8_t SM_CANCEL = 3;
constexpr uint8_t SM_SDINEW = 11;  // always set
constexpr uint8_t SM_LINE1  = 14;

struct ModeFlags {
    bool reset;
    bool cancel;
    bool line1;
};

// SDINEW is always on (native SPI modes).
constexpr uint16_t mode_register_value(ModeFlags f)
{
    uint16_t v = 1u << SM_SDINEW;
    if (f.reset)  v |= 1u << SM_RESET;
    if (f.cancel) v |= 1u << SM_CANCEL;
    if (f.line1)  v |= 1u << SM_LINE1;
    return v;
}

// ---- Self-test ----
enum class SelfTestProbe : uint8_t {
    SLOW_PROBE = 0,  // step 300, slow bus
    FAST_PROBE = 1,  // step 3, fast bus
};

struct SelfTestReport {
    uint32_t steps;
    uint32_t bad_steps;
};

// ---- Lifecycle ----
enum class DecoderState : uint8_t {
    POWERED_OFF,
    RESETTING,
    AWAITING_READY,
    SLOW_SELF_TEST,
    CLOCK_BOOSTED,
    FAST_SELF_TEST,
    READY,
    DEGRADED,  // slow self-test failed, fast path skipped
};

const char* decoder_state_name(DecoderState s);

struct Vs1053Options {
    size_t   chunk_size;
    uint32_t dreq_max_polls;
    uint8_t  volume;
    int8_t   balance;
};

class Vs1053 {
public:
    // No I/O until begin().
    Vs1053(std::unique_ptr<DecoderPort> port, const Vs1053Options& opts);

    Vs1053(const Vs1053&) = delete;
    Vs1053& operator=(const Vs1053&) = delete;

    // ---- Lifecycle ----
    // Hardware reset, slow self-test, clock boost, fast self-test.
    // RADIO_ERR_SELF_TEST_FAILED / RADIO_ERR_CHIP_ABSENT leave the driver DEGRADED.
    esp_err_t begin();
    // Most modules boot in MIDI mode; flip GPIO0/1 and soft-reset into MP3.
    esp_err_t switch_to_mp3_mode();
    esp_err_t soft_reset();

    DecoderState state() const { return state_; }
    BusSpeed bus_speed() const { return speed_; }
    uint8_t end_fill_byte() const { return end_fill_byte_; }

    // ---- Register access ----
    esp_err_t read_register(SciReg reg, uint16_t* value);
    esp_err_t write_register(BusSpeed speed, SciReg reg, uint16_t value);
    esp_err_t scratch_write(uint16_t address, uint16_t data);
    esp_err_t scratch_read(uint16_t address, uint16_t* data);

    esp_err_t self_test(SelfTestProbe probe, SelfTestReport* report = nullptr);

    // ---- Audio controls ----
    esp_err_t set_volume(uint8_t volume);
    // Stored only; applied by the next set_volume().
    void set_balance(int balance);
    uint8_t get_volume() const { return volume_; }
    int8_t get_balance() const { return balance_; }
    // Four nibbles: treble amp, treble freq, bass amp, bass freq.
    esp_err_t set_tone(const uint8_t nibbles[4]);

    bool is_chip_connected();
    esp_err_t get_chip_version(uint8_t* version);
    esp_err_t get_decoded_time(uint16_t* seconds);
    esp_err_t clear_decoded_time();
    esp_err_t dump_registers(const char* header);

    // ---- Streaming (SDI) ----
    esp_err_t write_stream(const uint8_t* data, size_t len, size_t chunk_size);
    esp_err_t play_chunk(const uint8_t* data, size_t len);
    esp_err_t flush_with_fillers(size_t units);
    esp_err_t start_song();
    esp_err_t stop_song();

private:
    esp_err_t await_ready();
    esp_err_t hardware_reset();
    esp_err_t read_end_fill_byte(uint8_t* efb);
    // SDI transfer under DREQ flow control. With repeat set, every chunk is
    // taken from the start of data (filler padding).
    esp_err_t sdi_write(const uint8_t* data, size_t len, size_t chunk_size, bool repeat);
    void set_state(DecoderState s);

    std::unique_ptr<DecoderPort> port_;
    PinGate gate_;
    Vs1053Options opts_;
    DecoderState state_ = DecoderState::POWERED_OFF;
    BusSpeed speed_ = BusSpeed::SLOW;
    uint8_t volume_;
    int8_t balance_;
    uint8_t end_fill_byte_ = 0;
};
