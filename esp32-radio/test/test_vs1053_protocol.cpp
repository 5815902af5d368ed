#include "test_support.h"
#include "radio_err.h"

#include "unity.h"

void test_read_register_frames_and_decodes_big_endian()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->regs[R_AUDATA] = 0xAC45;

    uint16_t v = 0;
    TEST_ASSERT_EQUAL(ESP_OK, dev->read_register(SciReg::AUDATA, &v));
    TEST_ASSERT_EQUAL_HEX16(0xAC45, v);
    TEST_ASSERT_EQUAL_UINT32(1, fake->sci_reads);
    TEST_ASSERT_TRUE(fake->xcs_high);
    TEST_ASSERT_TRUE(fake->xdcs_high);
    TEST_ASSERT_EQUAL_UINT32(0, fake->select_violations);
}

void test_write_register_waits_before_and_after()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    TEST_ASSERT_EQUAL(ESP_OK, dev->write_register(BusSpeed::SLOW, SciReg::CLOCKF, 0x6000));
    TEST_ASSERT_EQUAL(1, fake->sci_writes.size());
    TEST_ASSERT_EQUAL(static_cast<int>(BusSpeed::SLOW), static_cast<int>(fake->sci_writes[0].speed));
    TEST_ASSERT_EQUAL_HEX8(R_CLOCKF, fake->sci_writes[0].reg);
    TEST_ASSERT_EQUAL_HEX16(0x6000, fake->sci_writes[0].value);
    TEST_ASSERT_EQUAL_UINT32(2, fake->dreq_polls);
    TEST_ASSERT_TRUE(fake->xcs_high);
}

void test_write_register_bus_failure_releases_select()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->fail_transfer_at = 0;

    TEST_ASSERT_EQUAL(RADIO_ERR_BUS_FAULT, dev->write_register(BusSpeed::FAST, SciReg::VOL, 0x1234));
    TEST_ASSERT_TRUE(fake->xcs_high);
    TEST_ASSERT_EQUAL(0, fake->sci_writes.size());

    // Next call goes through
    TEST_ASSERT_EQUAL(ESP_OK, dev->write_register(BusSpeed::FAST, SciReg::VOL, 0x1234));
    TEST_ASSERT_EQUAL_HEX16(0x1234, fake->regs[R_VOL]);
}

void test_write_register_times_out_without_dreq()
{
    FakeDecoderPort* fake;
    Vs1053Options opts = TEST_OPTS;
    opts.dreq_max_polls = 5;
    auto dev = make_driver(&fake, opts);
    fake->dreq = DreqScript::NEVER_READY;

    TEST_ASSERT_EQUAL(RADIO_ERR_DATA_TIMEOUT, dev->write_register(BusSpeed::SLOW, SciReg::VOL, 0));
    TEST_ASSERT_EQUAL_UINT32(0, fake->transfers);
    TEST_ASSERT_EQUAL_UINT32(5, fake->dreq_polls);
}

void test_read_register_pin_fault_aborts_call()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->fail_set_line_at = 1;

    uint16_t v = 0xBEEF;
    TEST_ASSERT_EQUAL(RADIO_ERR_PIN_FAULT, dev->read_register(SciReg::STATUS, &v));
    TEST_ASSERT_EQUAL_HEX16(0xBEEF, v);
    TEST_ASSERT_EQUAL(ESP_OK, dev->read_register(SciReg::STATUS, &v));
    TEST_ASSERT_EQUAL_HEX16(0x0048, v);
}

void test_scratch_access_goes_through_wramaddr()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    TEST_ASSERT_EQUAL(ESP_OK, dev->scratch_write(0xC017, 3));
    TEST_ASSERT_EQUAL(2, fake->sci_writes.size());
    TEST_ASSERT_EQUAL_HEX8(R_WRAMADDR, fake->sci_writes[0].reg);
    TEST_ASSERT_EQUAL_HEX16(0xC017, fake->sci_writes[0].value);
    TEST_ASSERT_EQUAL_HEX8(R_WRAM, fake->sci_writes[1].reg);
    TEST_ASSERT_EQUAL_HEX16(3, fake->wram[0xC017]);

    fake->wram[0x1E06] = 0x12AB;
    uint16_t v = 0;
    TEST_ASSERT_EQUAL(ESP_OK, dev->scratch_read(0x1E06, &v));
    TEST_ASSERT_EQUAL_HEX16(0x12AB, v);
}

void test_set_volume_writes_packed_channels()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    TEST_ASSERT_EQUAL(ESP_OK, dev->set_volume(50));
    TEST_ASSERT_EQUAL_HEX16(0x7F7F, fake->regs[R_VOL]);

    dev->set_balance(-100);
    TEST_ASSERT_EQUAL_HEX16(0x7F7F, fake->regs[R_VOL]);  // balance alone does not write
    TEST_ASSERT_EQUAL(ESP_OK, dev->set_volume(50));
    TEST_ASSERT_EQUAL_HEX16(0x7F00, fake->regs[R_VOL]);

    TEST_ASSERT_EQUAL(ESP_OK, dev->set_volume(200));
    TEST_ASSERT_EQUAL_UINT8(100, dev->get_volume());
    TEST_ASSERT_EQUAL_INT8(-100, dev->get_balance());
}

void test_balance_setter_clamps()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    dev->set_balance(150);
    TEST_ASSERT_EQUAL_INT8(100, dev->get_balance());
    dev->set_balance(-150);
    TEST_ASSERT_EQUAL_INT8(-100, dev->get_balance());
}

void test_set_tone_packs_nibbles()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    const uint8_t tone[4] = { 0x1, 0x2, 0xF3, 0x4 };
    TEST_ASSERT_EQUAL(ESP_OK, dev->set_tone(tone));
    TEST_ASSERT_EQUAL_HEX16(0x1234, fake->regs[R_BASS]);
}

void test_chip_connected_heuristic()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    fake->regs[R_STATUS] = 0x0000;
    TEST_ASSERT_FALSE(dev->is_chip_connected());
    fake->regs[R_STATUS] = 0xFFFF;
    TEST_ASSERT_FALSE(dev->is_chip_connected());
    fake->regs[R_STATUS] = 0x0048;
    TEST_ASSERT_TRUE(dev->is_chip_connected());

    fake->clear_log();
    fake->fail_transfer_at = 0;
    TEST_ASSERT_FALSE(dev->is_chip_connected());
}

void test_chip_version_from_status()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->regs[R_STATUS] = 0x0048;
    uint8_t version = 0;
    TEST_ASSERT_EQUAL(ESP_OK, dev->get_chip_version(&version));
    TEST_ASSERT_EQUAL_UINT8(4, version);
}

void test_decoded_time_cleared_with_two_writes()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->regs[R_DECODE] = 321;

    uint16_t secs = 0;
    TEST_ASSERT_EQUAL(ESP_OK, dev->get_decoded_time(&secs));
    TEST_ASSERT_EQUAL_UINT16(321, secs);

    TEST_ASSERT_EQUAL(ESP_OK, dev->clear_decoded_time());
    std::vector<uint16_t> writes = fake->writes_to(R_DECODE);
    TEST_ASSERT_EQUAL(2, writes.size());
    TEST_ASSERT_EQUAL_UINT16(0, writes[0]);
    TEST_ASSERT_EQUAL_UINT16(0, writes[1]);
}

void test_dump_registers_reads_all_sixteen()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    TEST_ASSERT_EQUAL(ESP_OK, dev->dump_registers("test"));
    TEST_ASSERT_EQUAL_UINT32(SCI_NUM_REGISTERS, fake->sci_reads);
}

void test_mode_register_value_always_sets_sdinew()
{
    TEST_ASSERT_EQUAL_HEX16(0x0800, mode_register_value({ .reset = false, .cancel = false, .line1 = false }));
    TEST_ASSERT_EQUAL_HEX16(0x4800, mode_register_value({ .reset = false, .cancel = false, .line1 = true }));
    TEST_ASSERT_EQUAL_HEX16(0x0808, mode_register_value({ .reset = false, .cancel = true, .line1 = false }));
    TEST_ASSERT_EQUAL_HEX16(0x0804, mode_register_value({ .reset = true, .cancel = false, .line1 = false }));
}

void test_radio_err_names()
{
    TEST_ASSERT_EQUAL_STRING("RADIO_ERR_DATA_TIMEOUT", radio_err_to_name(RADIO_ERR_DATA_TIMEOUT));
    TEST_ASSERT_EQUAL_STRING("RADIO_ERR_CHIP_ABSENT", radio_err_to_name(RADIO_ERR_CHIP_ABSENT));
    TEST_ASSERT_EQUAL_STRING(esp_err_to_name(ESP_ERR_INVALID_ARG), radio_err_to_name(ESP_ERR_INVALID_ARG));
}

void run_vs1053_protocol_tests()
{
    RUN_TEST(test_read_register_frames_and_decodes_big_endian);
    RUN_TEST(test_write_register_waits_before_and_after);
    RUN_TEST(test_write_register_bus_failure_releases_select);
    RUN_TEST(test_write_register_times_out_without_dreq);
    RUN_TEST(test_read_register_pin_fault_aborts_call);
    RUN_TEST(test_scratch_access_goes_through_wramaddr);
    RUN_TEST(test_set_volume_writes_packed_channels);
    RUN_TEST(test_balance_setter_clamps);
    RUN_TEST(test_set_tone_packs_nibbles);
    RUN_TEST(test_chip_connected_heuristic);
    RUN_TEST(test_chip_version_from_status);
    RUN_TEST(test_decoded_time_cleared_with_two_writes);
    RUN_TEST(test_dump_registers_reads_all_sixteen);
    RUN_TEST(test_mode_register_value_always_sets_sdinew);
    RUN_TEST(test_radio_err_names);
}
