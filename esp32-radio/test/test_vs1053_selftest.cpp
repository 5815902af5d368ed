#include "test_support.h"
#include "radio_err.h"

#include "unity.h"

// Steps for i = 0, step, 2*step, ... while i < 0xFFFF
static uint32_t sweep_steps(uint32_t step)
{
    return (0xFFFE / step) + 1;
}

void test_slow_self_test_passes_on_clean_link()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    SelfTestReport r = {};
    TEST_ASSERT_EQUAL(ESP_OK, dev->self_test(SelfTestProbe::SLOW_PROBE, &r));
    TEST_ASSERT_EQUAL_UINT32(sweep_steps(300), r.steps);
    TEST_ASSERT_EQUAL_UINT32(0, r.bad_steps);

    std::vector<uint16_t> vol = fake->writes_to(R_VOL);
    TEST_ASSERT_EQUAL(r.steps, vol.size());
    TEST_ASSERT_EQUAL_HEX16(0, vol[0]);
    TEST_ASSERT_EQUAL_HEX16(300, vol[1]);
    for (const SciWrite& w : fake->sci_writes) {
        TEST_ASSERT_EQUAL(static_cast<int>(BusSpeed::SLOW), static_cast<int>(w.speed));
    }
    TEST_ASSERT_EQUAL_UINT32(2 * r.steps, fake->sci_reads);
}

void test_fast_self_test_uses_fine_step_on_fast_bus()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);

    SelfTestReport r = {};
    TEST_ASSERT_EQUAL(ESP_OK, dev->self_test(SelfTestProbe::FAST_PROBE, &r));
    TEST_ASSERT_EQUAL_UINT32(sweep_steps(3), r.steps);
    TEST_ASSERT_EQUAL(static_cast<int>(BusSpeed::FAST), static_cast<int>(fake->sci_writes.back().speed));
    TEST_ASSERT_EQUAL_HEX16(0xFFFC, fake->sci_writes.back().value);
}

void test_self_test_aborts_after_twenty_mismatches()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->corrupt_vol_reads = true;

    SelfTestReport r = {};
    TEST_ASSERT_EQUAL(RADIO_ERR_SELF_TEST_FAILED, dev->self_test(SelfTestProbe::SLOW_PROBE, &r));
    TEST_ASSERT_EQUAL_UINT32(20, r.bad_steps);
    TEST_ASSERT_EQUAL_UINT32(20, r.steps);
    TEST_ASSERT_EQUAL(20, fake->writes_to(R_VOL).size());
    TEST_ASSERT_EQUAL_UINT32(20 * 10, fake->delay_total_ms);
}

void test_self_test_counts_transaction_error_as_bad_step()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->fail_transfer_at = 4;  // second step, first readback

    SelfTestReport r = {};
    TEST_ASSERT_EQUAL(RADIO_ERR_SELF_TEST_FAILED, dev->self_test(SelfTestProbe::SLOW_PROBE, &r));
    TEST_ASSERT_EQUAL_UINT32(1, r.bad_steps);
    TEST_ASSERT_EQUAL_UINT32(sweep_steps(300), r.steps);
    TEST_ASSERT_TRUE(fake->xcs_high);
}

void test_self_test_chip_absent_fails_fast()
{
    FakeDecoderPort* fake;
    auto dev = make_driver(&fake);
    fake->dreq = DreqScript::NEVER_READY;

    SelfTestReport r = { .steps = 99, .bad_steps = 99 };
    TEST_ASSERT_EQUAL(RADIO_ERR_CHIP_ABSENT, dev->self_test(SelfTestProbe::SLOW_PROBE, &r));
    TEST_ASSERT_EQUAL_UINT32(0, r.steps);
    TEST_ASSERT_EQUAL_UINT32(0, fake->transfers);
    TEST_ASSERT_EQUAL_UINT32(1, fake->dreq_polls);
}

void run_vs1053_selftest_tests()
{
    RUN_TEST(test_slow_self_test_passes_on_clean_link);
    RUN_TEST(test_fast_self_test_uses_fine_step_on_fast_bus);
    RUN_TEST(test_self_test_aborts_after_twenty_mismatches);
    RUN_TEST(test_self_test_counts_transaction_error_as_bad_step);
    RUN_TEST(test_self_test_chip_absent_fails_fast);
}
