#include "test_support.h"
#include "volume_model.h"

#include "unity.h"

void test_volume_max_is_zero_attenuation()
{
    VolumeBytes b = volume_model(100, 0);
    TEST_ASSERT_EQUAL_HEX8(0x00, b.left);
    TEST_ASSERT_EQUAL_HEX8(0x00, b.right);
}

void test_volume_zero_is_full_attenuation()
{
    VolumeBytes b = volume_model(0, 0);
    TEST_ASSERT_EQUAL_HEX8(0xFE, b.left);
    TEST_ASSERT_EQUAL_HEX8(0xFE, b.right);
}

void test_volume_half_rounds_to_0x7f()
{
    VolumeBytes b = volume_model(50, 0);
    TEST_ASSERT_EQUAL_HEX8(0x7F, b.left);
    TEST_ASSERT_EQUAL_HEX8(0x7F, b.right);
    TEST_ASSERT_EQUAL_HEX16(0x7F7F, volume_register_value(b));
}

void test_positive_balance_cuts_left_channel()
{
    VolumeBytes b = volume_model(50, 100);
    TEST_ASSERT_EQUAL_HEX8(0xFE, b.left);
    TEST_ASSERT_EQUAL_HEX8(0x7F, b.right);
    TEST_ASSERT_TRUE(b.left > b.right);
}

void test_negative_balance_boosts_right_channel()
{
    VolumeBytes b = volume_model(50, -100);
    TEST_ASSERT_EQUAL_HEX8(0x7F, b.left);
    TEST_ASSERT_EQUAL_HEX8(0x00, b.right);  // saturated at loudest
    TEST_ASSERT_EQUAL_HEX16(0x7F00, volume_register_value(b));
}

void test_partial_balance_saturates()
{
    VolumeBytes b = volume_model(90, -30);  // right input 120 → 100
    TEST_ASSERT_EQUAL_HEX8(0x00, b.right);
    b = volume_model(10, 40);               // left input -30 → 0
    TEST_ASSERT_EQUAL_HEX8(0xFE, b.left);
}

void test_balance_and_volume_clamp()
{
    TEST_ASSERT_EQUAL_INT8(100, clamp_balance(150));
    TEST_ASSERT_EQUAL_INT8(-100, clamp_balance(-150));
    TEST_ASSERT_EQUAL_INT8(-7, clamp_balance(-7));
    TEST_ASSERT_EQUAL_UINT8(100, clamp_volume(250));
    TEST_ASSERT_EQUAL_UINT8(0, clamp_volume(-3));
}

void test_volume_model_bytes_always_in_range()
{
    for (int v = 0; v <= 100; v++) {
        for (int b = -100; b <= 100; b++) {
            VolumeBytes x = volume_model(static_cast<uint8_t>(v), static_cast<int8_t>(b));
            VolumeBytes y = volume_model(static_cast<uint8_t>(v), static_cast<int8_t>(b));
            TEST_ASSERT_TRUE(x.left <= 0xFE);
            TEST_ASSERT_TRUE(x.right <= 0xFE);
            TEST_ASSERT_EQUAL_HEX16(volume_register_value(x), volume_register_value(y));
        }
    }
}

void run_volume_model_tests()
{
    RUN_TEST(test_volume_max_is_zero_attenuation);
    RUN_TEST(test_volume_zero_is_full_attenuation);
    RUN_TEST(test_volume_half_rounds_to_0x7f);
    RUN_TEST(test_positive_balance_cuts_left_channel);
    RUN_TEST(test_negative_balance_boosts_right_channel);
    RUN_TEST(test_partial_balance_saturates);
    RUN_TEST(test_balance_and_volume_clamp);
    RUN_TEST(test_volume_model_bytes_always_in_range);
}
