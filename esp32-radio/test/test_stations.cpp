#include "test_support.h"
#include "stations.h"

#include "unity.h"

void test_station_table_has_all_entries()
{
    TEST_ASSERT_EQUAL_UINT32(18, station_count());
    TEST_ASSERT_EQUAL_STRING("bfm_business", station_at(0).id);
}

void test_station_lookup_by_id()
{
    TEST_ASSERT_EQUAL_STRING("France Info", station_name("france_info"));
    float mhz = 0.0f;
    TEST_ASSERT_TRUE(station_fm_frequency("france_info", &mhz));
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 105.5f, mhz);
    TEST_ASSERT_EQUAL_STRING("http://icecast.radiofrance.fr/fip-hifi.aac", station_web_url("fip"));
}

void test_fm_only_station_has_empty_url()
{
    const char* url = station_web_url("bfm_business");
    TEST_ASSERT_NOT_NULL(url);
    TEST_ASSERT_EQUAL_STRING("", url);
}

void test_unknown_station_not_found()
{
    float mhz = 42.0f;
    TEST_ASSERT_NULL(station_find("radio_nowhere"));
    TEST_ASSERT_NULL(station_name("radio_nowhere"));
    TEST_ASSERT_NULL(station_web_url("radio_nowhere"));
    TEST_ASSERT_FALSE(station_fm_frequency("radio_nowhere", &mhz));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 42.0f, mhz);
    TEST_ASSERT_NULL(station_find(nullptr));
}

void run_stations_tests()
{
    RUN_TEST(test_station_table_has_all_entries);
    RUN_TEST(test_station_lookup_by_id);
    RUN_TEST(test_fm_only_station_has_empty_url);
    RUN_TEST(test_unknown_station_not_found);
}
