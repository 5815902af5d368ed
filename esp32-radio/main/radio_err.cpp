#include "radio_err.h"

const char* radio_err_to_name(esp_err_t err)
{
    switch (err) {
    case RADIO_ERR_PIN_FAULT:        return "RADIO_ERR_PIN_FAULT";
    case RADIO_ERR_BUS_FAULT:        return "RADIO_ERR_BUS_FAULT";
    case RADIO_ERR_DATA_TIMEOUT:     return "RADIO_ERR_DATA_TIMEOUT";
    case RADIO_ERR_SELF_TEST_FAILED: return "RADIO_ERR_SELF_TEST_FAILED";
    case RADIO_ERR_CHIP_ABSENT:      return "RADIO_ERR_CHIP_ABSENT";
    default:                         return esp_err_to_name(err);
    }
}
