#pragma once
// Built-in station table: FM frequency and/or web stream per station id.

#include <cstddef>

struct Station {
    const char* id;
    const char* name;
    float       fm_mhz;   // 0 when not on FM
    const char* web_url;  // "" = FM only
};

// nullptr when the id is unknown.
const Station* station_find(const char* id);

const char* station_name(const char* id);
// false when the id is unknown.
bool station_fm_frequency(const char* id, float* mhz);
// nullptr when the id is unknown; "" when the station has no stream.
const char* station_web_url(const char* id);

size_t station_count();
const Station& station_at(size_t index);
