#include "stations.h"

#include <cstring>

static constexpr Station STATIONS[] = {
    { "bfm_business", "BFM Business", 96.4f, "" },
    { "cherie_fm", "Cherie FM", 91.3f, "" },
    { "europe_1", "Europe 1", 104.7f, "" },
    { "europe_2", "Europe 2", 103.5f, "http://europe2.lmn.fm/europe2.mp3" },
    { "fip", "FIP", 105.1f, "http://icecast.radiofrance.fr/fip-hifi.aac" },
    { "france_info", "France Info", 105.5f, "http://icecast.radiofrance.fr/franceinfo-hifi.aac" },
    { "france_inter", "France Inter", 87.6f, "" },
    { "france_inter_2", "France Inter Test 2", 87.8f, "" },
    { "le_mouv", "Le Mouv", 92.1f, "" },
    { "nostalgie", "Nostalgie", 90.4f, "https://scdn.nrjaudio.fm/adwz2/fr/30601/mp3_128.mp3" },
    { "nrj", "NRJ", 100.3f, "https://scdn.nrjaudio.fm/adwz2/fr/30001/mp3_128.mp3" },
    { "radio_enghien", "Station Enghien", 98.0f, "" },
    { "rfm", "RFM", 103.9f, "http://stream.rfm.fr/rfm.mp3" },
    { "rire_et_chansons", "Rire & Chansons", 97.4f, "https://scdn.nrjaudio.fm/adwz2/fr/30401/mp3_128.mp3" },
    { "rmc", "RMC", 103.1f, "http://audio.bfmtv.com/rmcradio_128.mp3" },
    { "rtl", "RTL", 104.3f, "http://icecast.rtl.fr/rtl-1-44-128?listen=webCwsBCggNCQgLDQUGBAcGBg" },
    { "rtl_2", "RL2", 105.9f, "http://icecast.rtl2.fr/rtl2-1-44-128?listen=webCwsBCggNCQgLDQUGBAcGBg" },
    { "tsf_jazz", "TSF Jazz", 0.0f, "https://tsfjazz.ice.infomaniak.ch/tsfjazz-high.mp3" },
};

static constexpr size_t STATION_COUNT = sizeof(STATIONS) / sizeof(STATIONS[0]);

const Station* station_find(const char* id)
{
    if (id == nullptr) {
        return nullptr;
    }
    for (const Station& s : STATIONS) {
        if (strcmp(s.id, id) == 0) {
            return &s;
        }
    }
    return nullptr;
}

const char* station_name(const char* id)
{
    const Station* s = station_find(id);
    return s ? s->name : nullptr;
}

bool station_fm_frequency(const char* id, float* mhz)
{
    const Station* s = station_find(id);
    if (!s) {
        return false;
    }
    *mhz = s->fm_mhz;
    return true;
}

const char* station_web_url(const char* id)
{
    const Station* s = station_find(id);
    return s ? s->web_url : nullptr;
}

size_t station_count()
{
    return STATION_COUNT;
}

const Station& station_at(size_t index)
{
    return STATIONS[index < STATION_COUNT ? index : STATION_COUNT - 1];
}
