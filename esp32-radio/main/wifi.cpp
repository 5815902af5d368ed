#include "wifi.h"
#include "config.h"

#include "esp_check.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_netif_sntp.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

#include <cstring>
#include <ctime>

static const char* TAG = "wifi";

static constexpr EventBits_t BIT_CONNECTED = BIT0;
static constexpr EventBits_t BIT_FAILED    = BIT1;

static EventGroupHandle_t s_events = nullptr;
static int s_retries = 0;

static void on_wifi_event(void*, esp_event_base_t base, int32_t id, void* data)
{
    if (base == WIFI_EVENT && id == WIFI_EVENT_STA_START) {
        esp_err_t err = esp_wifi_connect();
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "connect failed: %s", esp_err_to_name(err));
        }
    } else if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED) {
        if (s_retries < g_cfg.wifi_max_retries) {
            s_retries++;
            ESP_LOGW(TAG, "disconnected, retry %d/%u", s_retries, g_cfg.wifi_max_retries);
            esp_err_t err = esp_wifi_connect();
            if (err != ESP_OK) {
                ESP_LOGW(TAG, "reconnect failed: %s", esp_err_to_name(err));
            }
        } else {
            xEventGroupSetBits(s_events, BIT_FAILED);
        }
    } else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP) {
        auto* ev = static_cast<ip_event_got_ip_t*>(data);
        ESP_LOGI(TAG, "Wifi Connected: ip " IPSTR, IP2STR(&ev->ip_info.ip));
        s_retries = 0;
        xEventGroupSetBits(s_events, BIT_CONNECTED);
    }
}

esp_err_t wifi_connect(const char* ssid, const char* psk)
{
    ESP_RETURN_ON_FALSE(ssid != nullptr && ssid[0] != '\0', ESP_ERR_INVALID_ARG, TAG, "Missing WiFi name");
    const bool open = (psk == nullptr || psk[0] == '\0');
    if (open) {
        ESP_LOGI(TAG, "Wifi password is empty");
    }

    s_events = xEventGroupCreate();
    ESP_RETURN_ON_FALSE(s_events != nullptr, ESP_ERR_NO_MEM, TAG, "event group alloc failed");

    ESP_RETURN_ON_ERROR(esp_netif_init(), TAG, "netif init failed");
    ESP_RETURN_ON_ERROR(esp_event_loop_create_default(), TAG, "event loop failed");
    ESP_RETURN_ON_FALSE(esp_netif_create_default_wifi_sta() != nullptr, ESP_FAIL, TAG, "STA netif failed");

    wifi_init_config_t init_cfg = WIFI_INIT_CONFIG_DEFAULT();
    ESP_RETURN_ON_ERROR(esp_wifi_init(&init_cfg), TAG, "wifi init failed");
    ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID, on_wifi_event,
                                                            nullptr, nullptr), TAG, "wifi handler");
    ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, on_wifi_event,
                                                            nullptr, nullptr), TAG, "ip handler");

    wifi_config_t cfg = {};
    strlcpy(reinterpret_cast<char*>(cfg.sta.ssid), ssid, sizeof(cfg.sta.ssid));
    if (!open) {
        strlcpy(reinterpret_cast<char*>(cfg.sta.password), psk, sizeof(cfg.sta.password));
    }
    cfg.sta.threshold.authmode = open ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;

    ESP_RETURN_ON_ERROR(esp_wifi_set_mode(WIFI_MODE_STA), TAG, "set mode failed");
    ESP_RETURN_ON_ERROR(esp_wifi_set_config(WIFI_IF_STA, &cfg), TAG, "set config failed");
    ESP_LOGI(TAG, "Connecting to '%s'...", ssid);
    ESP_RETURN_ON_ERROR(esp_wifi_start(), TAG, "wifi start failed");

    EventBits_t bits = xEventGroupWaitBits(s_events, BIT_CONNECTED | BIT_FAILED, pdFALSE, pdFALSE,
                                           portMAX_DELAY);
    if (bits & BIT_CONNECTED) {
        return ESP_OK;
    }
    ESP_LOGE(TAG, "gave up on '%s' after %u retries", ssid, g_cfg.wifi_max_retries);
    return ESP_ERR_WIFI_NOT_CONNECT;
}

// ---- Time ----

esp_err_t time_sync_start(const char* server)
{
    esp_sntp_config_t cfg = ESP_NETIF_SNTP_DEFAULT_CONFIG(server);
    ESP_RETURN_ON_ERROR(esp_netif_sntp_init(&cfg), TAG, "SNTP init failed");
    ESP_LOGI(TAG, "SNTP started (%s)", server);
    return ESP_OK;
}

void time_format_now(char* buf, size_t len)
{
    time_t now = time(nullptr);
    struct tm utc = {};
    gmtime_r(&now, &utc);
    strftime(buf, len, "%d/%m/%Y %H:%M:%S", &utc);
}
