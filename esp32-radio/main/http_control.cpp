#include "http_control.h"
#include "config.h"
#include "decoder_service.h"
#include "led.h"
#include "radio_err.h"
#include "radio_form.h"
#include "stations.h"
#include "tuner.h"

#include "esp_check.h"
#include "esp_http_server.h"
#include "esp_log.h"

#include <cstdio>
#include <cstring>

static const char* TAG = "http";

static httpd_handle_t s_server = nullptr;
static LastConfig s_last = {};  // handlers run on the single httpd task

static constexpr size_t BODY_BUF_LEN = 256;

static const char INDEX_HTML[] =
    "<!DOCTYPE html>\n"
    "<html><head><meta charset=\"utf-8\"><title>Radio</title></head>\n"
    "<body>Hello from the radio!</body></html>\n";

static const char RADIO_HTML[] =
    "<!DOCTYPE html>\n"
    "<html><head><meta charset=\"utf-8\"><title>Radio control</title></head>\n"
    "<body>\n"
    "<h1>Radio control</h1>\n"
    "<form id=\"f\">\n"
    "  <input name=\"station\" placeholder=\"station id\" value=\"france_info\">\n"
    "  <label><input type=\"checkbox\" name=\"is_webradio\"> webradio</label>\n"
    "  <button>Tune</button>\n"
    "</form>\n"
    "<form id=\"v\"><input type=\"range\" name=\"volume\" min=\"0\" max=\"100\">"
    "<button>Volume</button></form>\n"
    "<pre id=\"out\"></pre>\n"
    "<script>\n"
    "async function post(url, body) {\n"
    "  const r = await fetch(url, {method: 'POST', body: JSON.stringify(body)});\n"
    "  document.getElementById('out').textContent = await r.text();\n"
    "}\n"
    "document.getElementById('f').onsubmit = e => { e.preventDefault();\n"
    "  post('/post-radio-form', {station: e.target.station.value,\n"
    "       is_webradio: e.target.is_webradio.checked}); };\n"
    "document.getElementById('v').onsubmit = e => { e.preventDefault();\n"
    "  post('/volume', {volume: Number(e.target.volume.value)}); };\n"
    "</script>\n"
    "</body></html>\n";

// ---- Helpers ----

// Reads the whole body into buf (NUL-terminated). ESP_ERR_INVALID_SIZE when
// it exceeds the configured payload limit; the caller answers 413.
static esp_err_t read_body(httpd_req_t* req, char* buf, size_t buf_len, size_t* out_len)
{
    size_t total = req->content_len;
    if (total > g_cfg.http_max_payload || total >= buf_len) {
        return ESP_ERR_INVALID_SIZE;
    }
    size_t got = 0;
    while (got < total) {
        int n = httpd_req_recv(req, buf + got, total - got);
        if (n == HTTPD_SOCK_ERR_TIMEOUT) {
            continue;
        }
        if (n <= 0) {
            return ESP_FAIL;
        }
        got += static_cast<size_t>(n);
    }
    buf[got] = '\0';
    *out_len = got;
    return ESP_OK;
}

static esp_err_t reject_body(httpd_req_t* req, esp_err_t err)
{
    if (err == ESP_ERR_INVALID_SIZE) {
        ESP_RETURN_ON_ERROR(httpd_resp_set_status(req, "413 Payload Too Large"), TAG, "status");
        return httpd_resp_sendstr(req, "Request too big");
    }
    return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "Body read failed");
}

// ---- Handlers ----

static esp_err_t index_get(httpd_req_t* req)
{
    ESP_RETURN_ON_ERROR(httpd_resp_set_type(req, "text/html"), TAG, "type");
    ESP_RETURN_ON_ERROR(httpd_resp_sendstr(req, INDEX_HTML), TAG, "send index");
    esp_err_t err = led_set_rgb(0, 50, 0);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "LED update failed: %s", esp_err_to_name(err));
    }
    return ESP_OK;
}

static esp_err_t radio_get(httpd_req_t* req)
{
    ESP_RETURN_ON_ERROR(httpd_resp_set_type(req, "text/html"), TAG, "type");
    return httpd_resp_sendstr(req, RADIO_HTML);
}

static void select_fm(const char* id)
{
    float mhz = 0.0f;
    if (!station_fm_frequency(id, &mhz)) {
        ESP_LOGW(TAG, "FM Radio [%s] not found", id);
        return;
    }
    esp_err_t err = tuner_set_frequency(mhz);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "FM Radio %s: tune to %.1f failed: %s", id, mhz, esp_err_to_name(err));
        return;
    }
    ESP_LOGI(TAG, "FM Radio set to: %s (%s), frequency: %.1f", id, station_name(id), mhz);
    err = led_blink_station();
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "LED blink failed: %s", esp_err_to_name(err));
    }
}

static void select_webradio(const char* id)
{
    const char* url = station_web_url(id);
    if (url == nullptr || url[0] == '\0') {
        ESP_LOGW(TAG, "Webradio [%s] not found", id);
        return;
    }
    ESP_LOGI(TAG, "WebRadio set to: %s (%s), URL: %s", id, station_name(id), url);
}

static esp_err_t radio_form_post(httpd_req_t* req)
{
    char body[BODY_BUF_LEN];
    size_t len = 0;
    esp_err_t err = read_body(req, body, sizeof(body), &len);
    if (err != ESP_OK) {
        return reject_body(req, err);
    }

    RadioForm form = {};
    if (radio_form_parse(body, len, &form) != ESP_OK) {
        return httpd_resp_sendstr(req, "JSON error");
    }

    if (form.is_webradio) {
        select_webradio(form.station);
        s_last.source = RadioSource::WEBRADIO;
    } else {
        select_fm(form.station);
        s_last.source = RadioSource::FM;
    }
    strlcpy(s_last.station, form.station, sizeof(s_last.station));
    err = last_config_save(s_last);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "last config not saved: %s", esp_err_to_name(err));
    }

    char reply[96];
    snprintf(reply, sizeof(reply), "Requested %s station and %s webradio", form.station,
             form.is_webradio ? "true" : "false");
    return httpd_resp_sendstr(req, reply);
}

static esp_err_t volume_post(httpd_req_t* req)
{
    char body[BODY_BUF_LEN];
    size_t len = 0;
    esp_err_t err = read_body(req, body, sizeof(body), &len);
    if (err != ESP_OK) {
        return reject_body(req, err);
    }

    uint8_t volume = 0;
    if (volume_form_parse(body, len, &volume) != ESP_OK) {
        return httpd_resp_sendstr(req, "JSON error");
    }

    err = decoder_set_volume(volume);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "volume %u failed: %s", volume, radio_err_to_name(err));
        return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, radio_err_to_name(err));
    }

    s_last.volume = volume;
    err = last_config_save(s_last);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "last config not saved: %s", esp_err_to_name(err));
    }

    char reply[32];
    snprintf(reply, sizeof(reply), "Volume %u", volume);
    return httpd_resp_sendstr(req, reply);
}

// ---- Server ----

esp_err_t http_control_start(const LastConfig& initial)
{
    s_last = initial;

    httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
    ESP_RETURN_ON_ERROR(httpd_start(&s_server, &cfg), TAG, "httpd_start failed");

    const httpd_uri_t routes[] = {
        { .uri = "/", .method = HTTP_GET, .handler = index_get, .user_ctx = nullptr },
        { .uri = "/radio", .method = HTTP_GET, .handler = radio_get, .user_ctx = nullptr },
        { .uri = "/post-radio-form", .method = HTTP_POST, .handler = radio_form_post, .user_ctx = nullptr },
        { .uri = "/volume", .method = HTTP_POST, .handler = volume_post, .user_ctx = nullptr },
    };
    for (const httpd_uri_t& r : routes) {
        ESP_RETURN_ON_ERROR(httpd_register_uri_handler(s_server, &r), TAG, "register %s failed", r.uri);
    }

    ESP_LOGW(TAG, "Server awaiting connection");
    return ESP_OK;
}
