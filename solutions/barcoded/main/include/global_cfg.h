#ifndef _GLOBAL_CFG_H_
#define _GLOBAL_CFG_H_

#include <string>

/* HTTPD */
#define DEFAULT_HTTP_PORT "8000"
#define DEFAULT_LISTEN_ADDR "0.0.0.0"
#define SERVICE_NAME "barcode-generator"

/* Rendering */
#define DEFAULT_DPI 300
#define MIN_DPI 72
#define MAX_DPI 1200
#define MAX_RASTER_PIXELS (40 * 1000 * 1000)

/* Barcode styling defaults (millimetres, font size in points) */
#define DEFAULT_MODULE_WIDTH 0.2
#define DEFAULT_MODULE_HEIGHT 15.0
#define DEFAULT_QUIET_ZONE 6.5
#define DEFAULT_FONT_SIZE 10
#define DEFAULT_TEXT_DISTANCE 5.0
#define MIN_FONT_SIZE 1
#define MAX_FONT_SIZE 100

/* QR code defaults */
#define DEFAULT_QR_VERSION 1
#define MIN_QR_VERSION 1
#define MAX_QR_VERSION 40
#define DEFAULT_QR_EC_LEVEL "M"
#define DEFAULT_QR_BOX_SIZE 10
#define DEFAULT_QR_BORDER 4
#define MAX_QR_BOX_SIZE 100
#define MAX_QR_BORDER 100

/* Download filenames */
#define FILENAME_MAX_DATA_LEN 64
#define FILENAME_DIGEST_LEN 16

struct server_config {
    std::string listen_addr = DEFAULT_LISTEN_ADDR;
    std::string http_port = DEFAULT_HTTP_PORT;
    int dpi = DEFAULT_DPI;
};

#endif
