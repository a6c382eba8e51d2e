#include "api_info.h"
#include "global_cfg.h"
#include "version.h"

api_status_t api_info::root(request_t req, response_t res)
{
    res["message"] = "Barcode & QR Code Generator API";
    res["version"] = PROJECT_VERSION;
    res["supported_formats"] = _registry.ids();
    res["features"] = {
        "Generate barcodes in multiple formats",
        "Generate QR codes with custom styling",
        "Scan images for barcodes and QR codes",
        "Return base64 encoded images or binary files",
    };
    res["endpoints"] = {
        { "generate", "/generate" },
        { "generate_image", "/generate/image" },
        { "generate_quick", "/generate/quick" },
        { "create_barcode", "/create-barcode" },
        { "create_qr_code", "/create-qr-code" },
        { "scan_image", "/scan-image" },
        { "formats", "/formats" },
        { "supported_formats", "/supported-formats" },
        { "health", "/health" },
    };
    return API_STATUS_OK;
}

api_status_t api_info::health(request_t req, response_t res)
{
    res["status"] = "healthy";
    res["service"] = SERVICE_NAME;
    return API_STATUS_OK;
}

api_status_t api_info::formats(request_t req, response_t res)
{
    json details = json::object();
    for (const auto& f : _registry.formats()) {
        details[f.id] = f.description;
    }

    res["supported_formats"] = _registry.ids();
    res["format_details"] = std::move(details);
    res["qr_code"] = {
        { "error_correction_levels", { "L", "M", "Q", "H" } },
        { "version_range", { MIN_QR_VERSION, MAX_QR_VERSION } },
        { "default_box_size", DEFAULT_QR_BOX_SIZE },
        { "default_border", DEFAULT_QR_BORDER },
    };
    res["return_formats"] = { "base64", "image" };
    return API_STATUS_OK;
}
