#pragma once
#include <cstddef>
#include <cstdint>

namespace fsp {

constexpr uint16_t DEFAULT_PORT = 3000;
constexpr std::size_t MAX_BODY_BYTES = 50 * 1024 * 1024; // 50 MiB, every route

constexpr const char* ROUTE_UPLOAD = "/upload";
constexpr const char* ROUTE_SMS = "/sms";
constexpr const char* ROUTE_CLIPBOARD = "/clipboard";

constexpr const char* PHOTO_FIELD = "data";

constexpr const char* SERVICE_TYPE = "_photosync._tcp.local.";
constexpr const char* INSTANCE_SUFFIX = "_fastsync";

} // namespace fsp
