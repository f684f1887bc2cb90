#pragma once

#include <cstddef>
#include <string_view>

namespace halyard::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// HTTP header field names are case-insensitive per RFC 7230. We store them here
// in their conventional canonical form for emission. Lookups in the transport
// layer must remain case-insensitive.

// Methods GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view CONNECT = "CONNECT";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view TRACE = "TRACE";
inline constexpr std::string_view PATCH = "PATCH";

// Standard Header Field Names
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view Vary = "Vary";

// Non standard, widely used to tunnel a method through POST
inline constexpr std::string_view XHttpMethodOverride = "X-HTTP-Method-Override";

// Compression
inline constexpr std::string_view gzip = "gzip";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Approximate network MTU. Dynamic compression only kicks in above this size.
inline constexpr std::size_t kMtuBytes = 1500;

}  // namespace halyard::http
