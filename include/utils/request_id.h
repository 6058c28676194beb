// request_id.h - request and trace id generation for HTTP responses
#pragma once

#include <string>

namespace modelcat {

// Random 16-hex-character request id.
std::string generate_request_id();

// 32-hex trace id and 16-hex span id (W3C traceparent compatible)
std::string generate_trace_id();
std::string generate_span_id();

// Keep the trace id of an incoming traceparent header, new span id.
// Returns a fresh traceparent if the header is missing or malformed.
std::string next_traceparent(const std::string& incoming);

}  // namespace modelcat
