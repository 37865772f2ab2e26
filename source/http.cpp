#include <pipedag/http.hpp>

#include <fmt/format.h>

#include <cctype>

namespace pipedag {
namespace http {

std::string Request::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  if (it == headers.end())
    return {};
  return it->second;
}

std::string reason_phrase(int code) {
  switch (code) {
  case 200: return "OK";
  case 204: return "No Content";
  case 400: return "Bad Request";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 408: return "Request Timeout";
  case 413: return "Payload Too Large";
  case 422: return "Unprocessable Entity";
  case 500: return "Internal Server Error";
  default: return "Unknown";
  }
}

std::string to_lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

Response json_response(int status, std::string body) {
  Response resp;
  resp.status = status;
  resp.headers["Content-Type"] = "application/json";
  resp.body = std::move(body);
  return resp;
}

Response error_response(int status, const std::string &detail) {
  return json_response(status,
                       fmt::format(R"({{"detail":"{}"}})", json_escape(detail)));
}

std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        o.push_back(c);
    }
  }
  return o;
}

} // namespace http
} // namespace pipedag
