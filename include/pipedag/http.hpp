#pragma once
#include <string>
#include <unordered_map>

namespace pipedag {
namespace http {

struct Request {
  std::string method;
  std::string path;
  std::string query;
  // keys are lower-cased
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  std::string header(const std::string &name) const;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

std::string reason_phrase(int code);
std::string to_lower(std::string s);

Response json_response(int status, std::string body);
Response error_response(int status, const std::string &detail);

std::string json_escape(const std::string &s);

} // namespace http
} // namespace pipedag
