#include <pipedag/pipeline.hpp>
#include <pipedag/router.hpp>

#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <algorithm>

namespace pipedag {

static constexpr const char *kAllowMethods =
    "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";

Router::Router(const Config &cfg)
    : origins_(cfg.allowed_origins), traversal_(cfg.traversal) {}

bool Router::origin_allowed(const std::string &origin) const {
  if (origin.empty())
    return false;
  return std::find(origins_.begin(), origins_.end(), "*") != origins_.end() ||
         std::find(origins_.begin(), origins_.end(), origin) != origins_.end();
}

void Router::add_cors(const http::Request &r, http::Response &resp) const {
  std::string origin = r.header("Origin");
  if (!origin_allowed(origin))
    return;
  resp.headers["Access-Control-Allow-Origin"] = origin;
  resp.headers["Access-Control-Allow-Credentials"] = "true";
  resp.headers["Vary"] = "Origin";
}

http::Response Router::handle(const http::Request &r) const {
  bool preflight = r.method == "OPTIONS" && !r.header("Origin").empty() &&
                   !r.header("Access-Control-Request-Method").empty();
  if (preflight)
    return handle_preflight(r);

  http::Response resp;
  if (r.path == "/") {
    if (r.method == "GET")
      resp = handle_root();
    else
      resp = http::error_response(405, "Method Not Allowed");
  } else if (r.path == "/pipelines/parse") {
    if (r.method == "POST")
      resp = handle_parse(r.body);
    else
      resp = http::error_response(405, "Method Not Allowed");
  } else {
    resp = http::error_response(404, "Not Found");
  }
  if (resp.status == 405)
    resp.headers["Allow"] = r.path == "/" ? "GET" : "POST";
  add_cors(r, resp);
  return resp;
}

http::Response Router::handle_root() const {
  return http::json_response(
      200, R"({"status":"ok","message":"Pipeline DAG API is running"})");
}

http::Response Router::handle_parse(const std::string &body) const {
  auto fp = XXH64(body.data(), body.size(), 0);
  ParseError err;
  auto p = parse_pipeline(body, &err);
  if (!p) {
    int status = err.kind == ParseError::Kind::Syntax ? 400 : 422;
    spdlog::warn("[parse] req={:016x} rejected ({}): {}", fp, status,
                 err.str());
    if (status == 400)
      return http::error_response(status, err.str());
    return http::json_response(status, validation_error_json(err));
  }
  auto s = summarize(*p, traversal_);
  spdlog::info("[parse] req={:016x} nodes={} edges={} resolved={} dag={}", fp,
               s.num_nodes, s.num_edges, s.num_edges_resolved, s.is_dag);
  return http::json_response(200, summary_to_json(s));
}

http::Response Router::handle_preflight(const http::Request &r) const {
  http::Response resp;
  std::string origin = r.header("Origin");
  if (!origin_allowed(origin)) {
    spdlog::debug("[http] preflight from disallowed origin {}", origin);
    resp.status = 400;
    resp.body = "Disallowed CORS origin";
    return resp;
  }
  resp.body = "OK";
  resp.headers["Access-Control-Allow-Methods"] = kAllowMethods;
  resp.headers["Access-Control-Max-Age"] = "600";
  std::string req_headers = r.header("Access-Control-Request-Headers");
  if (!req_headers.empty())
    resp.headers["Access-Control-Allow-Headers"] = req_headers;
  add_cors(r, resp);
  return resp;
}

} // namespace pipedag
