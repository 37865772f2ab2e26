#include <pipedag/http.hpp>
#include <pipedag/pipeline.hpp>

#include <fmt/format.h>

#include <memory>

namespace pipedag {

std::string ParseError::str() const {
  if (loc.empty())
    return message;
  return fmt::format("{}: {}", loc, message);
}

namespace {

constexpr const char *kRequired = "field required";
constexpr const char *kNotString = "input should be a string";
constexpr const char *kNotObject = "input should be an object";
constexpr const char *kNotList = "input should be a list";
constexpr const char *kNotNumber = "input should be a number";

const char *error_type(const std::string &msg) {
  if (msg == kRequired)
    return "missing";
  if (msg == kNotString)
    return "string_type";
  if (msg == kNotList)
    return "list_type";
  if (msg == kNotNumber)
    return "float_type";
  return "model_attributes_type";
}

bool fail(ParseError *err, ParseError::Kind kind, std::string loc,
          std::string msg) {
  if (err) {
    err->kind = kind;
    err->loc = std::move(loc);
    err->type = kind == ParseError::Kind::Schema ? error_type(msg) : "";
    err->message = std::move(msg);
  }
  return false;
}

bool schema_fail(ParseError *err, std::string loc, std::string msg) {
  return fail(err, ParseError::Kind::Schema, std::move(loc), std::move(msg));
}

// "nodes[2].position.x" -> "body","nodes",2,"position","x"
std::string loc_to_json(const std::string &loc) {
  std::string out = R"(["body")";
  std::string part;
  auto flush = [&](bool index) {
    if (part.empty())
      return;
    if (index)
      out += "," + part;
    else
      out += fmt::format(R"(,"{}")", http::json_escape(part));
    part.clear();
  };
  for (char c : loc) {
    if (c == '.' || c == '[')
      flush(false);
    else if (c == ']')
      flush(true);
    else
      part.push_back(c);
  }
  flush(false);
  return out + "]";
}

std::string field(const std::string &loc, const char *key) {
  return loc + "." + key;
}

bool read_string(const Json::Value &obj, const char *key,
                 const std::string &loc, std::string &out, ParseError *err) {
  if (!obj.isMember(key))
    return schema_fail(err, field(loc, key), kRequired);
  const Json::Value &v = obj[key];
  if (!v.isString())
    return schema_fail(err, field(loc, key), kNotString);
  out = v.asString();
  return true;
}

bool read_opt_string(const Json::Value &obj, const char *key,
                     const std::string &loc, std::optional<std::string> &out,
                     ParseError *err) {
  const Json::Value &v = obj[key];
  if (v.isNull())
    return true;
  if (!v.isString())
    return schema_fail(err, field(loc, key), kNotString);
  out = v.asString();
  return true;
}

bool read_node(const Json::Value &v, const std::string &loc, Node &n,
               ParseError *err) {
  if (!v.isObject())
    return schema_fail(err, loc, kNotObject);
  if (!read_string(v, "id", loc, n.id, err))
    return false;
  if (!read_opt_string(v, "type", loc, n.type, err))
    return false;

  const Json::Value &pos = v["position"];
  if (!pos.isNull()) {
    if (!pos.isObject())
      return schema_fail(err, field(loc, "position"),
                         kNotObject);
    std::map<std::string, double> coords;
    for (const auto &name : pos.getMemberNames()) {
      const Json::Value &c = pos[name];
      if (!c.isNumeric())
        return schema_fail(err, field(loc, "position") + "." + name,
                           kNotNumber);
      coords[name] = c.asDouble();
    }
    n.position = std::move(coords);
  }

  const Json::Value &data = v["data"];
  if (!data.isNull() && !data.isObject())
    return schema_fail(err, field(loc, "data"), kNotObject);
  n.data = data;
  return true;
}

bool read_edge(const Json::Value &v, const std::string &loc, Edge &e,
               ParseError *err) {
  if (!v.isObject())
    return schema_fail(err, loc, kNotObject);
  return read_opt_string(v, "id", loc, e.id, err) &&
         read_string(v, "source", loc, e.source, err) &&
         read_string(v, "target", loc, e.target, err) &&
         read_opt_string(v, "sourceHandle", loc, e.source_handle, err) &&
         read_opt_string(v, "targetHandle", loc, e.target_handle, err);
}

bool read_array(const Json::Value &root, const char *key, ParseError *err) {
  if (!root.isMember(key))
    return schema_fail(err, key, kRequired);
  if (!root[key].isArray())
    return schema_fail(err, key, kNotList);
  return true;
}

} // namespace

std::optional<PipelineRequest> parse_pipeline(const std::string &body,
                                              ParseError *err) {
  Json::CharReaderBuilder builder;
  builder["allowComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  const char *begin = body.data();
  if (!reader->parse(begin, begin + body.size(), &root, &errs)) {
    while (!errs.empty() && (errs.back() == '\n' || errs.back() == ' '))
      errs.pop_back();
    fail(err, ParseError::Kind::Syntax, "", "invalid JSON: " + errs);
    return std::nullopt;
  }
  if (!root.isObject()) {
    schema_fail(err, "", "request body should be an object");
    return std::nullopt;
  }
  if (!read_array(root, "nodes", err) || !read_array(root, "edges", err))
    return std::nullopt;

  PipelineRequest p;
  const Json::Value &nodes = root["nodes"];
  p.nodes.resize(nodes.size());
  for (Json::ArrayIndex i = 0; i < nodes.size(); ++i) {
    if (!read_node(nodes[i], fmt::format("nodes[{}]", i), p.nodes[i], err))
      return std::nullopt;
  }
  const Json::Value &edges = root["edges"];
  p.edges.resize(edges.size());
  for (Json::ArrayIndex i = 0; i < edges.size(); ++i) {
    if (!read_edge(edges[i], fmt::format("edges[{}]", i), p.edges[i], err))
      return std::nullopt;
  }
  return p;
}

std::vector<std::string> node_ids(const PipelineRequest &p) {
  std::vector<std::string> out;
  out.reserve(p.nodes.size());
  for (const auto &n : p.nodes)
    out.push_back(n.id);
  return out;
}

EdgeList edge_pairs(const PipelineRequest &p) {
  EdgeList out;
  out.reserve(p.edges.size());
  for (const auto &e : p.edges)
    out.emplace_back(e.source, e.target);
  return out;
}

PipelineSummary summarize(const PipelineRequest &p, Traversal mode) {
  PipelineSummary s;
  s.num_nodes = p.nodes.size();
  s.num_edges = p.edges.size();
  auto res = check_dag(node_ids(p), edge_pairs(p), mode);
  s.num_edges_resolved = res.resolved_edges;
  s.is_dag = res.acyclic;
  return s;
}

std::string summary_to_json(const PipelineSummary &s) {
  return fmt::format(
      R"({{"num_nodes":{},"num_edges":{},"num_edges_resolved":{},"is_dag":{}}})",
      s.num_nodes, s.num_edges, s.num_edges_resolved,
      s.is_dag ? "true" : "false");
}

std::string validation_error_json(const ParseError &err) {
  return fmt::format(R"({{"detail":[{{"type":"{}","loc":{},"msg":"{}"}}]}})",
                     err.type, loc_to_json(err.loc),
                     http::json_escape(err.message));
}

} // namespace pipedag
