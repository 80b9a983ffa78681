#pragma once

#include "ReportFormatter.h"

#include <iosfwd>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ToolInfo {
  const char *name;
  const char *description;
};

// Line-oriented JSON tool protocol.
//   request:  {"id": ..., "tool": "get_aurora_forecast",
//              "arguments": {"latitude": 64.8, "longitude": -147.7}}
//   response: {"id": ..., "ok": true, "text": "..."}
//             {"id": ..., "ok": false, "error": "..."}
class ToolServer {
public:
  explicit ToolServer(ReportFormatter &reports);

  // Reads requests until EOF. One response line per non-blank input line.
  void run(std::istream &in, std::ostream &out);

  // Never throws; failures become {"ok": false}.
  nlohmann::json handle(const nlohmann::json &request);
  std::string handleLine(const std::string &line);

  // Runs one tool. Throws on unknown tools, bad arguments and tool errors.
  std::string call(const std::string &tool, const nlohmann::json &args);

  static const std::vector<ToolInfo> &tools();

private:
  ReportFormatter &reports_;
};
