#include "replies.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string extract_first_json_object(const std::string& text) {
  size_t start = text.find('{');
  if (start == std::string::npos) return "";
  int depth = 0;
  bool in_string = false, escaped = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (in_string) {
      if (escaped) escaped = false;
      else if (c == '\\') escaped = true;
      else if (c == '"') in_string = false;
      continue;
    }
    if (c == '"') in_string = true;
    else if (c == '{') depth++;
    else if (c == '}') {
      if (--depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return "";
}

static json parse_reply(const std::string& raw, const char* role) {
  std::string obj = extract_first_json_object(raw);
  if (obj.empty()) throw CollaboratorError(std::string(role) + ": reply has no JSON object");
  try {
    return json::parse(obj);
  } catch (const json::exception& e) {
    throw CollaboratorError(std::string(role) + ": bad JSON reply: " + e.what());
  }
}

SummaryResult parse_summary_reply(const std::string& raw) {
  json j = parse_reply(raw, "summarize");
  SummaryResult r;
  try {
    r.text = j.value("summary", j.value("text", std::string()));
    r.confidence = j.value("confidence", 0.5);
    if (j.contains("citations") && j["citations"].is_array()) {
      for (auto& c : j["citations"]) r.citations.push_back(c.get<std::string>());
    }
  } catch (const json::exception& e) {
    throw CollaboratorError(std::string("summarize: unexpected reply: ") + e.what());
  }
  if (trim(r.text).empty()) throw CollaboratorError("summarize: empty summary");
  return r;
}

GradeResult parse_grade_reply(const std::string& raw) {
  json j = parse_reply(raw, "grade");
  GradeResult g;
  std::string status;
  try {
    status = to_lower(trim(j.value("status", std::string())));
    g.rationale = j.value("rationale", std::string());
  } catch (const json::exception& e) {
    throw CollaboratorError(std::string("grade: unexpected reply: ") + e.what());
  }
  if (status == "supported") g.status = ClaimStatus::Supported;
  else if (status == "contradicted") g.status = ClaimStatus::Contradicted;
  else if (status == "uncertain") g.status = ClaimStatus::Uncertain;
  else throw CollaboratorError("grade: unknown status '" + status + "'");
  return g;
}
