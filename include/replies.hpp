#pragma once
#include "collaborators.hpp"
#include <string>

// Pulls the first balanced {...} object out of model output; "" if none.
std::string extract_first_json_object(const std::string& text);

// Parsers for the JSON replies of a chat model; CollaboratorError when the
// reply is unusable.
SummaryResult parse_summary_reply(const std::string& raw);
GradeResult parse_grade_reply(const std::string& raw);
