/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"
#include <stdexcept>

namespace tasksmind::infrastructure {

using json = nlohmann::json;
using namespace tasksmind::domain;

namespace {

bool HasValue(const json& j, const char* key) {
    return j.contains(key) && !j[key].is_null();
}

std::string RequireString(const json& j, const char* key) {
    if (!HasValue(j, key) || !j[key].is_string()) {
        throw std::invalid_argument(std::string("Missing or non-string field: ") + key);
    }
    return j[key].get<std::string>();
}

std::string OptionalString(const json& j, const char* key, const std::string& fallback = "") {
    if (!HasValue(j, key)) return fallback;
    return j[key].get<std::string>();
}

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

json DateToJson(const std::optional<Date>& date) {
    if (!date) return nullptr;
    return date->toIsoString();
}

} // namespace

Date JsonCodec::DateFromString(const std::string& text, const std::string& field) {
    auto date = Date::Parse(text);
    if (!date) {
        throw std::invalid_argument("Invalid date for " + field + ": " + text);
    }
    return *date;
}

json JsonCodec::ToJson(const TaskSnapshot& task) {
    return {
        {"id", task.id},
        {"title", task.title},
        {"description", task.description},
        {"classification", ClassificationToString(task.classification)},
        {"suspense_date", task.suspenseDate.toIsoString()},
        {"originator", task.originator},
        {"org_unit_id", task.orgUnitId},
        {"record_series_id", OptionalToJson(task.recordSeriesId)},
        {"tags", task.tags},
        {"priority_score", task.priorityScore.value_or(0.0)},
        {"status", StatusToString(task.status)}
    };
}

json JsonCodec::ToJson(const application::TaskDetails& details) {
    json j = ToJson(details.task);
    j["assignments"] = json::array();
    for (const auto& a : details.assignments) {
        j["assignments"].push_back(ToJson(a));
    }
    return j;
}

json JsonCodec::ToJson(const AssignmentRecord& assignment) {
    return {
        {"id", assignment.id},
        {"task_id", assignment.taskId},
        {"assignee_type", AssigneeTypeToString(assignment.assigneeType)},
        {"assignee_id", assignment.assigneeId},
        {"role", assignment.role},
        {"due_override_date", DateToJson(assignment.dueOverrideDate)},
        {"state", assignment.state},
        {"rationale", assignment.rationale}
    };
}

json JsonCodec::ToJson(const Comment& comment) {
    return {
        {"id", comment.id},
        {"task_id", comment.taskId},
        {"author_user_id", comment.authorUserId},
        {"body", comment.body},
        {"parent_comment_id", OptionalToJson(comment.parentCommentId)}
    };
}

json JsonCodec::ToJson(const AuthoritySuggestion& s) {
    return {
        {"authority_id", s.authorityId},
        {"title", s.title},
        {"org_unit_id", s.orgUnitId},
        {"grade", s.grade},
        {"confidence", s.confidence},
        {"rationale", s.rationale}
    };
}

json JsonCodec::ToJson(const RiskInsight& insight) {
    return {
        {"task_id", insight.taskId},
        {"risk_level", RiskLevelToString(insight.riskLevel)},
        {"late_probability", insight.lateProbability},
        {"drivers", insight.drivers},
        {"recommended_actions", insight.recommendedActions}
    };
}

json JsonCodec::ToJson(const QualityCheckResult& result) {
    json issues = json::array();
    for (const auto& issue : result.issues) {
        issues.push_back({
            {"code", issue.code},
            {"severity", SeverityToString(issue.severity)},
            {"message", issue.message}
        });
    }
    return {
        {"task_id", result.taskId},
        {"issues", issues},
        {"passed", result.passed}
    };
}

json JsonCodec::ToJson(const TaskSummary& summary) {
    return {
        {"summary", summary.summary},
        {"risk_level", RiskLevelToString(summary.riskLevel)},
        {"key_points", summary.keyPoints}
    };
}

json JsonCodec::ToJson(const Authority& authority) {
    return {
        {"id", authority.id},
        {"title", authority.title},
        {"org_unit_id", authority.orgUnitId},
        {"grade", authority.grade},
        {"authority_scope", authority.scope}
    };
}

TaskSnapshot JsonCodec::TaskFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Task payload must be a JSON object");
    }

    TaskSnapshot task;
    task.id = OptionalString(j, "id");
    task.title = RequireString(j, "title");
    task.description = RequireString(j, "description");
    task.classification = ParseClassification(OptionalString(j, "classification", "unclassified"));
    task.suspenseDate = DateFromString(RequireString(j, "suspense_date"), "suspense_date");
    task.originator = RequireString(j, "originator");
    task.orgUnitId = RequireString(j, "org_unit_id");
    if (HasValue(j, "status")) {
        task.status = ParseStatus(j["status"].get<std::string>());
    }
    if (HasValue(j, "record_series_id")) {
        task.recordSeriesId = j["record_series_id"].get<std::string>();
    }
    if (HasValue(j, "tags")) {
        task.tags = j["tags"].get<std::vector<std::string>>();
    }
    return task;
}

application::TaskPatch JsonCodec::TaskPatchFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Task patch must be a JSON object");
    }

    application::TaskPatch patch;
    if (HasValue(j, "title")) patch.title = j["title"].get<std::string>();
    if (HasValue(j, "description")) patch.description = j["description"].get<std::string>();
    if (HasValue(j, "classification")) patch.classification = ParseClassification(j["classification"].get<std::string>());
    if (HasValue(j, "suspense_date")) patch.suspenseDate = DateFromString(j["suspense_date"].get<std::string>(), "suspense_date");
    if (HasValue(j, "originator")) patch.originator = j["originator"].get<std::string>();
    if (HasValue(j, "org_unit_id")) patch.orgUnitId = j["org_unit_id"].get<std::string>();
    if (HasValue(j, "record_series_id")) patch.recordSeriesId = j["record_series_id"].get<std::string>();
    if (HasValue(j, "status")) patch.status = ParseStatus(j["status"].get<std::string>());
    if (HasValue(j, "tags")) patch.tags = j["tags"].get<std::vector<std::string>>();
    return patch;
}

AssignmentRecord JsonCodec::AssignmentFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Assignment payload must be a JSON object");
    }

    AssignmentRecord a;
    a.assigneeType = ParseAssigneeType(OptionalString(j, "assignee_type", "org"));
    a.assigneeId = RequireString(j, "assignee_id");
    a.role = RequireString(j, "role");
    a.state = OptionalString(j, "state", "pending");
    a.rationale = OptionalString(j, "rationale");
    if (HasValue(j, "due_override_date")) {
        a.dueOverrideDate = DateFromString(j["due_override_date"].get<std::string>(), "due_override_date");
    }
    return a;
}

Comment JsonCodec::CommentFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Comment payload must be a JSON object");
    }

    Comment c;
    c.authorUserId = RequireString(j, "author_user_id");
    c.body = RequireString(j, "body");
    if (HasValue(j, "parent_comment_id")) {
        c.parentCommentId = j["parent_comment_id"].get<long>();
    }
    return c;
}

OrgUnit JsonCodec::OrgUnitFromJson(const json& j) {
    OrgUnit unit;
    unit.id = RequireString(j, "id");
    unit.name = OptionalString(j, "name", unit.id);
    unit.echelon = OptionalString(j, "echelon");
    if (HasValue(j, "parent_id")) {
        unit.parentId = j["parent_id"].get<std::string>();
    }
    return unit;
}

Authority JsonCodec::AuthorityFromJson(const json& j) {
    Authority authority;
    authority.id = RequireString(j, "id");
    authority.title = RequireString(j, "title");
    authority.orgUnitId = RequireString(j, "org_unit_id");
    authority.grade = OptionalString(j, "grade");
    if (HasValue(j, "authority_scope")) {
        authority.scope = j["authority_scope"].get<std::vector<std::string>>();
    }
    return authority;
}

} // namespace tasksmind::infrastructure
