#include <cassert>
#include <iostream>
#include <stdexcept>

#include "infrastructure/JsonCodec.hpp"
#include "test/TestSupport.hpp"

using namespace tasksmind::domain;
using tasksmind::infrastructure::JsonCodec;
using json = nlohmann::json;

namespace {

json CreatePayload() {
    return json::parse(R"({
        "title": "Readiness report",
        "description": "Provide readiness numbers for all brigades.",
        "classification": "S",
        "suspense_date": "2026-10-20",
        "originator": "HQDA G-3/5/7",
        "org_unit_id": "DIV-3ID-G3",
        "tags": ["readiness", "training"]
    })");
}

template <typename Fn>
bool ThrowsInvalid(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestTaskDecoding() {
    TaskSnapshot task = JsonCodec::TaskFromJson(CreatePayload());
    assert(task.id.empty());
    assert(task.title == "Readiness report");
    assert(task.classification == Classification::Secret);
    assert(task.suspenseDate == Date(2026, 10, 20));
    assert(task.status == TaskStatus::Draft);
    assert(!task.recordSeriesId);
    assert(!task.priorityScore);
    assert((task.tags == std::vector<std::string>{"readiness", "training"}));

    for (const char* key : {"title", "description", "suspense_date", "originator", "org_unit_id"}) {
        json payload = CreatePayload();
        payload.erase(key);
        assert(ThrowsInvalid([&] { JsonCodec::TaskFromJson(payload); }));
    }

    json badDate = CreatePayload();
    badDate["suspense_date"] = "2026-02-30";
    assert(ThrowsInvalid([&] { JsonCodec::TaskFromJson(badDate); }));
    assert(ThrowsInvalid([] { JsonCodec::TaskFromJson(json::array()); }));

    json withStatus = CreatePayload();
    withStatus["status"] = "In-Work";
    withStatus["record_series_id"] = "25-50a";
    withStatus["classification"] = "top_secret";
    task = JsonCodec::TaskFromJson(withStatus);
    assert(task.status == TaskStatus::InWork);
    assert(task.recordSeriesId && *task.recordSeriesId == "25-50a");
    assert(task.classification == Classification::TopSecret);
}

void TestTaskEncoding() {
    tasksmind::application::TaskDetails details;
    details.task = JsonCodec::TaskFromJson(CreatePayload());
    details.task.id = "T-26-000001";
    details.task.priorityScore = 0.88;
    details.task.status = TaskStatus::Open;

    AssignmentRecord owner;
    owner.id = 1;
    owner.taskId = "T-26-000001";
    owner.assigneeId = "OPS_G3";
    owner.role = "owner";
    owner.rationale = "Matched keyword 'readiness' with org G3 Operations";
    details.assignments.push_back(owner);

    json j = JsonCodec::ToJson(details);
    assert(j["id"] == "T-26-000001");
    assert(j["classification"] == "secret");
    assert(j["suspense_date"] == "2026-10-20");
    assert(j["status"] == "open");
    assert(j["priority_score"].get<double>() == 0.88);
    assert(j["record_series_id"].is_null());
    assert(j["assignments"].size() == 1);
    assert(j["assignments"][0]["assignee_type"] == "org");
    assert(j["assignments"][0]["state"] == "pending");
    assert(j["assignments"][0]["due_override_date"].is_null());
}

void TestAssignmentAndComment() {
    AssignmentRecord a = JsonCodec::AssignmentFromJson(json::parse(R"({
        "assignee_type": "user", "assignee_id": "user-42", "role": "support",
        "due_override_date": "2026-10-19"
    })"));
    assert(a.assigneeType == AssigneeType::User);
    assert(a.state == "pending");
    assert(a.dueOverrideDate && *a.dueOverrideDate == Date(2026, 10, 19));
    assert(JsonCodec::ToJson(a)["due_override_date"] == "2026-10-19");
    assert(ThrowsInvalid([] { JsonCodec::AssignmentFromJson(json{{"assignee_id", "x"}}); }));

    Comment c = JsonCodec::CommentFromJson(json{{"author_user_id", "user-7"}, {"body", "Noted."}, {"parent_comment_id", 3}});
    assert(c.parentCommentId && *c.parentCommentId == 3);
    json cj = JsonCodec::ToJson(c);
    assert(cj["parent_comment_id"] == 3);
    assert(ThrowsInvalid([] { JsonCodec::CommentFromJson(json{{"author_user_id", "user-7"}}); }));
}

void TestPatch() {
    auto patch = JsonCodec::TaskPatchFromJson(json{{"status", "overdue"}, {"tags", json::array()}});
    assert(patch.status && *patch.status == TaskStatus::Overdue);
    assert(patch.tags && patch.tags->empty());
    assert(!patch.title && !patch.suspenseDate && !patch.orgUnitId);

    assert(ThrowsInvalid([] { JsonCodec::TaskPatchFromJson(json{{"suspense_date", "soon"}}); }));
}

void TestInsightEncoding() {
    RiskInsight risk{"T-26-000001", RiskLevel::Amber, 0.5, {"Moderate urgency from suspense/prior history"}, {"Confirm staffing plan"}};
    json rj = JsonCodec::ToJson(risk);
    assert(rj["risk_level"] == "amber");
    assert(rj["late_probability"].get<double>() == 0.5);
    assert(rj["drivers"].size() == 1);

    QualityCheckResult quality{"T-26-000001", {{"DESC_LEN", Severity::Medium, "Description is brief; Army 25-50 recommends more context."}}, false};
    json qj = JsonCodec::ToJson(quality);
    assert(qj["issues"][0]["severity"] == "medium");
    assert(qj["passed"] == false);

    AuthoritySuggestion s{"AUTH-1", "G3 Chief", "DIV-3ID-G3", "O6", 0.9, "Authority aligned with org DIV-3ID-G3 (tier 1)"};
    assert(JsonCodec::ToJson(s)["authority_id"] == "AUTH-1");

    TaskSummary summary{"Task T-26-000001 ...", RiskLevel::Red, {"High priority task"}};
    assert(JsonCodec::ToJson(summary)["key_points"][0] == "High priority task");
}

void TestOrgSeedDecoding() {
    OrgUnit unit = JsonCodec::OrgUnitFromJson(json{{"id", "JA"}});
    assert(unit.name == "JA");
    assert(!unit.parentId);
    assert(ThrowsInvalid([] { JsonCodec::OrgUnitFromJson(json{{"name", "No id"}}); }));

    Authority authority = JsonCodec::AuthorityFromJson(json{
        {"id", "AUTH-6"}, {"title", "Staff Judge Advocate"}, {"org_unit_id", "JA"},
        {"authority_scope", {"legal"}}});
    assert(authority.scope.size() == 1);
    assert(JsonCodec::ToJson(authority)["authority_scope"][0] == "legal");
    assert(ThrowsInvalid([] { JsonCodec::AuthorityFromJson(json{{"id", "AUTH-7"}, {"title", "X"}}); }));
}

} // namespace

int main() {
    std::cout << "[Test] Starting JsonCodec Test..." << std::endl;

    TestTaskDecoding();
    TestTaskEncoding();
    TestAssignmentAndComment();
    TestPatch();
    TestInsightEncoding();
    TestOrgSeedDecoding();

    std::cout << "[PASS] JsonCodec Test." << std::endl;
    return 0;
}
