#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "domain/engine/AssignmentGenerator.hpp"
#include "domain/engine/RoutingRecommender.hpp"
#include "test/TestSupport.hpp"

using namespace tasksmind::domain;
using namespace tasksmind::domain::engine;
using tasksmind::test::FakeDirectory;
using tasksmind::test::MakeTask;

int main() {
    std::cout << "[Test] Starting RoutingRecommender Test..." << std::endl;

    auto directory = std::make_shared<FakeDirectory>();
    directory->addUnit("DIV-3ID", "3rd Infantry Division");
    directory->addUnit("OPS_G3", "G3 Operations", "DIV-3ID");
    directory->addUnit("DIV-3ID-G3", "3ID G3", "OPS_G3");
    directory->addUnit("JA", "Staff Judge Advocate", "DIV-3ID");

    RoutingRecommender router(directory);

    // Keyword in tags routes to the mapped section.
    {
        TaskSnapshot task = MakeTask();
        task.tags = {"readiness"};
        RoutingDecision d = router.recommend(task);
        assert(d.orgUnitId == "OPS_G3");
        assert(d.rationale == "Matched keyword 'readiness' with org G3 Operations");
    }

    // Title text is scanned as well.
    {
        TaskSnapshot task = MakeTask();
        task.title = "Legal review of range closure";
        RoutingDecision d = router.recommend(task);
        assert(d.orgUnitId == "JA");
        assert(d.rationale == "Matched keyword 'legal' with org Staff Judge Advocate");
    }

    // Map order decides between several keywords, not text order.
    {
        TaskSnapshot task = MakeTask();
        task.description = "Legal sign-off needed before the training exercise begins.";
        assert(router.recommend(task).orgUnitId == "OPS_G3");
    }

    // A keyword whose section is absent is skipped; scanning continues.
    {
        TaskSnapshot task = MakeTask();
        task.tags = {"intel", "legal"};
        RoutingDecision d = router.recommend(task);
        assert(d.orgUnitId == "JA");
    }

    // No resolvable keyword: the originating unit.
    {
        TaskSnapshot task = MakeTask();
        task.tags = {"logistics"};
        RoutingDecision d = router.recommend(task);
        assert(d.orgUnitId == "DIV-3ID-G3");
        assert(d.rationale == "Defaulted to originating org");
    }

    // Unknown originating unit: the raw id is returned.
    {
        TaskSnapshot task = MakeTask();
        task.orgUnitId = "BDE-UNKNOWN";
        RoutingDecision d = router.recommend(task);
        assert(d.orgUnitId == "BDE-UNKNOWN");
        assert(d.rationale == "No org metadata available; used provided org_unit_id");
    }

    // A failing hierarchy degrades to the raw id instead of throwing.
    {
        auto broken = std::make_shared<FakeDirectory>();
        broken->throwOnLookup = true;
        RoutingRecommender degraded(broken);
        TaskSnapshot task = MakeTask();
        task.tags = {"readiness"};
        RoutingDecision d = degraded.recommend(task);
        assert(d.orgUnitId == "DIV-3ID-G3");
        assert(d.rationale == "No org metadata available; used provided org_unit_id");
    }

    // Keyword table bound at construction.
    {
        EngineConfig config;
        config.keywordRoutes = {{"Range", "DIV-3ID"}};
        RoutingRecommender custom(directory, config);
        TaskSnapshot task = MakeTask();
        task.description = "Range safety certification for all units.";
        RoutingDecision d = custom.recommend(task);
        assert(d.orgUnitId == "DIV-3ID");
        assert(d.rationale == "Matched keyword 'Range' with org 3rd Infantry Division");
    }

    bool threw = false;
    try {
        RoutingRecommender invalid(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // The generated assignment carries the routing decision.
    {
        AssignmentGenerator generator(std::make_shared<RoutingRecommender>(directory));
        TaskSnapshot task = MakeTask("T-26-000042");
        task.tags = {"training"};
        AssignmentRecord a = generator.generate(task);
        assert(a.taskId == "T-26-000042");
        assert(a.assigneeType == AssigneeType::Organization);
        assert(AssigneeTypeToString(a.assigneeType) == "org");
        assert(a.assigneeId == "OPS_G3");
        assert(a.role == "owner");
        assert(a.state == "pending");
        assert(a.rationale == "Matched keyword 'training' with org G3 Operations");
        assert(a.id == 0);
    }

    std::cout << "[PASS] RoutingRecommender Test." << std::endl;
    return 0;
}
