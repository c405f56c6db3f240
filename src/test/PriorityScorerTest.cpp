#include <cassert>
#include <iostream>

#include "domain/engine/PriorityScorer.hpp"
#include "test/TestSupport.hpp"

using namespace tasksmind::domain;
using namespace tasksmind::domain::engine;
using tasksmind::test::IsTwoDecimal;
using tasksmind::test::kToday;
using tasksmind::test::MakeTask;
using tasksmind::test::Near;

int main() {
    std::cout << "[Test] Starting PriorityScorer Test..." << std::endl;

    PriorityScorer scorer;

    // Headquarters originator, five days out, two section keywords, open.
    // 0.2 + 0.35*0.7 + 0.25*1.0 + 0.15*0.4 + 0.05*0.7 = 0.79
    {
        TaskSnapshot task = MakeTask();
        task.originator = "HQDA DCS G-3/5/7";
        task.suspenseDate = kToday.addDays(5);
        task.tags = {"readiness", "training"};
        task.status = TaskStatus::Open;
        assert(Near(scorer.score(task, kToday), 0.79));

        // Two days out moves urgency to 0.85: 0.8425 rounds to 0.84.
        task.suspenseDate = kToday.addDays(2);
        assert(Near(scorer.score(task, kToday), 0.84));
    }

    // Urgency steps.
    assert(Near(scorer.urgencyScore(kToday.addDays(-3), kToday), 1.0));
    assert(Near(scorer.urgencyScore(kToday, kToday), 1.0));
    assert(Near(scorer.urgencyScore(kToday.addDays(1), kToday), 0.85));
    assert(Near(scorer.urgencyScore(kToday.addDays(3), kToday), 0.85));
    assert(Near(scorer.urgencyScore(kToday.addDays(4), kToday), 0.7));
    assert(Near(scorer.urgencyScore(kToday.addDays(7), kToday), 0.7));
    assert(Near(scorer.urgencyScore(kToday.addDays(14), kToday), 0.5));
    assert(Near(scorer.urgencyScore(kToday.addDays(15), kToday), 0.3));

    // Urgency never decreases as the deadline approaches.
    double previous = 0.0;
    for (long days = 60; days >= -5; --days) {
        const double u = scorer.urgencyScore(kToday.addDays(days), kToday);
        assert(u >= previous);
        previous = u;
    }

    // Originator table: case-insensitive substring, first entry wins.
    assert(Near(scorer.originatorScore("hqda g-3"), 1.0));
    assert(Near(scorer.originatorScore("ACOM G-4"), 0.85));
    assert(Near(scorer.originatorScore("USARPAC (ASCC)"), 0.8));
    assert(Near(scorer.originatorScore("dru staff"), 0.75));
    assert(Near(scorer.originatorScore("ACOM tasker relayed from HQDA"), 1.0));
    assert(Near(scorer.originatorScore("DIV HQ"), 0.6));
    assert(Near(scorer.originatorScore(""), 0.6));
    {
        EngineConfig config;
        config.priority.originators = {{"ACOM", 0.85}, {"HQDA", 1.0}};
        PriorityScorer reordered(config);
        assert(Near(reordered.originatorScore("ACOM tasker relayed from HQDA"), 0.85));
    }

    // Keyword boost counts each keyword once across tags and description.
    assert(Near(scorer.keywordBoost({}, ""), 0.0));
    assert(Near(scorer.keywordBoost({"policy"}, "Draft mobilization policy"), 0.0));
    assert(Near(scorer.keywordBoost({"Legal"}, ""), 0.3));
    assert(Near(scorer.keywordBoost({"legal", "legal"}, "legal review"), 0.3));
    assert(Near(scorer.keywordBoost({"intel"}, "Logistics estimate"), 0.4));
    assert(Near(scorer.keywordBoost({"intel", "legal"}, "personnel and chaplain support"), 0.4));

    // Status weights with the default for anything else.
    assert(Near(scorer.statusWeight(TaskStatus::Draft), 0.4));
    assert(Near(scorer.statusWeight(TaskStatus::InWork), 0.6));
    assert(Near(scorer.statusWeight(TaskStatus::Open), 0.7));
    assert(Near(scorer.statusWeight(TaskStatus::Overdue), 1.0));
    assert(Near(scorer.statusWeight(TaskStatus::Closed), 0.5));
    assert(Near(scorer.statusWeight(TaskStatus::Unknown), 0.5));

    // Bounds and rounding across a spread of inputs.
    const std::vector<std::string> originators = {"HQDA", "ACOM", "somebody", ""};
    const std::vector<TaskStatus> statuses = {TaskStatus::Draft, TaskStatus::Open, TaskStatus::Overdue, TaskStatus::Unknown};
    const std::vector<std::vector<std::string>> tagSets = {{}, {"intel"}, {"readiness", "legal", "chaplain"}};
    for (long days : {-10L, 0L, 2L, 6L, 10L, 90L}) {
        for (const auto& originator : originators) {
            for (TaskStatus status : statuses) {
                for (const auto& tags : tagSets) {
                    TaskSnapshot task = MakeTask();
                    task.suspenseDate = kToday.addDays(days);
                    task.originator = originator;
                    task.status = status;
                    task.tags = tags;
                    const double s = scorer.score(task, kToday);
                    assert(s >= 0.0 && s <= 1.0);
                    assert(IsTwoDecimal(s));
                    assert(s == scorer.score(task, kToday));
                }
            }
        }
    }

    // An inflated base is clamped to 1.0.
    {
        EngineConfig config;
        config.priority.base = 0.8;
        PriorityScorer inflated(config);
        TaskSnapshot task = MakeTask();
        task.originator = "HQDA";
        task.suspenseDate = kToday;
        assert(Near(inflated.score(task, kToday), 1.0));
    }

    // Sums that land on a third-decimal 5 round from the stored binary value.
    {
        // 0.2 + 0.35*0.5 + 0.25*0.8 + 0 + 0.05*0.4 = 0.595
        TaskSnapshot task = MakeTask();
        task.originator = "USARPAC (ASCC)";
        task.suspenseDate = kToday.addDays(10);
        task.status = TaskStatus::Draft;
        assert(scorer.score(task, kToday) == 0.59);

        // 0.2 + 0.35*0.7 + 0.25*0.6 + 0 + 0.05*0.6 = 0.625
        task.originator = "DIV HQ";
        task.suspenseDate = kToday.addDays(5);
        task.status = TaskStatus::InWork;
        assert(scorer.score(task, kToday) == 0.62);

        // 0.2 + 0.35*0.3 + 0.25*0.6 + 0 + 0.05*0.4 = 0.475
        task.suspenseDate = kToday.addDays(30);
        task.status = TaskStatus::Draft;
        assert(scorer.score(task, kToday) == 0.47);
    }

    std::cout << "[PASS] PriorityScorer Test." << std::endl;
    return 0;
}
