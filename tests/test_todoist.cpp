#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "todoist.hpp"

using nlohmann::json;

TEST(TodoistNormalizeTest, TimedDue) {
    const json obj = json::parse(R"({
        "id": "6Xq2",
        "content": "Write report",
        "description": "Draft 25m",
        "priority": 3,
        "labels": ["work", "#dontchangetime"],
        "checked": false,
        "due": {"date": "2026-10-14T16:30:00", "datetime": "2026-10-14T16:30:00",
                "is_recurring": false, "string": "oct 14 4:30pm"}
    })");

    const Task task = TodoistClient::NormalizeTask(obj);

    EXPECT_EQ(task.id, "6Xq2");
    EXPECT_EQ(task.content, "Write report");
    EXPECT_EQ(task.description, "Draft 25m");
    EXPECT_EQ(task.priority, 3);
    EXPECT_FALSE(task.completed);
    EXPECT_TRUE(task.HasLabel("#dontchangetime"));
    ASSERT_TRUE(task.due.has_value());
    EXPECT_FALSE(task.IsDateOnly());
    EXPECT_EQ(task.due->Instant(), At(Day(2026, 10, 14), 16, 30));
}

TEST(TodoistNormalizeTest, DateOnlyRecurringDue) {
    const json obj = json::parse(R"({
        "id": 123456789,
        "content": "Stretch",
        "due": {"date": "2026-10-12", "is_recurring": true, "string": "every weekday"}
    })");

    const Task task = TodoistClient::NormalizeTask(obj);

    EXPECT_EQ(task.id, "123456789");
    EXPECT_EQ(task.priority, 1);
    ASSERT_TRUE(task.due.has_value());
    EXPECT_TRUE(task.IsDateOnly());
    EXPECT_TRUE(task.IsRecurring());
    EXPECT_EQ(task.due->date, Day(2026, 10, 12));
    EXPECT_EQ(task.due->recurrence, "every weekday");
}

TEST(TodoistNormalizeTest, CompletionFlags) {
    EXPECT_TRUE(TodoistClient::NormalizeTask(json::parse(R"({"id":"1","checked":true})")).completed);
    EXPECT_TRUE(
        TodoistClient::NormalizeTask(json::parse(R"({"id":"2","is_completed":true})")).completed);
    EXPECT_TRUE(TodoistClient::NormalizeTask(
                    json::parse(R"({"id":"3","completed_at":"2026-10-14T10:00:00Z"})"))
                    .completed);
    EXPECT_FALSE(
        TodoistClient::NormalizeTask(json::parse(R"({"id":"4","completed_at":null})")).completed);
}

TEST(TodoistNormalizeTest, MissingOrBrokenDueMeansNoDue) {
    EXPECT_FALSE(TodoistClient::NormalizeTask(json::parse(R"({"id":"1"})")).due.has_value());
    EXPECT_FALSE(
        TodoistClient::NormalizeTask(json::parse(R"({"id":"2","due":null})")).due.has_value());
    EXPECT_FALSE(TodoistClient::NormalizeTask(json::parse(R"({"id":"3","due":{"date":"soon"}})"))
                     .due.has_value());
}

TEST(TodoistUpdateBodyTest, OnlySetFieldsAreSent) {
    TaskUpdate update;
    update.due_datetime = At(Day(2026, 10, 14), 15, 5);
    update.description = "Draft 25m";

    const json body = TodoistClient::UpdateBody(update);

    EXPECT_EQ(body["due_datetime"], "2026-10-14T15:05:00");
    EXPECT_EQ(body["description"], "Draft 25m");
    EXPECT_FALSE(body.contains("due_string"));
    EXPECT_FALSE(body.contains("priority"));
}

TEST(TodoistUpdateBodyTest, RecurrenceAndPriority) {
    TaskUpdate update;
    update.due_string = "every weekday";
    update.priority = 4;

    const json body = TodoistClient::UpdateBody(update);

    EXPECT_EQ(body.size(), 2u);
    EXPECT_EQ(body["due_string"], "every weekday");
    EXPECT_EQ(body["priority"], 4);
}

TEST(TodoistClientTest, BlockingCallsAreBounded) {
    EXPECT_LE(TODOIST_CONNECT_TIMEOUT, 3);
    EXPECT_LE(TODOIST_IO_TIMEOUT, 10);
}
