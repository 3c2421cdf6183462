#include <set>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "server/intake.hpp"
#include "test/mocks.hpp"
#include "worker.hpp"

using namespace std;
using namespace std::chrono_literals;
using namespace codejudge;
using namespace codejudge::server;
using namespace codejudge::test;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class WorkerTest : public ::testing::Test {
protected:
    faulty_state_store store;
    memory_queue submissions;
    faulty_queue results;
    mock_executor exec;

    submission hello_world(const string &sub_id = "hello-1") {
        submission submit = make_submission(sub_id, language::CPP,
                                            "#include <cstdio>\nint main() { puts(\"Hello, world\"); }",
                                            "", "Hello, world");
        submit.callback_url = "http://localhost:8080/callback";
        return submit;
    }

    /**
     * @brief 模拟 intake：创建 QUEUED 记录并放入提交队列
     */
    void accept(const submission &submit) {
        submission_record record;
        record.sub_id = submit.sub_id;
        record.language = get_language_tag(submit.lang);
        record.callback_url = submit.callback_url;
        record.created_at = time(nullptr);
        ASSERT_TRUE(store.create(record));
        typed_queue<submission>(submissions).enqueue(submit);
    }

    vector<judge_result> published() {
        vector<judge_result> list;
        typed_queue<judge_result> queue(results);
        judge_result result;
        delivery item;
        while (queue.dequeue_one(result, item, 10ms)) {
            list.push_back(result);
            queue.ack(item);
        }
        return list;
    }
};

TEST_F(WorkerTest, AcceptedEndToEnd) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(completed_run(submit.sub_id, "Hello, world\n")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(submissions.size(), 0u);
    EXPECT_EQ(submissions.in_flight(), 0u);

    auto record = store.get(submit.sub_id);
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, submission_status::COMPLETED);
    ASSERT_TRUE(record->result);
    EXPECT_EQ(*record->result, verdict::ACCEPTED);
    EXPECT_EQ(record->memory, 1024);

    auto list = published();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].sub_id, submit.sub_id);
    EXPECT_EQ(list[0].status, submission_status::COMPLETED);
    EXPECT_EQ(list[0].result, verdict::ACCEPTED);
    EXPECT_EQ(list[0].output, "Hello, world\n");
    EXPECT_DOUBLE_EQ(list[0].run_time, 0.01);
    EXPECT_EQ(list[0].callback_url, submit.callback_url);

    EXPECT_FALSE(pipeline.run_once(10ms));
}

TEST_F(WorkerTest, RedeliveryPublishesStoredResult) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).Times(1).WillOnce(Return(completed_run(submit.sub_id, "Hello, world ")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));

    // 同一个提交再次投递，不会再次评测
    typed_queue<submission>(submissions).enqueue(submit);
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(submissions.size(), 0u);

    auto list = published();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].result, verdict::WRONG_ANSWER);
    EXPECT_EQ(list[1].result, verdict::WRONG_ANSWER);
    EXPECT_EQ(list[1].status, submission_status::COMPLETED);
    EXPECT_EQ(list[1].output, list[0].output);
    EXPECT_EQ(*store.get(submit.sub_id)->result, verdict::WRONG_ANSWER);
}

TEST_F(WorkerTest, CompilationErrorHasNoResourceUsage) {
    submission submit = hello_world();
    submit.source_code = "int main() { return }";
    accept(submit);

    execution_result run;
    run.sub_id = submit.sub_id;
    run.outcome = run_outcome::COMPILE_ERROR;
    run.compile_log = "main.cpp:1:21: error: expected primary-expression before '}' token";
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(run));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));

    auto list = published();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].result, verdict::COMPILATION_ERROR);
    EXPECT_EQ(list[0].status, submission_status::COMPLETED);
    EXPECT_EQ(list[0].output, run.compile_log);
    EXPECT_EQ(list[0].run_time, -1);
    EXPECT_EQ(list[0].memory, -1);

    auto record = store.get(submit.sub_id);
    EXPECT_EQ(record->run_time, -1);
    EXPECT_EQ(record->memory, -1);
}

TEST_F(WorkerTest, ExecutorFailureIsInternalError) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).WillOnce(Throw(internal_error("runguard did not produce meta file")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(submissions.in_flight(), 0u);

    auto record = store.get(submit.sub_id);
    EXPECT_EQ(record->status, submission_status::FAILED);
    EXPECT_EQ(*record->result, verdict::INTERNAL_ERROR);

    auto list = published();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].status, submission_status::FAILED);
    EXPECT_EQ(list[0].result, verdict::INTERNAL_ERROR);
    EXPECT_EQ(list[0].output, "runguard did not produce meta file");
}

TEST_F(WorkerTest, StoreFailureReleasesSubmission) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).Times(1).WillOnce(Return(completed_run(submit.sub_id, "Hello, world")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    store.fail_transitions = 1;
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::QUEUED);
    EXPECT_TRUE(published().empty());

    // 消息被放回队列，延迟后重新投递
    EXPECT_EQ(submissions.size(), 1u);
    EXPECT_EQ(submissions.in_flight(), 0u);
    EXPECT_TRUE(pipeline.run_once(5s));

    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::COMPLETED);
    auto list = published();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].result, verdict::ACCEPTED);
}

TEST_F(WorkerTest, PublishFailureRepublishesOnRedelivery) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).Times(1).WillOnce(Return(completed_run(submit.sub_id, "Hello, world")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    results.fail_publishes = 1;
    EXPECT_TRUE(pipeline.run_once(100ms));

    // 终止状态已经写入，但评测结果没有发出
    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::COMPLETED);
    EXPECT_TRUE(published().empty());
    EXPECT_EQ(submissions.size(), 1u);

    EXPECT_TRUE(pipeline.run_once(5s));
    auto list = published();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].result, verdict::ACCEPTED);
    EXPECT_EQ(submissions.size(), 0u);
    EXPECT_EQ(submissions.in_flight(), 0u);
}

TEST_F(WorkerTest, RunningRecordIsJudgedAgain) {
    submission submit = hello_world();
    accept(submit);
    // 之前的 worker 在 RUNNING 状态崩溃
    ASSERT_TRUE(store.transition(submit.sub_id, submission_status::QUEUED, submission_status::RUNNING));
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(completed_run(submit.sub_id, "Hello, world")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::COMPLETED);
    EXPECT_EQ(published().size(), 1u);
}

TEST_F(WorkerTest, MissingRecordIsCreated) {
    submission submit = hello_world("no-record");
    typed_queue<submission>(submissions).enqueue(submit);
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(completed_run(submit.sub_id, "Hello, world")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));

    auto record = store.get("no-record");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->status, submission_status::COMPLETED);
    EXPECT_EQ(record->language, "cpp");
}

TEST_F(WorkerTest, MalformedSubmissionIsDropped) {
    submissions.publish("not json");
    submissions.publish(R"({"submissionId": "bad", "language": "cobol", "sourceCode": "x", "expectedOutput": "", "timeLimit": 1, "memoryLimit": 1024})");
    EXPECT_CALL(exec, execute(_)).Times(0);

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_TRUE(pipeline.run_once(100ms));
    EXPECT_EQ(submissions.size(), 0u);
    EXPECT_EQ(submissions.in_flight(), 0u);
    EXPECT_FALSE(store.get("bad"));
}

TEST_F(WorkerTest, ReportedOutputIsTruncated) {
    submission submit = hello_world();
    execution_result run = completed_run(submit.sub_id, string(REPORT_OUTPUT_LIMIT * 2, 'x'));

    EXPECT_CALL(exec, execute(_)).WillOnce(Return(run));
    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    judge_result result = pipeline.judge(submit);
    EXPECT_EQ(result.result, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.output.length(), REPORT_OUTPUT_LIMIT);
}

TEST_F(WorkerTest, ConcurrentRedeliveryHasOneVerdict) {
    submission submit = hello_world();
    accept(submit);
    // 至少一次投递：同一个提交被投递了多次
    for (int i = 0; i < 3; ++i)
        typed_queue<submission>(submissions).enqueue(submit);

    EXPECT_CALL(exec, execute(_)).WillRepeatedly(Return(completed_run(submit.sub_id, "Hello, world")));

    vector<unique_ptr<judge_pipeline>> pipelines;
    vector<thread> threads;
    for (int i = 0; i < 4; ++i) {
        pipelines.push_back(make_unique<judge_pipeline>(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES));
        threads.emplace_back([&pipeline = *pipelines.back()] {
            while (pipeline.run_once(100ms)) {}
        });
    }
    for (auto &thd : threads) thd.join();

    EXPECT_EQ(submissions.size(), 0u);
    EXPECT_EQ(submissions.in_flight(), 0u);
    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::COMPLETED);

    auto list = published();
    ASSERT_FALSE(list.empty());
    set<verdict> verdicts;
    for (auto &result : list) verdicts.insert(result.result);
    EXPECT_EQ(verdicts.size(), 1u);
}

TEST_F(WorkerTest, MakeJudgeResultFromRecord) {
    submission_record record;
    record.sub_id = "s1";
    record.status = submission_status::COMPLETED;
    record.result = verdict::TIME_LIMIT_EXCEEDED;
    record.run_time = 1.5;
    record.memory = 2048;
    record.callback_url = "https://example.com/hook";

    judge_result result = make_judge_result(record);
    EXPECT_EQ(result.sub_id, "s1");
    EXPECT_EQ(result.status, submission_status::COMPLETED);
    EXPECT_EQ(result.result, verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_DOUBLE_EQ(result.run_time, 1.5);
    EXPECT_EQ(result.memory, 2048);
    EXPECT_EQ(result.callback_url, "https://example.com/hook");
}

TEST_F(WorkerTest, WorkerThreadStops) {
    submission submit = hello_world();
    accept(submit);
    EXPECT_CALL(exec, execute(_)).WillOnce(Return(completed_run(submit.sub_id, "Hello, world")));

    judge_pipeline pipeline(submissions, results, store, exec, compare_policy::IGNORE_TRAILING_NEWLINES);
    thread worker = start_worker(0, pipeline);
    for (int i = 0; i < 500 && submissions.size() + submissions.in_flight() > 0; ++i)
        this_thread::sleep_for(10ms);
    stop_workers();
    worker.join();

    EXPECT_TRUE(workers_stopped());
    EXPECT_EQ(store.get(submit.sub_id)->status, submission_status::COMPLETED);
}
