#include "worker.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;
using namespace codejudge::server;

// 停止 worker 的标记
static atomic<bool> stop{false};

// 处理失败的提交重新可见的延迟
static const chrono::milliseconds RETRY_DELAY(1000);

// worker 每次等待提交队列的时间，决定了 worker 响应停止标记的速度
static const chrono::milliseconds POLL_TIMEOUT(1000);

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

judge_pipeline::judge_pipeline(message_queue &submissions, message_queue &results,
                               state_store &store, executor &exec, compare_policy policy)
    : submissions(submissions), results(results), store(store), exec(exec), policy(policy) {}

judge_result make_judge_result(const submission_record &record) {
    judge_result result;
    result.sub_id = record.sub_id;
    result.status = record.status;
    result.result = record.result.value_or(verdict::INTERNAL_ERROR);
    result.output = record.output;
    result.run_time = record.run_time;
    result.memory = record.memory;
    result.callback_url = record.callback_url;
    return result;
}

void judge_pipeline::publish(const judge_result &result) {
    string token = results.enqueue(result);
    DLOG(INFO) << "Published result of submission " << result.sub_id << " as " << token;
}

/**
 * @brief 领取提交
 * @return 是否需要评测这个提交。返回 false 时提交队列中的消息可以直接确认
 */
bool judge_pipeline::claim(const submission &submit) {
    auto record = store.get(submit.sub_id);
    if (!record) {
        // 提交没有经过 intake 直接进入了提交队列
        LOG(WARNING) << "Submission " << submit.sub_id << " has no record, creating one";
        submission_record created;
        created.sub_id = submit.sub_id;
        created.status = submission_status::QUEUED;
        created.language = get_language_tag(submit.lang);
        created.callback_url = submit.callback_url;
        created.created_at = submit.created_at ? submit.created_at : time(nullptr);
        store.create(created);  // 返回 false 时记录被并发创建了
        record = store.get(submit.sub_id);
        if (!record)
            BOOST_THROW_EXCEPTION(store_error("record of submission " + submit.sub_id + " disappeared"));
    }

    switch (record->status) {
        case submission_status::QUEUED:
            if (store.transition(submit.sub_id, submission_status::QUEUED, submission_status::RUNNING))
                return true;
            LOG(INFO) << "Submission " << submit.sub_id << " has been claimed by another worker, skipping";
            return false;
        case submission_status::RUNNING:
            LOG(WARNING) << "Submission " << submit.sub_id << " was left running by a stopped worker, judging again";
            return true;
        default:
            LOG(INFO) << "Submission " << submit.sub_id << " has already finished with "
                      << get_display_message(record->result.value_or(verdict::INTERNAL_ERROR))
                      << ", publishing stored result";
            publish(make_judge_result(*record));
            return false;
    }
}

judge_result judge_pipeline::judge(const submission &submit) {
    judge_result result;
    result.sub_id = submit.sub_id;
    result.callback_url = submit.callback_url;
    try {
        execution_result run = exec.execute(submit);
        result.result = evaluate(run, submit.expected_output, policy);
        result.status = result.result == verdict::INTERNAL_ERROR ? submission_status::FAILED : submission_status::COMPLETED;
        if (run.outcome == run_outcome::COMPILE_ERROR) {
            result.output = truncate_utf8(run.compile_log, REPORT_OUTPUT_LIMIT);
        } else {
            result.output = truncate_utf8(run.output, REPORT_OUTPUT_LIMIT);
            result.run_time = run.wall_time;
            result.memory = run.memory >= 0 ? run.memory / 1024 : -1;
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Submission " << submit.sub_id << " failed with internal error, " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        result.status = submission_status::FAILED;
        result.result = verdict::INTERNAL_ERROR;
        result.output = truncate_utf8(ex.what(), REPORT_OUTPUT_LIMIT);
        result.run_time = -1;
        result.memory = -1;
    }
    LOG(INFO) << "Submission " << submit.sub_id << " judged: " << get_display_message(result.result);
    return result;
}

bool judge_pipeline::process(const submission &submit) {
    try {
        if (!claim(submit)) return true;

        judge_result result = judge(submit);
        completion done{result.result, result.output, result.run_time, result.memory};
        if (!store.transition(submit.sub_id, submission_status::RUNNING, result.status, done)) {
            // 另一个 worker 已经写入了终止状态，并负责发送评测结果
            LOG(WARNING) << "Submission " << submit.sub_id << " has been finished by another worker, discarding "
                         << get_display_message(result.result);
            return true;
        }

        // 发送失败时消息被重新投递，届时记录已经是终止状态，会重新发送存储中的结果
        publish(result);
        return true;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to process submission " << submit.sub_id << ", " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        return false;
    }
}

bool judge_pipeline::run_once(chrono::milliseconds poll_timeout) {
    submission submit;
    delivery item;
    try {
        if (!submissions.dequeue_one(submit, item, poll_timeout))
            return false;
    } catch (nlohmann::json::exception &ex) {
        LOG(ERROR) << "Dropping malformed submission: " << ex.what();
        submissions.ack(item);
        return true;
    } catch (invalid_argument &ex) {
        // 未知的语言、状态等
        LOG(ERROR) << "Dropping malformed submission: " << ex.what();
        submissions.ack(item);
        return true;
    }

    if (item.attempt > 1)
        LOG(INFO) << "Submission " << submit.sub_id << " redelivered, attempt " << item.attempt;

    if (process(submit))
        submissions.ack(item);
    else
        submissions.release(item, RETRY_DELAY);
    return true;
}

static void worker_loop(size_t worker_id, judge_pipeline &pipeline) {
    LOG(INFO) << "Worker " << worker_id << " started";
    while (!stop) {
        try {
            pipeline.run_once(POLL_TIMEOUT);
        } catch (std::exception &ex) {
            // 通常是消息队列断开，等待一段时间后重试
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            this_thread::sleep_for(RETRY_DELAY);
        }
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, judge_pipeline &pipeline, optional<size_t> core_id) {
    thread thd([worker_id, &pipeline] {
        worker_loop(worker_id, pipeline);
    });

    if (core_id) {
        // 要求操作系统将 thd 线程放在指定的 CPU 上运行
        cpu_set_t set;
        CPU_ZERO(&set);
        CPU_SET(*core_id, &set);
        int ret = pthread_setaffinity_np(thd.native_handle(), sizeof(cpu_set_t), &set);
        if (ret != 0) {
            stop_workers();
            thd.join();
            throw system_error(ret, system_category(), "unable to bind worker " + to_string(worker_id) + " to core " + to_string(*core_id));
        }
    }

    return thd;
}

thread start_callback_worker(size_t worker_id, callback_worker &worker) {
    return thread([worker_id, &worker] {
        LOG(INFO) << "Callback worker " << worker_id << " started";
        while (!stop) {
            try {
                worker.run_once();
            } catch (std::exception &ex) {
                LOG(ERROR) << "Callback worker " << worker_id << " has crashed, " << ex.what() << endl
                           << boost::diagnostic_information(ex);
                this_thread::sleep_for(RETRY_DELAY);
            }
        }
        LOG(INFO) << "Callback worker " << worker_id << " stopped";
    });
}

}  // namespace codejudge
