#include "server/callback.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace codejudge::server {
using namespace std;
using namespace nlohmann;

callback_sender::~callback_sender() {}

curl_callback_sender::curl_callback_sender(long timeout) : timeout(timeout) {}

// 丢弃响应体
static size_t discard_response(char *, size_t size, size_t nmemb, void *) {
    return size * nmemb;
}

long curl_callback_sender::post(const string &url, const string &body) {
    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to initialize curl");

    char error_buffer[CURL_ERROR_SIZE] = {0};
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_response);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    if (res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        string message = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        throw network_error("unable to post to " + url + ": " + message);
    }
    return http_status;
}

json build_callback_body(const judge_result &result) {
    json body = {{"submissionId", result.sub_id},
                 {"status", result.status},
                 {"verdict", result.result}};
    if (!result.output.empty()) body["output"] = result.output;
    if (result.run_time >= 0) body["time"] = result.run_time;
    if (result.memory >= 0) body["memory"] = result.memory;
    return body;
}

chrono::milliseconds backoff_delay(unsigned attempt, const callback_config &config) {
    auto delay = config.backoff_base;
    // 达到上限后不再翻倍
    for (unsigned i = 1; i < attempt && delay < config.backoff_max; ++i)
        delay *= 2;
    return min(delay, config.backoff_max);
}

callback_worker::callback_worker(message_queue &results, callback_sender &sender, const callback_config &config)
    : results(results), sender(sender), config(config) {}

callback_attempt callback_worker::deliver(const judge_result &result, unsigned attempt) {
    callback_attempt record;
    record.sub_id = result.sub_id;
    record.url = result.callback_url;
    record.attempt = attempt;
    record.timestamp = time(nullptr);
    try {
        record.http_status = sender.post(result.callback_url, build_callback_body(result).dump());
        record.success = record.http_status >= 200 && record.http_status < 300;
    } catch (std::exception &e) {
        record.error = e.what();
    }
    return record;
}

void callback_worker::handle(const delivery &item) {
    judge_result result;
    try {
        result = json::parse(item.body).get<judge_result>();
    } catch (std::exception &e) {
        // json::exception 或者未知的评测结果引起的 std::invalid_argument
        LOG(ERROR) << "Dropping malformed judge result: " << e.what();
        results.ack(item);
        return;
    }

    if (result.callback_url.empty()) {
        results.ack(item);
        return;
    }

    callback_attempt attempt = deliver(result, item.attempt);
    if (attempt.success) {
        LOG(INFO) << "Callback of submission " << attempt.sub_id << " to " << attempt.url
                  << " succeeded with " << attempt.http_status << ", attempt " << attempt.attempt;
        results.ack(item);
    } else {
        auto delay = backoff_delay(attempt.attempt, config);
        if (attempt.error.empty())
            LOG(WARNING) << "Callback of submission " << attempt.sub_id << " to " << attempt.url
                         << " returned " << attempt.http_status << ", attempt " << attempt.attempt
                         << ", retry in " << delay.count() << "ms";
        else
            LOG(WARNING) << "Callback of submission " << attempt.sub_id << " failed: " << attempt.error
                         << ", attempt " << attempt.attempt << ", retry in " << delay.count() << "ms";
        results.release(item, delay);
    }
}

size_t callback_worker::run_once() {
    auto items = results.underlying().fetch_batch(config.batch_size, config.poll_timeout);
    for (auto &item : items) {
        try {
            handle(item);
        } catch (std::exception &e) {
            // ack 或者 release 失败时消息会在可见性超时后重新投递
            LOG(ERROR) << "Unable to settle judge result: " << e.what();
        }
    }
    return items.size();
}

}  // namespace codejudge::server
