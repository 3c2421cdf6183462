#include "server/redis.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"

namespace codejudge::server {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis &redis_config) {
    LOG(INFO) << "Redis: Setup connection with server " << redis_config.host << ":" << redis_config.port;
    redis_client.connect(redis_config.host, redis_config.port,
                         [](const std::string &host, std::size_t port,
                            cpp_redis::connect_state status) {
                             if (status == cpp_redis::connect_state::dropped) {
                                 LOG(INFO) << "Redis: client disconnected from " << host
                                           << ":" << port;
                             }
                         });
    if (!redis_config.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        auto future = redis_client.auth(redis_config.password);
        redis_client.sync_commit();
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << redis_config.host << ":" << redis_config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis_config.host << ":" << redis_config.port;
        return false;
    }
}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force) {
        try {
            connect_to_server(redis_client, redis_config);
        } catch (std::exception &e) {
            LOG(WARNING) << "Redis: " << e.what();
        }
    }
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(redis_config.retry_interval));
        try {
            connect_to_server(redis_client, redis_config);
        } catch (std::exception &e) {
            LOG(WARNING) << "Redis: " << e.what();
        }
    }
    if (fail >= 5) {
        BOOST_THROW_EXCEPTION(store_error("unable to connect to redis server"));
    }
}

void redis_conn::init(const redis &redis_config) noexcept {
    this->redis_config = redis_config;
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    // cpp_redis 的 is_connected 似乎有问题，最后执行操作时的 reply 仍然是 network error
    // 因此这里也做个强制重连。
    reconnect(false);  // 先弱重连一次
    string message;
    for (int fail = 0; fail < 5; ++fail) {  // 错误尝试至多额外 4 次
        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        vector<cpp_redis::reply> replies;
        callback(redis_client, futures);
        DLOG(INFO) << "Syncing operations to server";
        redis_client.sync_commit();
        DLOG(INFO) << "Synced operations to server";
        for (auto &future : futures) {  // 阻塞到所有操作完成为止
            cpp_redis::reply r = future.get();
            // 如果有操作失败，则标记重试并保存错误信息
            if (!r.ok()) reconn = true, message = r.error();
            replies.push_back(r);
        }
        if (!reconn) return replies;
        LOG(WARNING) << "Redis: operation failed: " << message;
        reconnect(true);  // 操作失败，强制重连
    }
    // 失败次数过多，取消操作
    BOOST_THROW_EXCEPTION(store_error("Redis: unable to finish execution: " + message));
}

// KEYS[1]: 记录的键，ARGV[1]: 期望的当前状态，ARGV[2]: 需要改写的字段
static const char *TRANSITION_SCRIPT = R"lua(
local raw = redis.call('GET', KEYS[1])
if not raw then return 0 end
local record = cjson.decode(raw)
if record['status'] ~= ARGV[1] then return 0 end
local patch = cjson.decode(ARGV[2])
for k, v in pairs(patch) do record[k] = v end
redis.call('SET', KEYS[1], cjson.encode(record))
return 1
)lua";

redis_state_store::redis_state_store(const redis &redis_config) {
    conn.init(redis_config);
}

string redis_state_store::key_of(const string &sub_id) {
    return "submission:" + sub_id;
}

bool redis_state_store::create(const submission_record &record) {
    nlohmann::json j = record;
    scoped_lock guard(mut);
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.send({"SET", key_of(record.sub_id), j.dump(), "NX"}));
    });
    // SET NX 在键已存在时返回 nil
    return !replies.at(0).is_null();
}

bool redis_state_store::transition(const string &sub_id, submission_status from, submission_status to, const optional<completion> &done) {
    check_transition(from, to, done);

    submission_record patched;
    apply_transition(patched, to, done, time(nullptr));
    nlohmann::json patch = {{"status", patched.status}};
    if (to == submission_status::RUNNING)
        patch["startedAt"] = patched.started_at;
    if (is_terminal(to)) {
        patch["finishedAt"] = patched.finished_at;
        patch["verdict"] = *patched.result;
        patch["output"] = patched.output;
        if (patched.run_time >= 0) patch["time"] = patched.run_time;
        if (patched.memory >= 0) patch["memory"] = patched.memory;
    }

    scoped_lock guard(mut);
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.send({"EVAL", TRANSITION_SCRIPT, "1", key_of(sub_id), get_wire_name(from), patch.dump()}));
    });
    auto &reply = replies.at(0);
    if (!reply.is_integer())
        BOOST_THROW_EXCEPTION(store_error("Redis: unexpected reply to transition of " + sub_id));
    return reply.as_integer() == 1;
}

optional<submission_record> redis_state_store::get(const string &sub_id) {
    scoped_lock guard(mut);
    auto replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(client.get(key_of(sub_id)));
    });
    auto &reply = replies.at(0);
    if (reply.is_null()) return nullopt;
    try {
        return nlohmann::json::parse(reply.as_string()).get<submission_record>();
    } catch (nlohmann::json::exception &e) {
        BOOST_THROW_EXCEPTION(store_error("Redis: malformed record " + key_of(sub_id) + ": " + e.what()));
    }
}

}  // namespace codejudge::server
