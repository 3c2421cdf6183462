#include "server/memory_queue.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace codejudge::server {
using namespace std;

memory_queue::memory_queue(chrono::milliseconds visibility_timeout, unsigned max_receives)
    : visibility_timeout(visibility_timeout), max_receives(max_receives) {}

string memory_queue::publish(const string &body) {
    unique_lock<mutex> lock(mut);
    string id = "msg-" + to_string(++next_id);
    waiting.push_back({id, body, 0, clock::now()});
    lock.unlock();
    cond.notify_one();
    return id;
}

void memory_queue::restore_expired(clock::time_point now) {
    for (auto it = leases.begin(); it != leases.end();) {
        if (it->second.deadline <= now) {
            DLOG(INFO) << "Message " << it->second.msg.id << " exceeded visibility timeout, redelivering";
            message msg = move(it->second.msg);
            msg.visible_at = now;
            waiting.push_back(move(msg));
            it = leases.erase(it);
        } else {
            ++it;
        }
    }
}

bool memory_queue::fetch(delivery &item, chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mut);
    auto deadline = clock::now() + timeout;
    while (true) {
        auto now = clock::now();
        restore_expired(now);

        auto wakeup = deadline;
        for (auto it = waiting.begin(); it != waiting.end();) {
            if (it->visible_at > now) {
                wakeup = min(wakeup, it->visible_at);
                ++it;
                continue;
            }

            message msg = move(*it);
            it = waiting.erase(it);
            ++msg.receives;
            if (max_receives > 0 && msg.receives > max_receives) {
                LOG(WARNING) << "Message " << msg.id << " has been received " << max_receives << " times, moving to dead letter queue";
                dead.push_back(move(msg));
                continue;
            }

            string receipt = msg.id + "#" + to_string(++next_receipt);
            item.body = msg.body;
            item.attempt = msg.receives;
            item.handle = receipt;
            leases.emplace(receipt, lease{move(msg), now + visibility_timeout});
            return true;
        }

        for (auto &[receipt, entry] : leases)
            wakeup = min(wakeup, entry.deadline);

        if (now >= deadline) return false;
        cond.wait_until(lock, wakeup);
    }
}

void memory_queue::ack(const delivery &item) {
    string receipt = any_cast<string>(item.handle);
    scoped_lock lock(mut);
    if (leases.erase(receipt) == 0)
        LOG(WARNING) << "Acknowledging expired receipt " << receipt << ", the message has been redelivered";
}

void memory_queue::release(const delivery &item, chrono::milliseconds delay) {
    string receipt = any_cast<string>(item.handle);
    {
        scoped_lock lock(mut);
        auto it = leases.find(receipt);
        if (it == leases.end()) {
            LOG(WARNING) << "Releasing expired receipt " << receipt << ", the message has been redelivered";
            return;
        }
        message msg = move(it->second.msg);
        msg.visible_at = clock::now() + delay;
        waiting.push_back(move(msg));
        leases.erase(it);
    }
    cond.notify_all();
}

size_t memory_queue::size() {
    scoped_lock lock(mut);
    restore_expired(clock::now());
    return waiting.size();
}

size_t memory_queue::in_flight() {
    scoped_lock lock(mut);
    restore_expired(clock::now());
    return leases.size();
}

vector<string> memory_queue::dead_letters() {
    scoped_lock lock(mut);
    vector<string> bodies;
    for (auto &msg : dead) bodies.push_back(msg.body);
    return bodies;
}

}  // namespace codejudge::server
