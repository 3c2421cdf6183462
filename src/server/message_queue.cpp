#include "server/message_queue.hpp"

namespace codejudge::server {
using namespace std;

message_queue::~message_queue() {}

vector<delivery> message_queue::fetch_batch(size_t max_count, chrono::milliseconds timeout) {
    vector<delivery> items;
    delivery item;
    if (max_count == 0 || !fetch(item, timeout)) return items;
    items.push_back(move(item));
    while (items.size() < max_count) {
        delivery next;
        if (!fetch(next, chrono::milliseconds(0))) break;
        items.push_back(move(next));
    }
    return items;
}

}  // namespace codejudge::server
