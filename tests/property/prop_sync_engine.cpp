#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/retry_policy.hpp"
#include "core/sync_operation.hpp"
#include "core/sync_state.hpp"
#include "generators.hpp"

#include <map>

using namespace docsync;
using namespace std::chrono_literals;

TEST_CASE("Property: state names round-trip", "[property][state]") {
    rc::check("parse(to_string(s)) == s",
        [](SyncState state) {
            RC_ASSERT(parse_sync_state(to_string(state)) == state);
        });
}

TEST_CASE("Property: delete is accepted from every state", "[property][state]") {
    rc::check("Delete always lands in PendingDeletion",
        [](SyncState state) {
            const auto next = transition(state, SyncTrigger::Delete);
            RC_ASSERT(next.is_ok());
            RC_ASSERT(next.unwrap() == SyncState::PendingDeletion);
        });
}

TEST_CASE("Property: recovery never leaves a transfer in progress", "[property][state]") {
    rc::check("Recover maps transfer states back to pending",
        [](SyncState state) {
            const auto next = transition(state, SyncTrigger::Recover);
            RC_ASSERT(next.is_ok());
            RC_ASSERT(!is_transferring(next.unwrap()));
        });
}

TEST_CASE("Property: illegal transitions are reported, never applied", "[property][state]") {
    rc::check("a trigger sequence only ever moves through legal states",
        [](const std::vector<SyncTrigger>& triggers) {
            auto state = SyncState::PendingUpload;
            for (const auto trigger : triggers) {
                const auto next = transition(state, trigger);
                if (next.is_err()) {
                    RC_ASSERT(next.unwrap_err().kind == ErrorKind::Validation);
                    continue;
                }
                state = next.unwrap();
            }
            RC_ASSERT(parse_sync_state(to_string(state)).has_value());
        });
}

TEST_CASE("Property: backoff is monotonic and capped", "[property][retry]") {
    rc::check("backoff(n) <= backoff(n + 1) <= cap",
        [] {
            const int n = *rc::gen::inRange(0, 100);
            const auto cap = std::chrono::seconds(*rc::gen::inRange(1, 1000));
            RC_ASSERT(backoff_delay(n, cap) <= backoff_delay(n + 1, cap));
            RC_ASSERT(backoff_delay(n + 1, cap) <= cap);
            RC_ASSERT(backoff_delay(n, cap) >= 1s);
        });
}

TEST_CASE("Property: transient failures turn permanent at the retry limit", "[property][retry]") {
    rc::check("permanent iff failures >= max_retries",
        [] {
            const int max_retries = *rc::gen::inRange(1, 10);
            const int failures = *rc::gen::inRange(1, 15);
            RetryScheduler scheduler(RetryPolicy{.max_retries = max_retries});
            Timestamp now{docsync::testing::kEpochMs};

            RetryDecision last;
            for (int i = 0; i < failures; ++i) {
                last = scheduler.record_failure("doc-1", OperationKind::Update,
                                                Error(ErrorKind::Network, "offline"), now);
                now = now + 1h;
            }
            RC_ASSERT(scheduler.is_permanent("doc-1") == (failures >= max_retries));
            RC_ASSERT((last.action == RetryAction::GiveUp) == (failures >= max_retries));
        });
}

TEST_CASE("Property: the queue holds at most one pending operation per document", "[property][queue]") {
    rc::check("coalescing keeps one queued op per document and deletes stick",
        [] {
            const std::vector<std::string> ids = {
                "1f0e2d3c-4b5a-4968-8776-a5b4c3d2e1f0",
                "a3bb189e-8bf9-4888-9912-ace4e6543002",
                "c56a4180-65aa-42ec-a945-5fd21dec0538",
            };
            const auto steps = *rc::gen::container<std::vector<std::pair<int, int>>>(
                rc::gen::pair(rc::gen::inRange(0, 3), rc::gen::inRange(0, 3)));

            OperationQueue queue;
            std::map<std::string, bool> deleted;
            const Timestamp now{docsync::testing::kEpochMs};
            for (const auto& [doc_index, kind_index] : steps) {
                auto doc = create_document("user-1", "Doc", "misc", now);
                doc.sync_id = ids[static_cast<size_t>(doc_index)];
                const auto kind = static_cast<OperationKind>(kind_index);
                queue.enqueue(make_operation(doc, kind, now));
                if (kind == OperationKind::Delete) deleted[*doc.sync_id] = true;
            }

            RC_ASSERT(queue.size() <= ids.size());
            for (const auto& id : ids) {
                const auto queued = queue.queued_for(id);
                if (deleted[id]) {
                    RC_ASSERT(queued.has_value());
                    RC_ASSERT(queued->kind == OperationKind::Delete);
                }
            }
        });
}
