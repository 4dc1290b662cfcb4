#include "TestSupport.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

using namespace testsupport;

int main() {
    auto admin = std::make_shared<StaffActor>(1, "admin");

    // Synchronous record with a target
    {
        AuditEngine engine(memoryConfig());
        auto& recorder = engine.recorder();

        auto h = recorder.record(admin, "Created Student", ActionCategory::Create, TargetRef{"Student", 42});
        expect(h.has_value(), "record should return a handle");
        auto entry = engine.store().get(h->id);
        expect(entry->target->type == "Student" && entry->target->id == 42, "target stored");
        expect(entry->actorTag == admin->stableTag(), "actor tag stored");
        expect(entry->actor && entry->actor->display == "admin", "actor display stored");
        expect(recorder.recorded() == 1, "recorded counter");
    }

    // Actor that has not been saved yet
    {
        AuditEngine engine(memoryConfig());
        auto ghost = std::make_shared<StaffActor>(std::nullopt, "ghost");
        auto h = engine.recorder().record(ghost, "Viewed page", ActionCategory::View);
        expect(!h.has_value(), "unsaved actor should not be recorded");
        expect(engine.store().count() == 0, "store unchanged for unsaved actor");
        expect(engine.recorder().failed() == 0, "unsaved actor is not a failure");
    }

    // System entries
    {
        AuditEngine engine(memoryConfig());
        auto h = engine.recorder().record(nullptr, "System cleanup", ActionCategory::System);
        auto entry = engine.store().get(h->id);
        expect(!entry->actor, "system entry has no actor");
        expect(entry->actorTag.str() == "00000000-0000-0000-0000-000000000000", "system entry has nil tag");

        auto hs = engine.recorder().recordSystem("Nightly purge", ActionCategory::System);
        expect(engine.store().get(hs->id)->metadata["system"] == true, "recordSystem marks metadata");
    }

    // Unserializable metadata still produces an entry
    {
        AuditEngine engine(memoryConfig());
        Metadata md;
        md["payload"] = MetaValue(std::shared_ptr<const OpaqueValue>(std::make_shared<BrokenValue>(true)));
        auto h = engine.recorder().record(admin, "Imported roster", ActionCategory::Upload, std::nullopt, md);
        expect(h.has_value(), "entry should be written despite bad metadata");
        auto entry = engine.store().get(h->id);
        expect(entry->metadata["error"] == "metadata serialization failed", "fallback metadata stored");
    }

    // Request details and length limits
    {
        AuditEngine engine(memoryConfig());
        RequestDetails details;
        details.ipAddress = "10.0.0.5";
        details.userAgent = std::string(600, 'u');
        auto h = engine.recorder().record(admin, "Downloaded report", ActionCategory::Download,
                                          std::nullopt, {}, details);
        auto entry = engine.store().get(h->id);
        expect(entry->details.ipAddress == std::string("10.0.0.5"), "ip stored");
        expect(entry->details.userAgent->size() == kMaxUserAgentLength, "user agent truncated");
    }

    // Store failures are swallowed and counted
    {
        AuditEngine engine(memoryConfig());
        engine.store().close();
        auto h = engine.recorder().record(admin, "Late write", ActionCategory::Other);
        expect(!h.has_value(), "write to a closed store should fail quietly");
        expect(engine.recorder().failed() == 1, "failure counted");
    }

    // Async dispatch: deferred until commit, dropped on rollback
    {
        AuditEngine engine(memoryConfig());
        auto& recorder = engine.recorder();

        TransactionScope committed;
        RecordingContext ctx{admin, &committed};
        auto mode = recorder.recordAsync(ctx, admin, "Shared document", ActionCategory::Share);
        expect(mode == DispatchMode::Deferred, "open transaction should defer");
        expect(engine.store().count() == 0, "nothing written before commit");
        committed.commit();
        expect(engine.store().count() == 1, "written at commit");

        {
            TransactionScope rolledBack;
            RecordingContext ctx2{admin, &rolledBack};
            recorder.recordAsync(ctx2, admin, "Shared document", ActionCategory::Share);
            rolledBack.rollback();
        }
        recorder.flush();
        expect(engine.store().count() == 1, "rolled back transaction leaves no entry");
    }

    // Nested scopes hand their callbacks to the outermost commit
    {
        AuditEngine engine(memoryConfig());
        TransactionScope outer;
        {
            TransactionScope inner(&outer);
            RecordingContext ctx{admin, &inner};
            engine.recorder().recordAsync(ctx, admin, "Inner", ActionCategory::Other);
            inner.commit();
        }
        expect(outer.pendingCallbacks() == 1, "inner commit should move callback outward");
        expect(engine.store().count() == 0, "nothing written before outer commit");
        {
            TransactionScope dropped(&outer);
            RecordingContext ctx{admin, &dropped};
            engine.recorder().recordAsync(ctx, admin, "Dropped", ActionCategory::Other);
        }
        outer.commit();
        expect(engine.store().count() == 1, "only the committed inner entry is written");
    }

    // No transaction: queued on the pool
    {
        AuditEngine engine(memoryConfig());
        RecordingContext ctx{admin, nullptr};
        auto mode = engine.recorder().recordAsync(ctx, admin, "Viewed student", ActionCategory::View,
                                                  TargetRef{"Student", 5});
        expect(mode == DispatchMode::Queued, "no transaction should queue");
        engine.recorder().flush();
        expect(engine.store().count() == 1, "queued entry written after flush");
    }

    // Test mode writes inline even inside a transaction
    {
        AuditEngine engine(memoryConfig(true));
        TransactionScope tx;
        RecordingContext ctx{admin, &tx};
        auto mode = engine.recorder().recordAsync(ctx, admin, "Inline", ActionCategory::Other);
        expect(mode == DispatchMode::Inline, "test mode should record inline");
        expect(engine.store().count() == 1, "inline entry written immediately");
        tx.rollback();
        expect(engine.store().count() == 1, "inline entry is not tied to the transaction");
    }

    // A full queue drops instead of blocking
    {
        EntryStore store;
        WorkerPool pool(1, 1);
        Recorder recorder(store, pool);

        std::mutex m;
        std::condition_variable cv;
        bool release = false;
        std::atomic<bool> started{false};
        pool.trySubmit([&] {
            started = true;
            std::unique_lock<std::mutex> lk(m);
            cv.wait(lk, [&] { return release; });
        });
        while (!started) std::this_thread::yield();

        RecordingContext ctx{admin, nullptr};
        auto first = recorder.recordAsync(ctx, admin, "fills queue", ActionCategory::Other);
        auto second = recorder.recordAsync(ctx, admin, "overflows", ActionCategory::Other);
        expect(first == DispatchMode::Queued, "first task fits the queue");
        expect(second == DispatchMode::Dropped, "second task should be dropped");
        expect(recorder.dropped() == 1, "dropped counter");

        {
            std::lock_guard<std::mutex> lk(m);
            release = true;
        }
        cv.notify_all();
        recorder.flush();
        expect(store.count() == 1, "only the queued entry is written");
        pool.stop();

        auto afterStop = recorder.recordAsync(ctx, admin, "after stop", ActionCategory::Other);
        expect(afterStop == DispatchMode::Dropped, "stopped pool drops");
    }

    // A transaction that outlives the recorder commits without writing
    {
        EntryStore store;
        TransactionScope tx;
        {
            WorkerPool pool(1, 4);
            Recorder recorder(store, pool);
            auto mode = recorder.recordAsync(RecordingContext{admin, &tx}, admin, "Late", ActionCategory::Other);
            expect(mode == DispatchMode::Deferred, "deferred while the transaction is open");
        }
        expect(tx.pendingCallbacks() == 1, "callback still registered");
        tx.commit();
        expect(store.count() == 0, "commit after recorder shutdown writes nothing");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
