#include "test/TestSupport.hpp"

#include <atomic>
#include <future>
#include <thread>
#include <vector>

#include "application/ProjectSession.hpp"
#include "domain/StoreErrors.hpp"

using namespace novelstore::application;
using namespace novelstore::domain;
using novelstore::test::ScopedTempDir;

int main() {
    std::cout << "[Test] Starting Project Session Concurrency Test..." << std::endl;

    ScopedTempDir tmp("session");
    auto store = ProjectStore::Create(tmp.path() / "novel", "Shared Novel");
    store.initialize();
    std::filesystem::path root = store.projectRoot();

    const int NUM_WRITERS = 8;
    const int CHAPTERS_PER_WRITER = 10;
    std::vector<ChapterId> created;
    std::mutex createdMutex;

    {
        ProjectSession session(std::move(store));
        VolumeId second = session.submit([](ProjectStore& s) { return s.createVolume("Part Two"); }).get();

        std::vector<std::thread> threads;
        std::atomic<int> completed{0};

        std::cout << "[Test] Spawning " << NUM_WRITERS << " writer threads..." << std::endl;
        for (int w = 0; w < NUM_WRITERS; ++w) {
            threads.emplace_back([&, w]() {
                for (int i = 0; i < CHAPTERS_PER_WRITER; ++i) {
                    std::string title = "W" + std::to_string(w) + "-C" + std::to_string(i);
                    auto target = (i % 2 == 0) ? std::optional<VolumeId>{} : std::optional<VolumeId>{second};
                    ChapterId id = session.submit([title, target](ProjectStore& s) {
                        ChapterId newId = s.createChapter(title, target);
                        s.updateChapterContent(newId, "draft of " + title);
                        return newId;
                    }).get();
                    {
                        std::lock_guard<std::mutex> lock(createdMutex);
                        created.push_back(id);
                    }
                    completed++;
                }
            });
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        assert(completed == NUM_WRITERS * CHAPTERS_PER_WRITER);

        // Errors travel back through the future.
        auto failing = session.submit([](ProjectStore& s) { s.restoreVersion(ChapterId(123456), 1); });
        bool notFound = false;
        try {
            failing.get();
        } catch (const NotFoundError&) {
            notFound = true;
        }
        assert(notFound);

        auto count = session.submit([](ProjectStore& s) {
            novelstore::test::AssertInvariants(s);
            return s.chapterCount();
        });
        assert(count.get() == static_cast<std::size_t>(NUM_WRITERS * CHAPTERS_PER_WRITER));

        session.stop();
        assert(!session.isRunning());
        bool rejected = false;
        try {
            session.submit([](ProjectStore& s) { return s.chapterCount(); });
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        assert(rejected);
    }

    std::set<ChapterId> unique(created.begin(), created.end());
    assert(unique.size() == created.size());

    auto reloaded = ProjectStore::Load(root);
    assert(reloaded.chapterCount() == created.size());
    novelstore::test::AssertInvariants(reloaded);

    std::cout << "[PASS] Project Session Concurrency Test." << std::endl;
    return 0;
}
