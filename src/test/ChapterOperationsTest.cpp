#include "test/TestSupport.hpp"

#include "application/ProjectStore.hpp"
#include "domain/StoreErrors.hpp"
#include "infrastructure/ProjectLayout.hpp"

using namespace novelstore::application;
using namespace novelstore::domain;
using novelstore::infrastructure::ProjectLayout;
using novelstore::test::AssertInvariants;
using novelstore::test::ScopedTempDir;
using novelstore::test::Throws;
namespace fs = std::filesystem;

static ProjectStore freshStore(const ScopedTempDir& tmp) {
    auto store = ProjectStore::Create(tmp.path() / "novel", "Operations");
    store.initialize();
    return store;
}

static std::vector<ChapterId> idsOf(const std::vector<const Chapter*>& chapters) {
    std::vector<ChapterId> ids;
    for (const auto* c : chapters) ids.push_back(c->id);
    return ids;
}

static void testCreateChapterDefaultsToFirstVolume() {
    ScopedTempDir tmp("create_chapter");
    auto store = freshStore(tmp);
    VolumeId first = store.volumes()[0].id;

    ChapterId id = store.createChapter("First Chapter");
    const Chapter* chapter = store.chapter(id);
    assert(chapter != nullptr);
    assert(chapter->title == "First Chapter");
    assert(chapter->volumeId == first);
    assert(chapter->order == 0);
    assert(chapter->currentVersion == 0);
    assert(chapter->status == ChapterStatus::NotStarted);
    assert(fs::is_directory(chapter->dirPath));
    assert(fs::exists(ProjectLayout::GetChapterMetadataFile(chapter->dirPath)));
    assert(fs::exists(ProjectLayout::GetChapterContentFile(chapter->dirPath)));
    assert(fs::file_size(ProjectLayout::GetChapterContentFile(chapter->dirPath)) == 0);

    assert(Throws<NotFoundError>([&] { store.createChapter("Lost", VolumeId("no-such-volume")); }));
    assert(store.chapterCount() == 1);
    AssertInvariants(store);
}

static void testIdsAreNeverReused() {
    ScopedTempDir tmp("ids");
    auto store = freshStore(tmp);

    ChapterId a = store.createChapter("A");
    ChapterId b = store.createChapter("B");
    store.deleteChapter(a);
    ChapterId c = store.createChapter("C");
    assert(c != a && c != b);
    assert(b < c);

    // The counter survives a reload.
    fs::path root = store.projectRoot();
    auto reloaded = ProjectStore::Load(root);
    ChapterId d = reloaded.createChapter("D");
    assert(c < d);
    AssertInvariants(reloaded);
}

static void testFailedCreateLeavesNoDirectory() {
    ScopedTempDir tmp("create_failure");
    auto store = freshStore(tmp);
    VolumeId vol = store.volumes()[0].id;
    ChapterId kept = store.createChapter("Kept");

    // Occupy the next chapter's metadata path with a directory so the write fails.
    ChapterId next(store.project().nextChapterId);
    fs::path doomedDir = ProjectLayout::GetChapterDir(store.projectRoot(), next);
    fs::create_directories(ProjectLayout::GetChapterMetadataFile(doomedDir) / "occupied");

    assert(Throws<IoError>([&] { store.createChapter("Broken"); }));
    assert(!fs::exists(doomedDir));
    assert(store.chapterCount() == 1);
    assert(store.chapter(next) == nullptr);
    assert((idsOf(store.chaptersForVolume(vol)) == std::vector<ChapterId>{kept}));
    AssertInvariants(store);

    ChapterId after = store.createChapter("After");
    assert(store.chapter(after) != nullptr);
    assert(store.chapterCount() == 2);
    AssertInvariants(store);
}

static void testDeleteChapterRenumbersAndRemovesDirectory() {
    ScopedTempDir tmp("delete_chapter");
    auto store = freshStore(tmp);
    VolumeId vol = store.volumes()[0].id;

    ChapterId a = store.createChapter("A");
    ChapterId b = store.createChapter("B");
    ChapterId c = store.createChapter("C");
    fs::path bDir = store.chapter(b)->dirPath;

    NovelSettings settings;
    settings.plotPoints.push_back({"Twist", "", {a, b}, 0});
    store.updateSettings(settings);

    store.deleteChapter(b);
    assert(!fs::exists(bDir));
    assert(store.chapter(b) == nullptr);
    assert((idsOf(store.chaptersForVolume(vol)) == std::vector<ChapterId>{a, c}));
    assert(store.chapter(c)->order == 1);
    assert((store.settings().plotPoints[0].chapterIds == std::vector<ChapterId>{a}));

    store.deleteChapter(b); // unknown id is a no-op
    store.renameChapter(ChapterId(12345), "ghost");
    store.updateChapterStatus(ChapterId(12345), ChapterStatus::Complete);
    assert(store.chapterCount() == 2);
    AssertInvariants(store);
}

static void testVolumeOperations() {
    ScopedTempDir tmp("volumes");
    auto store = freshStore(tmp);

    VolumeId v2 = store.createVolume("Volume 2");
    VolumeId v3 = store.createVolume("Volume 3");
    assert(store.volumes().size() == 3);
    assert(store.volumes()[2].order == 2);

    ChapterId c1 = store.createChapter("Chapter 1");
    ChapterId c2 = store.createChapter("Chapter 2", v2);
    ChapterId c3 = store.createChapter("Chapter 3", v2);
    assert(store.chapter(c1)->volumeId != store.chapter(c2)->volumeId);
    fs::path c2Dir = store.chapter(c2)->dirPath;
    fs::path c3Dir = store.chapter(c3)->dirPath;

    store.renameVolume(v3, "Epilogue");
    assert(store.volumes()[2].title == "Epilogue");
    store.renameVolume(VolumeId("missing"), "ignored");

    store.deleteVolume(v2);
    assert(store.volumes().size() == 2);
    assert(store.volumes()[0].order == 0);
    assert(store.volumes()[1].order == 1);
    assert(store.volumes()[1].id == v3);
    assert(store.chapter(c2) == nullptr && store.chapter(c3) == nullptr);
    assert(!fs::exists(c2Dir) && !fs::exists(c3Dir));
    assert(store.chapterCount() == 1);

    store.deleteVolume(VolumeId("missing"));
    assert(store.volumes().size() == 2);
    AssertInvariants(store);
}

static void testRenameAndStatusArePersisted() {
    ScopedTempDir tmp("rename");
    auto store = freshStore(tmp);
    ChapterId id = store.createChapter("Draft Title");

    store.renameChapter(id, "Final Title");
    store.updateChapterStatus(id, ChapterStatus::Complete);

    auto reloaded = ProjectStore::Load(store.projectRoot());
    assert(reloaded.chapter(id)->title == "Final Title");
    assert(reloaded.chapter(id)->status == ChapterStatus::Complete);
}

static void testReorder() {
    ScopedTempDir tmp("reorder");
    auto store = freshStore(tmp);
    VolumeId vol = store.volumes()[0].id;
    VolumeId other = store.createVolume("Other");

    ChapterId c1 = store.createChapter("Chapter 1");
    ChapterId c2 = store.createChapter("Chapter 2");
    ChapterId c3 = store.createChapter("Chapter 3");
    ChapterId elsewhere = store.createChapter("Elsewhere", other);

    store.reorderChaptersInVolume(vol, {c3, c1, c2});
    auto ordered = store.allChaptersInOrder();
    assert(ordered[0]->id == c3 && ordered[1]->id == c1 && ordered[2]->id == c2);
    assert(ordered[3]->id == elsewhere);
    AssertInvariants(store);

    const std::vector<ChapterId> before = store.volumes()[0].chapterIds;

    bool foreign = false;
    try {
        store.reorderChaptersInVolume(vol, {c1, elsewhere, c2, c3});
    } catch (const InvalidArgumentError& e) {
        foreign = e.offendingId() == elsewhere.toString();
    }
    assert(foreign);
    assert(store.volumes()[0].chapterIds == before);

    assert(Throws<InvalidArgumentError>([&] { store.reorderChaptersInVolume(vol, {c1, c2, c3, ChapterId(777)}); }));
    assert(Throws<InvalidArgumentError>([&] { store.reorderChaptersInVolume(vol, {c1, c2}); }));
    assert(Throws<InvalidArgumentError>([&] { store.reorderChaptersInVolume(vol, {c1, c1, c2, c3}); }));
    assert(Throws<NotFoundError>([&] { store.reorderChaptersInVolume(VolumeId("missing"), {}); }));
    assert(store.volumes()[0].chapterIds == before);
    AssertInvariants(store);
}

static void testMoveChapterToVolume() {
    ScopedTempDir tmp("move");
    auto store = freshStore(tmp);
    VolumeId source = store.volumes()[0].id;
    VolumeId target = store.createVolume("Target");

    ChapterId a = store.createChapter("A");
    ChapterId b = store.createChapter("B");
    ChapterId c = store.createChapter("C");
    ChapterId x = store.createChapter("X", target);
    ChapterId y = store.createChapter("Y", target);

    store.moveChapterToVolume(a, target, 1);
    assert((idsOf(store.chaptersForVolume(target)) == std::vector<ChapterId>{x, a, y}));
    assert((idsOf(store.chaptersForVolume(source)) == std::vector<ChapterId>{b, c}));
    assert(store.chapter(a)->volumeId == target);
    AssertInvariants(store);

    // Past the end appends.
    store.moveChapterToVolume(b, target, 100);
    assert((idsOf(store.chaptersForVolume(target)) == std::vector<ChapterId>{x, a, y, b}));
    AssertInvariants(store);

    // Within the same volume.
    store.moveChapterToVolume(b, target, 0);
    assert((idsOf(store.chaptersForVolume(target)) == std::vector<ChapterId>{b, x, a, y}));
    AssertInvariants(store);

    assert(Throws<NotFoundError>([&] { store.moveChapterToVolume(ChapterId(999), target, 0); }));
    assert(Throws<NotFoundError>([&] { store.moveChapterToVolume(c, VolumeId("missing"), 0); }));
    assert(store.chapter(c)->volumeId == source);

    auto reloaded = ProjectStore::Load(store.projectRoot());
    assert((idsOf(reloaded.chaptersForVolume(target)) == std::vector<ChapterId>{b, x, a, y}));
    AssertInvariants(reloaded);
}

static void testRandomSequenceKeepsInvariants() {
    ScopedTempDir tmp("sequence");
    auto store = freshStore(tmp);
    std::mt19937 rng(42);
    store.createVolume("B");
    store.createVolume("C");

    for (int step = 0; step < 60; ++step) {
        auto pick = [&](std::size_t n) { return static_cast<std::size_t>(rng() % n); };
        const auto& vols = store.volumes();
        VolumeId vol = vols[pick(vols.size())].id;
        std::vector<ChapterId> members = vols[pick(vols.size())].chapterIds;

        switch (pick(4)) {
            case 0:
            case 1:
                store.createChapter("Chapter " + std::to_string(step), vol);
                break;
            case 2:
                if (!members.empty()) store.deleteChapter(members[pick(members.size())]);
                break;
            case 3:
                if (!members.empty()) store.moveChapterToVolume(members[pick(members.size())], vol, pick(5));
                break;
        }
        AssertInvariants(store);
    }

    for (const auto& volume : store.volumes()) {
        std::vector<ChapterId> reversed(volume.chapterIds.rbegin(), volume.chapterIds.rend());
        store.reorderChaptersInVolume(volume.id, reversed);
    }
    AssertInvariants(store);
    AssertInvariants(ProjectStore::Load(store.projectRoot()));
}

int main() {
    std::cout << "[Test] Starting Chapter Operations Test..." << std::endl;

    testCreateChapterDefaultsToFirstVolume();
    testIdsAreNeverReused();
    testFailedCreateLeavesNoDirectory();
    testDeleteChapterRenumbersAndRemovesDirectory();
    testVolumeOperations();
    testRenameAndStatusArePersisted();
    testReorder();
    testMoveChapterToVolume();
    testRandomSequenceKeepsInvariants();

    std::cout << "[PASS] Chapter Operations Test." << std::endl;
    return 0;
}
