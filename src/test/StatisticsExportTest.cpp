#include "test/TestSupport.hpp"

#include "application/ManuscriptExportService.hpp"
#include "application/ProjectStatistics.hpp"
#include "application/ProjectStore.hpp"
#include "domain/WordCount.hpp"
#include "infrastructure/ProjectLayout.hpp"

using namespace novelstore::application;
using namespace novelstore::domain;
using novelstore::infrastructure::ProjectLayout;
using novelstore::test::ScopedTempDir;

static void testWordCounting() {
    assert(CountWords("") == 0);
    assert(CountWords("   \n\t ") == 0);
    assert(CountWords("one") == 1);
    assert(CountWords("  leading and trailing  ") == 3);
    assert(CountWords("tabs\tand\nnewlines\r\nmixed") == 4);

    // Non-ASCII separators.
    assert(CountWords(u8"\u7b2c\u4e00\u7ae0\u3000\u5f00\u59cb\u3000\u4e86") == 3);
    assert(CountWords(u8"one\u00A0two") == 2);
    assert(CountWords(u8"en\u2000quad\u202Fand\u2028line") == 4);
    assert(CountWords(u8"\u3000\u3000") == 0);
    assert(CountWords(u8"\u8fde\u7eed\u7684\u4e2d\u6587") == 1);
    // A stray continuation byte is part of a word, not a separator.
    assert(CountWords(std::string("a\x80 b")) == 2);
}

static void testVersionFileNames() {
    assert(ProjectLayout::ParseVersionFileName("v0.json") == 0u);
    assert(ProjectLayout::ParseVersionFileName("v12.json") == 12u);
    assert(!ProjectLayout::ParseVersionFileName("v.json"));
    assert(!ProjectLayout::ParseVersionFileName("v1.json.5.tmp"));
    assert(!ProjectLayout::ParseVersionFileName("x1.json"));
    assert(!ProjectLayout::ParseVersionFileName("v1a.json"));
    assert(!ProjectLayout::ParseVersionFileName("v99999999999.json"));
}

static void testFormatWordCount() {
    assert(FormatWordCount(0) == "0");
    assert(FormatWordCount(999) == "999");
    assert(FormatWordCount(1000) == "1.0k");
    assert(FormatWordCount(12345) == "12.3k");
    assert(FormatWordCount(2500000) == "2.5M");
}

static void testStatisticsAndExport() {
    ScopedTempDir tmp("stats");
    auto store = ProjectStore::Create(tmp.path() / "novel", "The Long Road");
    store.initialize();
    VolumeId first = store.volumes()[0].id;
    VolumeId second = store.createVolume("Homecoming");

    ChapterId a = store.createChapter("Departure");
    ChapterId b = store.createChapter("Crossroads");
    ChapterId c = store.createChapter("Return", second);
    store.updateChapterContent(a, "We left at dawn.");
    store.updateChapterContent(b, "Which way now?");
    store.updateChapterContent(c, "Home, at last, 50% older & wiser.");
    store.updateChapterStatus(a, ChapterStatus::Complete);
    store.updateChapterStatus(b, ChapterStatus::Draft);

    auto stats = ProjectStatistics::Compute(store.project());
    assert(stats.totalChapters == 3);
    assert(stats.totalWords == 4 + 3 + 7);
    assert(stats.volumes.size() == 2);
    assert(stats.volumes[0].volumeId == first && stats.volumes[0].chapterCount == 2 && stats.volumes[0].wordCount == 7);
    assert(stats.volumes[1].title == "Homecoming" && stats.volumes[1].wordCount == 7);
    assert(stats.countFor(ChapterStatus::Complete) == 1);
    assert(stats.countFor(ChapterStatus::Draft) == 1);
    assert(stats.countFor(ChapterStatus::NotStarted) == 1);

    store.reorderChaptersInVolume(first, {b, a});
    std::string md = ManuscriptExportService::toMarkdown(store.project());
    assert(md.find("# The Long Road") == 0);
    auto posB = md.find("### Crossroads");
    auto posA = md.find("### Departure");
    auto posVolume2 = md.find("## Homecoming");
    auto posC = md.find("### Return");
    assert(posB != std::string::npos && posA != std::string::npos && posC != std::string::npos);
    assert(posB < posA && posA < posVolume2 && posVolume2 < posC);
    assert(md.find("We left at dawn.") != std::string::npos);

    std::string tex = ManuscriptExportService::toLatex(store.project());
    assert(tex.find("\\part{Homecoming}") != std::string::npos);
    assert(tex.find("50\\% older \\& wiser.") != std::string::npos);
    assert(tex.find("\\end{document}") != std::string::npos);
}

int main() {
    std::cout << "[Test] Starting Statistics & Export Test..." << std::endl;

    testWordCounting();
    testVersionFileNames();
    testFormatWordCount();
    testStatisticsAndExport();

    std::cout << "[PASS] Statistics & Export Test." << std::endl;
    return 0;
}
