/**
 * @file ProjectJsonCodec.cpp
 * @brief Implementation of ProjectJsonCodec.
 */

#include "infrastructure/ProjectJsonCodec.hpp"

#include <chrono>
#include <stdexcept>

#include "domain/StoreErrors.hpp"

namespace novelstore::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace novelstore::domain;

namespace {

long long ToMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromMillis(long long ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

json ChapterIdsToJson(const std::vector<ChapterId>& ids) {
    json arr = json::array();
    for (const auto& id : ids) {
        arr.push_back(id.value);
    }
    return arr;
}

std::vector<ChapterId> ChapterIdsFromJson(const json& arr) {
    std::vector<ChapterId> ids;
    for (const auto& item : arr) {
        ids.emplace_back(item.get<std::uint64_t>());
    }
    return ids;
}

Chapter DecodeChapter(const json& j) {
    Chapter chapter;
    chapter.id = ChapterId(j.at("id").get<std::uint64_t>());
    chapter.title = j.at("title").get<std::string>();
    chapter.order = j.value("order", std::size_t{0});
    chapter.volumeId = VolumeId(j.at("volume_id").get<std::string>());
    chapter.dirPath = fs::path(j.value("dir_path", std::string{}));
    chapter.wordCount = j.value("word_count", std::size_t{0});

    std::string statusStr = j.value("status", std::string("NotStarted"));
    auto status = ChapterStatusFromString(statusStr);
    if (!status) {
        throw std::invalid_argument("unknown chapter status '" + statusStr + "'");
    }
    chapter.status = *status;
    chapter.currentVersion = j.value("current_version", std::uint32_t{0});
    chapter.createdAt = FromMillis(j.value("created_at", 0LL));
    chapter.modifiedAt = FromMillis(j.value("modified_at", 0LL));
    return chapter;
}

Volume DecodeVolume(const json& j) {
    Volume volume;
    volume.id = VolumeId(j.at("id").get<std::string>());
    volume.title = j.at("title").get<std::string>();
    volume.order = j.value("order", std::size_t{0});
    volume.chapterIds = ChapterIdsFromJson(j.value("chapter_ids", json::array()));
    volume.description = j.value("description", std::string{});
    volume.createdAt = FromMillis(j.value("created_at", 0LL));
    volume.modifiedAt = FromMillis(j.value("modified_at", 0LL));
    return volume;
}

template <typename F>
auto Decode(const fs::path& source, F&& decode) -> decltype(decode()) {
    try {
        return decode();
    } catch (const json::exception& e) {
        throw ParseError(ParseError::Reason::Malformed, source, e.what());
    } catch (const std::invalid_argument& e) {
        throw ParseError(ParseError::Reason::Malformed, source, e.what());
    }
}

} // namespace

json ProjectJsonCodec::Parse(const std::string& text, const fs::path& source) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(ParseError::Reason::Malformed, source, e.what());
    }
}

json ProjectJsonCodec::ChapterToJson(const Chapter& chapter) {
    return {
        {"id", chapter.id.value},
        {"title", chapter.title},
        {"order", chapter.order},
        {"volume_id", chapter.volumeId.value},
        {"dir_path", chapter.dirPath.string()},
        {"word_count", chapter.wordCount},
        {"status", ChapterStatusToString(chapter.status)},
        {"current_version", chapter.currentVersion},
        {"created_at", ToMillis(chapter.createdAt)},
        {"modified_at", ToMillis(chapter.modifiedAt)}
    };
}

Chapter ProjectJsonCodec::ChapterFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] { return DecodeChapter(j); });
}

json ProjectJsonCodec::VersionToJson(const ChapterVersion& version) {
    return {
        {"version", version.version},
        {"content", version.content},
        {"word_count", version.wordCount},
        {"summary", version.summary},
        {"timestamp", ToMillis(version.timestamp)}
    };
}

ChapterVersion ProjectJsonCodec::VersionFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] {
        ChapterVersion version;
        version.version = j.at("version").get<std::uint32_t>();
        version.content = j.at("content").get<std::string>();
        version.wordCount = j.value("word_count", CountWords(version.content));
        version.summary = j.value("summary", std::string{});
        version.timestamp = FromMillis(j.value("timestamp", 0LL));
        return version;
    });
}

json ProjectJsonCodec::VolumeToJson(const Volume& volume) {
    return {
        {"id", volume.id.value},
        {"title", volume.title},
        {"order", volume.order},
        {"chapter_ids", ChapterIdsToJson(volume.chapterIds)},
        {"description", volume.description},
        {"created_at", ToMillis(volume.createdAt)},
        {"modified_at", ToMillis(volume.modifiedAt)}
    };
}

json ProjectJsonCodec::ProjectToJson(const NovelProject& project) {
    json volumes = json::array();
    for (const auto& volume : project.volumes) {
        volumes.push_back(VolumeToJson(volume));
    }

    json chapters = json::array();
    for (const auto& [id, chapter] : project.chapters) {
        chapters.push_back(ChapterToJson(chapter));
    }

    return {
        {"title", project.title},
        {"created_at", ToMillis(project.createdAt)},
        {"modified_at", ToMillis(project.modifiedAt)},
        {"next_chapter_id", project.nextChapterId},
        {"volumes", volumes},
        {"chapters", chapters},
        {"settings_summary", {
            {"characters", project.settings.characters.size()},
            {"world", project.settings.world.size()},
            {"plot_points", project.settings.plotPoints.size()}
        }}
    };
}

NovelProject ProjectJsonCodec::ProjectFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] {
        NovelProject project;
        project.title = j.at("title").get<std::string>();
        project.createdAt = FromMillis(j.value("created_at", 0LL));
        project.modifiedAt = FromMillis(j.value("modified_at", 0LL));
        project.nextChapterId = j.value("next_chapter_id", std::uint64_t{0});

        for (const auto& v : j.at("volumes")) {
            project.volumes.push_back(DecodeVolume(v));
        }
        for (const auto& c : j.value("chapters", json::array())) {
            Chapter chapter = DecodeChapter(c);
            project.chapters.emplace(chapter.id, std::move(chapter));
        }
        return project;
    });
}

json ProjectJsonCodec::CharactersToJson(const std::vector<CharacterProfile>& characters) {
    json arr = json::array();
    for (const auto& c : characters) {
        json entry = {
            {"name", c.name},
            {"age", nullptr},
            {"appearance", c.appearance},
            {"personality", c.personality},
            {"background", c.background},
            {"goals", c.goals},
            {"relationships", c.relationships}
        };
        if (c.age) entry["age"] = *c.age;
        arr.push_back(entry);
    }
    return arr;
}

std::vector<CharacterProfile> ProjectJsonCodec::CharactersFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] {
        if (!j.is_array()) {
            throw std::invalid_argument("expected a JSON array");
        }
        std::vector<CharacterProfile> characters;
        for (const auto& item : j) {
            CharacterProfile c;
            c.name = item.at("name").get<std::string>();
            if (item.contains("age") && !item["age"].is_null()) {
                c.age = item["age"].get<std::uint32_t>();
            }
            c.appearance = item.value("appearance", std::string{});
            c.personality = item.value("personality", std::string{});
            c.background = item.value("background", std::string{});
            c.goals = item.value("goals", std::string{});
            c.relationships = item.value("relationships", std::map<std::string, std::string>{});
            characters.push_back(std::move(c));
        }
        return characters;
    });
}

json ProjectJsonCodec::WorldToJson(const std::vector<WorldSetting>& world) {
    json arr = json::array();
    for (const auto& w : world) {
        arr.push_back({
            {"name", w.name},
            {"description", w.description},
            {"rules", w.rules}
        });
    }
    return arr;
}

std::vector<WorldSetting> ProjectJsonCodec::WorldFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] {
        if (!j.is_array()) {
            throw std::invalid_argument("expected a JSON array");
        }
        std::vector<WorldSetting> world;
        for (const auto& item : j) {
            WorldSetting w;
            w.name = item.at("name").get<std::string>();
            w.description = item.value("description", std::string{});
            w.rules = item.value("rules", std::vector<std::string>{});
            world.push_back(std::move(w));
        }
        return world;
    });
}

json ProjectJsonCodec::PlotToJson(const std::vector<PlotPoint>& plot) {
    json arr = json::array();
    for (const auto& p : plot) {
        arr.push_back({
            {"title", p.title},
            {"description", p.description},
            {"chapter_ids", ChapterIdsToJson(p.chapterIds)},
            {"order", p.order}
        });
    }
    return arr;
}

std::vector<PlotPoint> ProjectJsonCodec::PlotFromJson(const json& j, const fs::path& source) {
    return Decode(source, [&] {
        if (!j.is_array()) {
            throw std::invalid_argument("expected a JSON array");
        }
        std::vector<PlotPoint> plot;
        for (const auto& item : j) {
            PlotPoint p;
            p.title = item.at("title").get<std::string>();
            p.description = item.value("description", std::string{});
            p.chapterIds = ChapterIdsFromJson(item.value("chapter_ids", json::array()));
            p.order = item.value("order", std::size_t{0});
            plot.push_back(std::move(p));
        }
        return plot;
    });
}

} // namespace novelstore::infrastructure
