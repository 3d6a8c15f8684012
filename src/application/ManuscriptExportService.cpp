/**
 * @file ManuscriptExportService.cpp
 * @brief Implementation of ManuscriptExportService.
 */

#include "application/ManuscriptExportService.hpp"

#include <sstream>

namespace novelstore::application {

namespace {

std::string EscapeLatex(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': case '%': case '$': case '#': case '_': case '{': case '}':
                out += '\\';
                out += c;
                break;
            case '~': out += "\\textasciitilde{}"; break;
            case '^': out += "\\textasciicircum{}"; break;
            case '\\': out += "\\textbackslash{}"; break;
            default: out += c;
        }
    }
    return out;
}

} // namespace

std::string ManuscriptExportService::toMarkdown(const domain::NovelProject& project) {
    std::stringstream ss;
    ss << "# " << project.title << "\n\n";

    for (const auto& volume : project.volumes) {
        ss << "## " << volume.title << "\n\n";
        if (!volume.description.empty()) {
            ss << "*" << volume.description << "*\n\n";
        }
        for (const auto* chapter : project.chaptersForVolume(volume.id)) {
            ss << "### " << chapter->title << "\n\n";
            if (!chapter->content.empty()) {
                ss << chapter->content << "\n\n";
            }
        }
    }
    return ss.str();
}

std::string ManuscriptExportService::toLatex(const domain::NovelProject& project) {
    std::stringstream ss;
    ss << "\\documentclass{book}\n";
    ss << "\\title{" << EscapeLatex(project.title) << "}\n";
    ss << "\\begin{document}\n";
    ss << "\\maketitle\n\n";

    for (const auto& volume : project.volumes) {
        ss << "\\part{" << EscapeLatex(volume.title) << "}\n\n";
        for (const auto* chapter : project.chaptersForVolume(volume.id)) {
            ss << "\\chapter{" << EscapeLatex(chapter->title) << "}\n";
            ss << EscapeLatex(chapter->content) << "\n\n";
        }
    }

    ss << "\\end{document}\n";
    return ss.str();
}

} // namespace novelstore::application
