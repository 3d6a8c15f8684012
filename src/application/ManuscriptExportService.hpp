/**
 * @file ManuscriptExportService.hpp
 * @brief Service to export a project's chapters as a single manuscript.
 */

#pragma once

#include <string>

#include "domain/NovelProject.hpp"

namespace novelstore::application {

class ManuscriptExportService {
public:
    /**
     * @brief Exports volumes and chapters, in reading order, to Markdown.
     */
    static std::string toMarkdown(const domain::NovelProject& project);

    /**
     * @brief Exports to a LaTeX book document (volumes as parts, chapters as chapters).
     */
    static std::string toLatex(const domain::NovelProject& project);
};

} // namespace novelstore::application
