#pragma once
#include "timeline/model.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace nle::persistence {

inline constexpr const char* PROJECT_VERSION = "1.0.0";

struct SaveResult { bool success=false; std::string error; };
struct LoadResult { bool success=false; std::string error; };

// On-disk project: the model plus the view preferences stored beside it
struct ProjectDocument {
    std::string version = PROJECT_VERSION;
    timeline::ProjectState project;
    std::optional<Seconds> playhead;
    std::optional<double> zoom;
    int64_t saved_at = 0;            // ms since epoch; 0 means "now" when serializing
};

std::string serialize_project(const ProjectDocument& doc);

// Version must be present with major "1"; assets, tracks and aspectRatio are required.
// out is only written on success.
LoadResult parse_project(const std::string& json, ProjectDocument& out) noexcept;

SaveResult save_project_json(const ProjectDocument& doc, const std::string& path) noexcept;
LoadResult load_project_json(const std::string& path, ProjectDocument& out) noexcept;

} // namespace nle::persistence
