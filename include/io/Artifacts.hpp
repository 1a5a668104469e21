#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "catalog/CourseIndex.hpp"
#include "catalog/DegreeSnapshotBuilder.hpp"
#include "catalog/SectionIndexer.hpp"

namespace io {

// {date: {college: {degree: [start, stop]}}}
struct SectionsIndexArtifact {
    const catalog::SectionsIndex& index;

    nlohmann::ordered_json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// {date: {college: [degree, ...]}}
struct DegreeSnapshotsArtifact {
    const std::vector<catalog::DegreeSnapshot>& snapshots;

    nlohmann::ordered_json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// {code: {canonical_title, canonical_cus, instances: [...]}}
struct CourseIndexArtifact {
    const catalog::CourseIndex& index;

    nlohmann::ordered_json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// CourseCode, CourseName
void write_courses_flat_csv(const std::filesystem::path& out_path, const catalog::CourseIndex& index);

// CourseCode, CourseName, Colleges ("; "-joined, sorted, unique)
void write_courses_with_college_csv(const std::filesystem::path& out_path, const catalog::CourseIndex& index);

std::vector<std::string> colleges_of(const catalog::CourseIndexEntry& e);

void write_string_array(const std::filesystem::path& out_path, const std::vector<std::string>& items);

}  // namespace io
