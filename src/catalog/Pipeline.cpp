#include "catalog/Pipeline.hpp"

#include "catalog/CatalogDocument.hpp"
#include "catalog/Errors.hpp"
#include "catalog/Snapshots.hpp"
#include "io/Artifacts.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace catalog {

const char* index_mode_str(IndexMode m) {
    switch (m) {
        case IndexMode::Headings: return "headings";
        case IndexMode::UpwardScan: return "upward_scan";
        case IndexMode::Skipped: return "skipped";
    }
    return "unknown";
}

static std::string span_str(const Section& s) {
    std::ostringstream oss;
    oss << "[" << s.start_line << ", " << s.stop_line << ")";
    return oss.str();
}

static ProgramNames program_listing(const Config& cfg, const CatalogDocument& doc,
                                    const std::vector<std::string>& valid_colleges,
                                    const Diagnostics& diag) {
    const fs::path listing = cfg.layout.program_names(doc.catalog_date());
    if (cfg.options.reuse_program_names && fs::exists(listing)) {
        diag.info("  program names: reusing " + listing.string());
        return io::load_program_names(listing);
    }
    return extract_program_names(doc, valid_colleges);
}

PipelineResult run_catalog_pipeline(const Config& cfg, const Diagnostics& diag) {
    PipelineResult res;
    SectionIndexer indexer(cfg.options.fence);

    for (const auto& path : list_catalog_files(cfg.paths.text_dir)) {
        const std::string name = path.filename().string();
        auto date = catalog_date_from_filename(name);
        if (!date) {
            diag.warn("skipping " + name + ": expected catalog_<YYYY>_<MM>.txt");
            continue;
        }

        diag.info("\nCATALOG: " + *date + " (" + name + ")");

        CatalogDocument doc;
        try {
            doc = CatalogDocument::load(path);
        } catch (const CatalogError& e) {
            if (is_fatal(e.kind())) throw;
            diag.warn(*date + ": " + e.what());
            res.failures.push_back({*date, "", "", e.kind(), e.what()});
            continue;
        }
        const std::vector<std::string>& valid = pick_snapshot(*date, cfg.valid_colleges);

        DateSummary sum;
        sum.catalog_date = *date;
        sum.source_file = name;

        ProgramNames programs = program_listing(cfg, doc, valid, diag);
        diag.info("  colleges: " + std::to_string(programs.colleges().size()));

        if (!programs.empty()) {
            sum.mode = IndexMode::Headings;
            IndexReport rep = indexer.index_headings(doc, programs);
            sum.sections_found = rep.found;
            sum.section_issues = static_cast<int>(rep.failures.size());
            for (const auto& f : rep.failures) {
                diag.warn(*date + " / " + f.college + ": " + f.message);
                res.failures.push_back(f);
            }
        } else {
            try {
                FallbackSection fb = indexer.index_upward_scan(doc, valid);
                sum.mode = IndexMode::UpwardScan;
                sum.sections_found = 1;
                diag.info("  no program listing, guessed " + fb.college + " / " + fb.degree);
            } catch (const CatalogError& e) {
                if (is_fatal(e.kind())) throw;
                sum.mode = IndexMode::Skipped;
                sum.section_issues = 1;
                diag.warn(*date + ": " + e.what());
                res.failures.push_back({*date, "", "", e.kind(), e.what()});
            }
        }

        if (const DateSections* ds = indexer.index().find_date(*date)) {
            for (const auto& c : ds->colleges) {
                for (const auto& d : c.degrees) diag.trace(c.college + " / " + d.degree + " at " + span_str(d.span));
            }
            SectionScanStats st = res.courses.add_date(doc, *ds);
            sum.rows = st.rows;
            sum.indexed = st.indexed;
            sum.anomalies = st.anomalies;
        }

        diag.info("  summary: " + std::to_string(sum.sections_found) + " ok / " +
                  std::to_string(sum.section_issues) + " issues, " +
                  std::to_string(sum.rows) + " rows (" + std::to_string(sum.anomalies) + " anomalies)");

        res.program_names[*date] = std::move(programs);
        res.dates.push_back(std::move(sum));
    }

    res.sections = indexer.release();

    for (const auto& sum : res.dates) {
        const ProgramNames& programs = res.program_names.at(sum.catalog_date);
        if (programs.empty()) {
            diag.info("degree snapshot skipped for " + sum.catalog_date + ": no program listing");
            continue;
        }

        const std::string& version = pick_snapshot_version(sum.catalog_date, cfg.college_order);
        DegreeSnapshot snap = build_degree_snapshot(sum.catalog_date, programs, cfg.duplicates,
                                                    version, cfg.college_order.at(version));
        for (const auto& c : snap.unlisted_colleges) {
            diag.warn(sum.catalog_date + ": college '" + c + "' is not in snapshot " + version + ", left out of degree snapshot");
        }
        res.degree_snapshots.push_back(std::move(snap));
    }

    return res;
}

std::vector<std::string> write_run_outputs(const Config& cfg, const PipelineResult& res) {
    std::vector<std::string> outputs;
    const OutputLayout& L = cfg.layout;

    for (const auto& sum : res.dates) {
        const std::string& date = sum.catalog_date;

        const fs::path names = L.program_names(date);
        io::write_json_file(names, io::program_names_to_json(res.program_names.at(date)));
        outputs.push_back(names.string());

        const fs::path raw = L.raw_rows(date);
        io::write_string_array(raw, res.courses.raw_rows(date));
        outputs.push_back(raw.string());

        const fs::path anomalies = L.anomalies(date);
        io::write_string_array(anomalies, res.courses.anomaly_lines(date));
        outputs.push_back(anomalies.string());
    }

    io::SectionsIndexArtifact{res.sections}.write_to(L.sections_index());
    outputs.push_back(L.sections_index().string());

    io::DegreeSnapshotsArtifact{res.degree_snapshots}.write_to(L.degree_snapshots());
    outputs.push_back(L.degree_snapshots().string());

    io::CourseIndexArtifact{res.courses.index()}.write_to(L.course_index());
    outputs.push_back(L.course_index().string());

    io::write_courses_flat_csv(L.courses_flat_csv(), res.courses.index());
    outputs.push_back(L.courses_flat_csv().string());

    io::write_courses_with_college_csv(L.courses_with_college_csv(), res.courses.index());
    outputs.push_back(L.courses_with_college_csv().string());

    return outputs;
}

}  // namespace catalog
