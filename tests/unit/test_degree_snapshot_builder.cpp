/**
 * @file test_degree_snapshot_builder.cpp
 * @brief Unit tests for canonical per-date degree snapshots
 */

#include <gtest/gtest.h>
#include <catalog/DegreeSnapshotBuilder.hpp>
#include <catalog/Errors.hpp>

using namespace catalog;

static const std::vector<std::string> kOrder = {
    "College of Business",
    "College of Information Technology",
    kCertificatesCollege,
};

// ============================================================================
// Normalisation
// ============================================================================

TEST(DegreeSnapshotBuilderTest, DegreesAreResolvedDedupedAndSorted) {
    ProgramNames p;
    p.set("College of Information Technology", {"BS Cloud", "BS Data Analytics"});
    p.set("College of Business", {"BS Marketing", "B.S. Accounting", "BS Accounting", "BS Marketing"});

    DuplicatesMap dups{{"B.S. Accounting", "BS Accounting"}};

    DegreeSnapshot s = build_degree_snapshot("2020-01", p, dups, "2019-06", kOrder);
    EXPECT_EQ(s.catalog_date, "2020-01");
    EXPECT_EQ(s.snapshot_version, "2019-06");

    // canonical order, not listing order; no certificates bucket when none were listed
    ASSERT_EQ(s.colleges.size(), 2u);
    EXPECT_EQ(s.colleges[0].first, "College of Business");
    EXPECT_EQ(s.colleges[0].second, (std::vector<std::string>{"BS Accounting", "BS Marketing"}));
    EXPECT_EQ(s.colleges[1].first, "College of Information Technology");
    EXPECT_TRUE(s.unlisted_colleges.empty());
}

TEST(DegreeSnapshotBuilderTest, DuplicatesLookupIsTrimmed) {
    DuplicatesMap dups{{"BS Acct", "  BS Accounting "}};
    EXPECT_EQ(resolve_degree_name(" BS Acct ", dups), "BS Accounting");
    EXPECT_EQ(resolve_degree_name(" BS Finance", dups), "BS Finance");
}

TEST(DegreeSnapshotBuilderTest, CertificatesTakeTheirCanonicalSlot) {
    ProgramNames p;
    p.set(kCertificatesCollege, {"Cert B", "Cert A"});
    p.set("College of Business", {"BS Accounting"});
    p.set("College of Information Technology", {"BS Cloud"});

    DegreeSnapshot s = build_degree_snapshot("2020-01", p, {}, "2019-06", kOrder);
    ASSERT_EQ(s.colleges.size(), 3u);
    EXPECT_EQ(s.colleges[2].first, kCertificatesCollege);
    EXPECT_EQ(s.colleges[2].second, (std::vector<std::string>{"Cert A", "Cert B"}));
}

TEST(DegreeSnapshotBuilderTest, CertificatesAppendedWhenOrderOmitsThem) {
    ProgramNames p;
    p.set(kCertificatesCollege, {"Cert A"});
    p.set("College of Business", {"BS Accounting"});

    DegreeSnapshot s = build_degree_snapshot("2020-01", p, {}, "2018-01", {"College of Business"});
    ASSERT_EQ(s.colleges.size(), 2u);
    EXPECT_EQ(s.colleges.back().first, kCertificatesCollege);
}

TEST(DegreeSnapshotBuilderTest, UnlistedCollegesAreReported) {
    ProgramNames p;
    p.set("College of Business", {"BS Accounting"});
    p.set("College of Health Professions", {"BS Nursing"});

    DegreeSnapshot s = build_degree_snapshot("2020-01", p, {}, "2018-01", {"College of Business"});
    ASSERT_EQ(s.colleges.size(), 1u);
    EXPECT_EQ(s.unlisted_colleges, std::vector<std::string>{"College of Health Professions"});
}

// ============================================================================
// Violations
// ============================================================================

TEST(DegreeSnapshotBuilderTest, CertificateInBothPlacesThrows) {
    ProgramNames p;
    p.set("College of Business", {"BS Accounting", "Project Management Certificate"});
    p.set("College of Information Technology", {"BS Cloud"});
    p.set(kCertificatesCollege, {"Project Management Certificate"});

    try {
        build_degree_snapshot("2020-01", p, {}, "2019-06", kOrder);
        FAIL() << "expected DuplicateCertificateError";
    } catch (const DuplicateCertificateError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DuplicateCertificate);
        EXPECT_NE(std::string(e.what()).find("Project Management Certificate"), std::string::npos);
    }
}

TEST(DegreeSnapshotBuilderTest, EmbeddedCertificateAloneIsFine) {
    ProgramNames p;
    p.set("College of Business", {"Project Management Certificate"});
    p.set("College of Information Technology", {"BS Cloud"});

    EXPECT_NO_THROW(build_degree_snapshot("2020-01", p, {}, "2019-06", kOrder));
}

TEST(DegreeSnapshotBuilderTest, MissingCanonicalCollegeThrows) {
    ProgramNames p;
    p.set("College of Business", {"BS Accounting"});

    try {
        build_degree_snapshot("2020-01", p, {}, "2019-06", kOrder);
        FAIL() << "expected MissingCollegeError";
    } catch (const MissingCollegeError& e) {
        EXPECT_TRUE(is_fatal(e.kind()));
        EXPECT_EQ(std::string(e.what()),
                  "missing expected college 'College of Information Technology' in 2020-01 (snapshot 2019-06)");
    }
}
