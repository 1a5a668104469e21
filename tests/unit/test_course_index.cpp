/**
 * @file test_course_index.cpp
 * @brief Unit tests for the course index aggregator and anomaly capture
 */

#include <gtest/gtest.h>
#include <catalog/CourseIndex.hpp>

using namespace catalog;

static const char* kCcn = "CCN Course Number Title CUs Term";

TEST(CourseIndexTest, CanonicalFieldsComeFromFirstInstance) {
    auto d1 = CatalogDocument::from_lines("2018-07", {
        kCcn,
        "BUS 1010 C100 Intro to Business 3 1",
    });
    auto d2 = CatalogDocument::from_lines("2019-01", {
        kCcn,
        "C100 Introduction to Business 4 1",
    });

    CourseIndexAggregator agg;
    agg.add_section(d1, "College of Business", "BS Business", Section{0, 2});
    agg.add_section(d2, "College of Business", "BS Business", Section{0, 2});

    const CourseIndexEntry* e = agg.index().find("C100");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->canonical_title, "Intro to Business");
    EXPECT_EQ(e->canonical_credit_units, 3);
    ASSERT_EQ(e->instances.size(), 2u);
    EXPECT_EQ(e->instances[0].pattern, PatternId::CcnFull);
    EXPECT_EQ(e->instances[1].pattern, PatternId::CodeOnly);
    EXPECT_EQ(e->instances[1].catalog_date, "2019-01");
    EXPECT_EQ(e->instances[1].raw, "C100 Introduction to Business 4 1");
}

TEST(CourseIndexTest, FooterClosesBlockAndNextHeaderReopensIt) {
    auto doc = CatalogDocument::from_lines("2018-07", {
        kCcn,                                     // 0
        "C100 Intro to Business 3 1",             // 1
        "Total CUs 3",                            // 2
        "Narrative text about the program 1 2",   // 3 outside any block
        kCcn,                                     // 4
        "",                                       // 5
        "C200 Accounting I 3 2",                  // 6
    });

    CourseIndexAggregator agg;
    SectionScanStats st = agg.add_section(doc, "College of Business", "BS Business", Section{0, 7});
    EXPECT_EQ(st.rows, 2);
    EXPECT_EQ(st.indexed, 2);
    EXPECT_EQ(st.anomalies, 0);

    EXPECT_EQ(agg.index().size(), 2u);
    EXPECT_EQ(agg.raw_rows("2018-07"),
              (std::vector<std::string>{"C100 Intro to Business 3 1", "C200 Accounting I 3 2"}));
}

TEST(CourseIndexTest, UnmatchedAndCodelessRowsBecomeAnomalies) {
    auto doc = CatalogDocument::from_lines("2018-07", {
        kCcn,
        "Special Topics Seminar abc 3",
        "capstone for nursing 4 3",
        "C100 Intro to Business 3 1",
    });

    CourseIndexAggregator agg;
    SectionScanStats st = agg.add_section(doc, "College of Health", "BS Nursing", Section{0, 4});
    EXPECT_EQ(st.rows, 3);
    EXPECT_EQ(st.indexed, 1);
    EXPECT_EQ(st.anomalies, 2);

    ASSERT_EQ(agg.anomalies().size(), 2u);
    EXPECT_EQ(agg.anomalies()[0].raw, "Special Topics Seminar abc 3");
    EXPECT_EQ(agg.anomalies()[0].reason, AnomalyReason::Unmatched);
    EXPECT_EQ(agg.anomalies()[1].reason, AnomalyReason::NoCode);
    EXPECT_EQ(agg.anomalies()[1].degree, "BS Nursing");

    EXPECT_EQ(agg.anomaly_lines("2018-07"),
              (std::vector<std::string>{"Special Topics Seminar abc 3", "capstone for nursing 4 3"}));
    EXPECT_TRUE(agg.anomaly_lines("2019-01").empty());

    // anomalies never reach the index
    EXPECT_EQ(agg.index().size(), 1u);
    for (const auto& e : agg.index().entries()) {
        for (const auto& inst : e.instances) EXPECT_NE(inst.raw, "Special Topics Seminar abc 3");
    }
}

TEST(CourseIndexTest, AddDateWalksEverySection) {
    auto doc = CatalogDocument::from_lines("2019-01", {
        "BS Accounting",
        kCcn,
        "ACCT 1010 C200 Accounting I 3 1",
        "BS Finance",
        kCcn,
        "FIN 2010 C210 Corporate Finance 3 2",
        "ACCT 1010 C200 Accounting I 3 1",
    });
    ProgramNames p;
    p.set("College of Business", {"BS Accounting", "BS Finance"});

    SectionIndexer ix;
    ix.index_headings(doc, p);

    CourseIndexAggregator agg;
    SectionScanStats st = agg.add_date(doc, *ix.index().find_date("2019-01"));
    EXPECT_EQ(st.rows, 3);
    EXPECT_EQ(st.indexed, 3);

    ASSERT_EQ(agg.index().entries().size(), 2u);
    EXPECT_EQ(agg.index().entries()[0].code, "C200");
    const CourseIndexEntry* c200 = agg.index().find("C200");
    ASSERT_NE(c200, nullptr);
    ASSERT_EQ(c200->instances.size(), 2u);
    EXPECT_EQ(c200->instances[1].degree, "BS Finance");
    EXPECT_TRUE(agg.raw_rows("1999-01").empty());
}

TEST(CourseIndexTest, SharedBlockIsWrittenOncePerDate) {
    // both degrees resolve to the first CCN block, so their sections coincide
    auto doc = CatalogDocument::from_lines("2019-01", {
        "College of Business",            // 0
        "BS Accounting",                  // 1
        "BS Finance",                     // 2
        kCcn,                             // 3
        "C200 Accounting I 3 1",          // 4
        "Special Topics Seminar abc 3",   // 5
        "Total CUs 6",                    // 6
    });
    ProgramNames p = extract_program_names(doc, {"College of Business"});

    SectionIndexer ix;
    ASSERT_EQ(ix.index_headings(doc, p).found, 2);
    const Section* a = ix.index().find("2019-01", "College of Business", "BS Accounting");
    const Section* b = ix.index().find("2019-01", "College of Business", "BS Finance");
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(a->start_line, b->start_line);

    CourseIndexAggregator agg;
    agg.add_date(doc, *ix.index().find_date("2019-01"));

    EXPECT_EQ(agg.anomaly_lines("2019-01"), std::vector<std::string>{"Special Topics Seminar abc 3"});
    EXPECT_EQ(agg.raw_rows("2019-01"),
              (std::vector<std::string>{"C200 Accounting I 3 1", "Special Topics Seminar abc 3"}));

    // per-degree context is kept
    ASSERT_EQ(agg.anomalies().size(), 2u);
    EXPECT_EQ(agg.anomalies()[0].degree, "BS Accounting");
    EXPECT_EQ(agg.anomalies()[1].degree, "BS Finance");
    EXPECT_EQ(agg.anomalies()[0].line, 5u);
    ASSERT_NE(agg.index().find("C200"), nullptr);
    EXPECT_EQ(agg.index().find("C200")->instances.size(), 2u);
}
