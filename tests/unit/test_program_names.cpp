/**
 * @file test_program_names.cpp
 * @brief Unit tests for the front-matter program listing extractor
 */

#include <gtest/gtest.h>
#include <catalog/CatalogDocument.hpp>
#include <catalog/ProgramNames.hpp>

using namespace catalog;

static const char* kCcn = "CCN Course Number Title CUs Term";

TEST(ProgramNamesTest, SchoolOfHeadingsCollectDegrees) {
    auto doc = CatalogDocument::from_lines("2021-03", {
        "School of Business",
        "Bachelor of Science, Accounting",
        "",
        "Bachelor of Science, Marketing",
        "School of Education",
        "Master of Arts, Teaching",
        kCcn,
        "School of Nursing",
        "Bachelor of Science, Nursing",
    });

    ProgramNames p = extract_program_names(doc, {});
    ASSERT_EQ(p.colleges().size(), 2u);
    EXPECT_EQ(p.colleges()[0].college, "School of Business");
    EXPECT_EQ(p.colleges()[0].degrees,
              (std::vector<std::string>{"Bachelor of Science, Accounting", "Bachelor of Science, Marketing"}));
    EXPECT_EQ(p.colleges()[1].college, "School of Education");
    // nothing after the first CCN header is front matter
    EXPECT_FALSE(p.has_college("School of Nursing"));
}

TEST(ProgramNamesTest, ValidCollegeLinesAreHeadings) {
    auto doc = CatalogDocument::from_lines("2018-07", {
        "College of Business",
        "Bachelor of Science, Business",
        kCcn,
    });

    ProgramNames p = extract_program_names(doc, {"College of Business"});
    const CollegePrograms* cp = p.find("College of Business");
    ASSERT_NE(cp, nullptr);
    EXPECT_EQ(cp->degrees, std::vector<std::string>{"Bachelor of Science, Business"});

    // without the snapshot the line is not recognised as a heading
    EXPECT_TRUE(extract_program_names(doc, {}).empty());
}

TEST(ProgramNamesTest, NoiseLinesAreSkipped) {
    auto doc = CatalogDocument::from_lines("2021-03", {
        "School of Technology",
        "Steps to enroll",
        "2021 catalog edition",
        "- see appendix",
        "\xE2\x80\xA2 bullet",
        "Bachelor of Science, Cloud Computing",
        kCcn,
    });

    ProgramNames p = extract_program_names(doc, {});
    ASSERT_EQ(p.colleges().size(), 1u);
    EXPECT_EQ(p.colleges()[0].degrees, std::vector<std::string>{"Bachelor of Science, Cloud Computing"});
}

TEST(ProgramNamesTest, SectionBreaksEndTheCurrentCollege) {
    auto doc = CatalogDocument::from_lines("2021-03", {
        "School of Business",
        "Bachelor of Science, Accounting",
        "Program Outcomes",
        "Graduates will analyse statements",
        "Courses and Descriptions",
        "Stray line",
        kCcn,
    });

    ProgramNames p = extract_program_names(doc, {});
    ASSERT_EQ(p.colleges().size(), 1u);
    EXPECT_EQ(p.colleges()[0].degrees, std::vector<std::string>{"Bachelor of Science, Accounting"});
}

TEST(ProgramNamesTest, RepeatedCollegeKeepsPositionAndLatestListing) {
    ProgramNames p;
    p.set("School of Business", {"A"});
    p.set("School of Education", {"B"});
    p.set("School of Business", {"C", "D"});

    ASSERT_EQ(p.colleges().size(), 2u);
    EXPECT_EQ(p.colleges()[0].college, "School of Business");
    EXPECT_EQ(p.colleges()[0].degrees, (std::vector<std::string>{"C", "D"}));
}

TEST(ProgramNamesTest, HeadingWithoutDegreesIsDropped) {
    auto doc = CatalogDocument::from_lines("2021-03", {
        "School of Business",
        "School of Education",
        "Master of Arts, Teaching",
        kCcn,
    });

    ProgramNames p = extract_program_names(doc, {});
    EXPECT_FALSE(p.has_college("School of Business"));
    EXPECT_TRUE(p.has_college("School of Education"));
}
