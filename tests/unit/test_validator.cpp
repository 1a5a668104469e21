/**
 * @file test_validator.cpp
 * @brief Unit tests for re-checking written indexes against the catalog texts
 */

#include <gtest/gtest.h>
#include <catalog/Validator.hpp>
#include <io/JsonIO.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace catalog;
using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

class ValidatorTest : public ::testing::Test {
protected:
    fs::path dir;
    ValidationInputs vin;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("catalog_validator_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        fs::create_directories(dir / "texts");

        std::ofstream(dir / "texts" / "catalog_2018_07.txt")
            << "College of Business\n"
            << "Bachelor of Science, Business\n"
            << "CCN Course Number Title CUS Term\n"
            << "BUS 1010 C100 Intro to Business 3 1\n"
            << "Total CUs 120\n";

        vin.text_dir = (dir / "texts").string();
        vin.sections_index_path = (dir / "sections.json").string();
        vin.course_index_path = (dir / "courses.json").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void write_indexes(const json& sections, const json& courses) {
        io::write_json_file(vin.sections_index_path, sections);
        io::write_json_file(vin.course_index_path, courses);
    }

    static json good_sections() {
        return json::parse(R"({"2018-07": {"College of Business": {"Bachelor of Science, Business": [2, 4]}}})");
    }

    static json good_courses() {
        return json::parse(R"({"C100": {
            "canonical_title": "Intro to Business",
            "canonical_cus": 3,
            "instances": [{
                "catalog_date": "2018-07",
                "college": "College of Business",
                "degree": "Bachelor of Science, Business",
                "pattern": "CCN_FULL",
                "raw": "BUS 1010 C100 Intro to Business 3 1"
            }]
        }})");
    }

    static bool has_code(const ValidationReport& rep, const std::string& code) {
        return std::any_of(rep.errors.begin(), rep.errors.end(),
                           [&](const ValidationError& e) { return e.code == code; });
    }
};

TEST_F(ValidatorTest, ConsistentRunPasses) {
    write_indexes(good_sections(), good_courses());

    ValidationReport rep = validate_run(vin);
    EXPECT_TRUE(rep.pass);
    EXPECT_EQ(rep.sections_checked, 1);
    EXPECT_EQ(rep.courses_checked, 1);
    EXPECT_TRUE(rep.errors.empty());

    const fs::path out = dir / "report.json";
    write_validation_report(out, rep);
    EXPECT_TRUE(io::read_json_file(out).at("pass").get<bool>());
}

TEST_F(ValidatorTest, BrokenSpansAndCanonicalsAreReported) {
    json sections = good_sections();
    sections["2018-07"]["College of Business"]["Bachelor of Science, Business"] = json::array({1, 4});
    sections["2018-07"]["College of Business"]["Bachelor of Science, Finance"] = json::array({3, 9});

    json courses = good_courses();
    courses["C100"]["canonical_cus"] = 4;

    write_indexes(sections, courses);

    ValidationReport rep = validate_run(vin);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "section_not_anchored"));
    EXPECT_TRUE(has_code(rep, "section_out_of_bounds"));
    EXPECT_TRUE(has_code(rep, "canonical_mismatch"));
}

TEST_F(ValidatorTest, MissingInputsAreReported) {
    ValidationReport rep = validate_run(vin);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "missing_file"));
}

TEST_F(ValidatorTest, InstanceOutsideKnownSectionsIsReported) {
    json courses = good_courses();
    courses["C100"]["instances"][0]["degree"] = "Bachelor of Science, Marketing";
    write_indexes(good_sections(), courses);

    ValidationReport rep = validate_run(vin);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "unknown_section"));
}
