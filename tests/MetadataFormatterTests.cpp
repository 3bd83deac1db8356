#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../FilenameParser.hpp"
#include "../MetadataFormatter.hpp"

namespace MF = MetadataFormatter;

class MetadataFormatterTest : public ::testing::Test {
 protected:
  ParsedFilename Parse(const std::string& name) {
    auto parsed = parser.parse(name);
    if (!parsed) {
      ADD_FAILURE() << "could not parse " << name;
      return ParsedFilename{};
    }
    return std::move(*parsed);
  }

  FilenameParser parser;
};

TEST_F(MetadataFormatterTest, ExactDateGetsEveryDateField) {
  auto parsed = Parse("1950.06.15.12.30.45.E.FAM.POR.000001.jpg");

  EXPECT_EQ(MF::format_partial_date(parsed), "1950-06-15");
  EXPECT_EQ(MF::format_full_datetime(parsed), "1950-06-15T12:30:45");
  EXPECT_EQ(MF::format_numeric_datetime(parsed), "1950:06:15 12:30:45");
}

TEST_F(MetadataFormatterTest, PartialDateDegradesWithPrecision) {
  EXPECT_EQ(MF::format_partial_date(
                Parse("1965.08.00.00.00.00.C.TRV.LND.000002.jpg")),
            "1965-08");
  EXPECT_EQ(MF::format_partial_date(
                Parse("1970.00.00.00.00.00.C.FAM.GRP.000004.jpg")),
            "1970");
  EXPECT_FALSE(MF::format_partial_date(
                   Parse("0000.00.00.00.00.00.A.UNK.000.000001.jpg"))
                   .has_value());
}

TEST_F(MetadataFormatterTest, PartialDateNeverCarriesTime) {
  auto parsed = Parse("1950.06.15.23.59.59.E.FAM.POR.000001.jpg");
  EXPECT_EQ(MF::format_partial_date(parsed), "1950-06-15");
}

TEST_F(MetadataFormatterTest, PartialDateZeroPadsMonthAndDay) {
  EXPECT_EQ(MF::format_partial_date(Parse("1950.1.2.0.0.0.C.A.B.1.jpg")),
            "1950-01-02");
  EXPECT_EQ(MF::format_partial_date(Parse("950.1.0.0.0.0.C.A.B.1.jpg")),
            "0950-01");
}

TEST_F(MetadataFormatterTest, FullDateTimeKeepsMidnight) {
  auto parsed = Parse("1950.06.15.00.00.00.E.FAM.POR.000001.jpg");

  EXPECT_EQ(MF::format_full_datetime(parsed), "1950-06-15T00:00:00");
  EXPECT_EQ(MF::format_numeric_datetime(parsed), "1950:06:15 00:00:00");
}

TEST_F(MetadataFormatterTest, OnlyExactModifierGetsDateTimes) {
  for (const char* modifier : {"A", "B", "C", "F", "Z"}) {
    auto parsed = Parse(std::string("1950.06.15.12.30.45.") + modifier +
                        ".FAM.POR.000001.jpg");
    EXPECT_FALSE(MF::format_full_datetime(parsed).has_value()) << modifier;
    EXPECT_FALSE(MF::format_numeric_datetime(parsed).has_value()) << modifier;
    EXPECT_EQ(MF::format_partial_date(parsed), "1950-06-15") << modifier;
  }
}

TEST_F(MetadataFormatterTest, IdentifierIsRandomVersion4Uuid) {
  const std::regex uuid_v4(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    const std::string id = MF::new_identifier();
    EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100);
}

TEST_F(MetadataFormatterTest, IdentifiersStayUniqueAcrossThreads) {
  constexpr size_t kThreads = 8;
  constexpr size_t kPerThread = 250;
  std::vector<std::vector<std::string>> batches(kThreads);

  {
    std::vector<std::jthread> workers;
    for (size_t t = 0; t < kThreads; ++t) {
      workers.emplace_back([&batch = batches[t]] {
        for (size_t i = 0; i < kPerThread; ++i) {
          batch.push_back(MF::new_identifier());
        }
      });
    }
  }

  std::set<std::string> seen;
  for (const auto& batch : batches) {
    seen.insert(batch.begin(), batch.end());
  }
  EXPECT_EQ(seen.size(), kThreads * kPerThread);
}

TEST_F(MetadataFormatterTest, PlanForExactDate) {
  auto plan =
      MF::build_metadata_plan(Parse("1950.06.15.12.30.00.E.FAM.POR.000001.tiff"));

  ASSERT_EQ(plan.exif.count(MF::kExifDateTimeOriginal), 1);
  EXPECT_EQ(plan.exif.at(MF::kExifDateTimeOriginal), "1950:06:15 12:30:00");
  EXPECT_EQ(plan.xmp.at(MF::kXmpIptcDateCreated), "1950-06-15");
  EXPECT_EQ(plan.xmp.at(MF::kXmpPhotoshopDateCreated), "1950-06-15T12:30:00");
  ASSERT_EQ(plan.xmp.count(MF::kXmpIdentifier), 1);
  EXPECT_EQ(plan.xmp.at(MF::kXmpIdentifier), plan.xmp.at(MF::kXmpDocumentId));
}

TEST_F(MetadataFormatterTest, PlanForCircaMonthHasNoDateTime) {
  auto plan =
      MF::build_metadata_plan(Parse("1950.06.00.00.00.00.C.FAM.POR.000002.jpg"));

  EXPECT_TRUE(plan.exif.empty());
  EXPECT_EQ(plan.xmp.count(MF::kXmpPhotoshopDateCreated), 0);
  EXPECT_EQ(plan.xmp.at(MF::kXmpIptcDateCreated), "1950-06");
  EXPECT_EQ(plan.xmp.count(MF::kXmpIdentifier), 1);
}

TEST_F(MetadataFormatterTest, PlanForAbsentDateOnlyHasIdentifier) {
  auto plan =
      MF::build_metadata_plan(Parse("0000.00.00.00.00.00.A.UNK.000.000001.jpg"));

  EXPECT_TRUE(plan.exif.empty());
  EXPECT_EQ(plan.xmp.size(), 2);
  EXPECT_EQ(plan.xmp.count(MF::kXmpIdentifier), 1);
  EXPECT_EQ(plan.xmp.count(MF::kXmpDocumentId), 1);
}

TEST_F(MetadataFormatterTest, EachPlanGetsFreshIdentifier) {
  auto parsed = Parse("1950.06.15.12.30.00.E.FAM.POR.000001.tiff");
  auto first = MF::build_metadata_plan(parsed);
  auto second = MF::build_metadata_plan(parsed);

  EXPECT_NE(first.xmp.at(MF::kXmpIdentifier),
            second.xmp.at(MF::kXmpIdentifier));
}
