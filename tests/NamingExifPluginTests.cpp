#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "../MetadataFormatter.hpp"
#include "../NamingExifPlugin.hpp"
#include "../types.hpp"

namespace fs = std::filesystem;

namespace {

// Records every write instead of touching the file.
class RecordingWriter : public MetadataWriter {
 public:
  explicit RecordingWriter(bool succeed = true) : m_succeed(succeed) {}

  bool write(const fs::path& path, const MetadataPlan& plan) override {
    paths.push_back(path);
    plans.push_back(plan);
    return m_succeed;
  }

  std::vector<fs::path> paths;
  std::vector<MetadataPlan> plans;

 private:
  bool m_succeed;
};

}  // namespace

class NamingExifPluginTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir = fs::temp_directory_path() /
               (std::string("naming_exif_plugin_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
    // Ignore errors during cleanup as they are not part of the test result.
  }

  fs::path CreateDummyFile(const fs::path& relative_path) {
    fs::path full_path = test_dir / relative_path;
    if (full_path.has_parent_path()) {
      fs::create_directories(full_path.parent_path());
    }
    std::ofstream ofs(full_path);
    ofs << "dummy content";
    ofs.close();
    return full_path;
  }

  fs::path test_dir;
  Config config;
};

TEST_F(NamingExifPluginTest, ReportsNameAndVersion) {
  NamingExifPlugin plugin;
  EXPECT_EQ(plugin.name(), "naming_exif");
  EXPECT_EQ(plugin.version(), "0.1.0");
}

TEST_F(NamingExifPluginTest, CanHandleValidNames) {
  NamingExifPlugin plugin;
  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
  EXPECT_TRUE(plugin.can_handle("1950.06.00.00.00.00.C.FAM.POR.000002.jpg"));
  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.TIFF"));
  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.JPG"));
  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.tif"));
  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.jpeg"));
}

TEST_F(NamingExifPluginTest, RejectsUnsupportedOrInvalidNames) {
  NamingExifPlugin plugin;
  EXPECT_FALSE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.png"));
  EXPECT_FALSE(plugin.can_handle("invalid.jpg"));
  EXPECT_FALSE(plugin.can_handle("1950.13.15.00.00.00.E.FAM.POR.000001.tiff"));
}

TEST_F(NamingExifPluginTest, SkipsProcessedFolder) {
  NamingExifPlugin plugin;
  EXPECT_TRUE(
      plugin.can_handle("C:/watch/1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
  EXPECT_FALSE(plugin.can_handle(
      "C:/watch/processed/1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
  EXPECT_FALSE(plugin.can_handle(
      "C:/watch/subfolder/processed/1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
  EXPECT_FALSE(plugin.can_handle(
      "C:/watch/processed/subfolder/1950.06.15.12.00.00.E.FAM.POR.000001.jpg"));
}

TEST_F(NamingExifPluginTest, HandlesFoldersWithSimilarNames) {
  NamingExifPlugin plugin;
  EXPECT_TRUE(plugin.can_handle(
      "C:/watch/my_processed_files/1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
  EXPECT_TRUE(plugin.can_handle(
      "C:/watch/not_processed/1950.06.15.12.00.00.E.FAM.POR.000001.jpg"));
  EXPECT_TRUE(plugin.can_handle(
      "C:/watch/preprocessed/1950.06.15.12.00.00.E.FAM.POR.000001.tiff"));
}

TEST_F(NamingExifPluginTest, SkipsSymbolicLinks) {
  fs::path target = CreateDummyFile("1950.06.15.12.00.00.E.FAM.POR.000001.jpg");
  fs::path link = test_dir / "1950.06.15.12.00.00.E.FAM.POR.000002.jpg";
  fs::create_symlink(target, link);

  NamingExifPlugin plugin;
  EXPECT_TRUE(plugin.can_handle(target));
  EXPECT_FALSE(plugin.can_handle(link));
}

TEST_F(NamingExifPluginTest, ParseAndValidate) {
  NamingExifPlugin plugin;

  auto valid = plugin.parse_and_validate(
      "1950.06.15.12.00.00.E.FAM.POR.000001.tiff");
  ASSERT_TRUE(valid.has_value());
  EXPECT_EQ(valid->year, 1950);

  EXPECT_FALSE(plugin.parse_and_validate("invalid.jpg").has_value());
  EXPECT_FALSE(
      plugin.parse_and_validate("1950.13.15.00.00.00.E.FAM.POR.000001.tiff")
          .has_value());
}

TEST_F(NamingExifPluginTest, ProcessWritesMetadataAndMovesFile) {
  // 1. Arrange
  auto writer = std::make_unique<RecordingWriter>();
  RecordingWriter* recorder = writer.get();
  NamingExifPlugin plugin(std::move(writer));
  fs::path file = CreateDummyFile("1950.06.15.12.30.00.E.FAM.POR.000001.jpg");

  // 2. Act
  bool ok = plugin.process(file, config);

  // 3. Assert
  ASSERT_TRUE(ok);
  ASSERT_EQ(recorder->plans.size(), 1);
  EXPECT_EQ(recorder->paths[0], file);

  const auto& plan = recorder->plans[0];
  EXPECT_EQ(plan.exif.at(MetadataFormatter::kExifDateTimeOriginal),
            "1950:06:15 12:30:00");
  EXPECT_EQ(plan.xmp.at(MetadataFormatter::kXmpPhotoshopDateCreated),
            "1950-06-15T12:30:00");
  EXPECT_EQ(plan.xmp.at(MetadataFormatter::kXmpIptcDateCreated), "1950-06-15");

  EXPECT_FALSE(fs::exists(file));
  EXPECT_TRUE(fs::exists(test_dir / "processed" / file.filename()));
}

TEST_F(NamingExifPluginTest, ProcessRejectsInvalidNameWithoutWriting) {
  auto writer = std::make_unique<RecordingWriter>();
  RecordingWriter* recorder = writer.get();
  NamingExifPlugin plugin(std::move(writer));
  fs::path file = CreateDummyFile("1950.02.30.00.00.00.E.FAM.POR.000002.tiff");

  EXPECT_FALSE(plugin.process(file, config));
  EXPECT_TRUE(recorder->plans.empty());
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(NamingExifPluginTest, ProcessKeepsFileWhenWriteFails) {
  NamingExifPlugin plugin(std::make_unique<RecordingWriter>(false));
  fs::path file = CreateDummyFile("1950.06.15.12.30.00.E.FAM.POR.000001.jpg");

  EXPECT_FALSE(plugin.process(file, config));
  EXPECT_TRUE(fs::exists(file));
  EXPECT_FALSE(fs::exists(test_dir / "processed" / file.filename()));
}

TEST_F(NamingExifPluginTest, ProcessRefusesToOverwriteProcessedFile) {
  NamingExifPlugin plugin(std::make_unique<RecordingWriter>());
  fs::path file = CreateDummyFile("1950.06.15.12.30.00.E.FAM.POR.000001.jpg");
  CreateDummyFile(fs::path("processed") / file.filename());

  EXPECT_FALSE(plugin.process(file, config));
  EXPECT_TRUE(fs::exists(file));
}

TEST_F(NamingExifPluginTest, ProcessUsesConfiguredFolderName) {
  NamingExifPlugin plugin(std::make_unique<RecordingWriter>());
  config.processed_folder = "done";
  ASSERT_TRUE(plugin.initialize(config));
  fs::path file = CreateDummyFile("1965.08.00.00.00.00.C.TRV.LND.000002.jpg");

  ASSERT_TRUE(plugin.process(file, config));
  EXPECT_TRUE(fs::exists(test_dir / "done" / file.filename()));
}

TEST_F(NamingExifPluginTest, AdmissionAndProcessingShareInitializedConfig) {
  // 1. Arrange
  NamingExifPlugin plugin(std::make_unique<RecordingWriter>());
  Config initialized;
  initialized.processed_folder = "done";
  ASSERT_TRUE(plugin.initialize(initialized));
  fs::path file = CreateDummyFile("1950.06.15.12.30.00.E.FAM.POR.000001.jpg");

  // 2. Act
  // The per-call config names a different folder and must not win.
  const bool ok = plugin.process(file, config);

  // 3. Assert
  ASSERT_TRUE(ok);
  const fs::path moved = test_dir / "done" / file.filename();
  EXPECT_TRUE(fs::exists(moved));
  EXPECT_FALSE(fs::exists(test_dir / "processed" / file.filename()));
  EXPECT_FALSE(plugin.can_handle(moved));
  EXPECT_TRUE(plugin.can_handle(test_dir / "processed" / file.filename()));
}

TEST_F(NamingExifPluginTest, InitializedExtensionsGovernAdmission) {
  NamingExifPlugin plugin(std::make_unique<RecordingWriter>());
  config.extensions = {".tiff"};
  ASSERT_TRUE(plugin.initialize(config));

  EXPECT_TRUE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.TIFF"));
  EXPECT_FALSE(plugin.can_handle("1950.06.15.12.00.00.E.FAM.POR.000001.jpg"));
}
