/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "GSMP.hpp"
#include <fstream>
#include <cstdio>

using namespace GSMP;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "# site model run\n";
            config << "[SITE_MODEL]\n";
            config << "vs30_files = usgs.csv, local.csv\n";
            config << "measured_files = local.csv\n";
            config << "exposure_files = exposure.csv   # assets\n";
            config << "grid_spacing = 10\n";
            config << "assoc_distance = 2.5\n";
            config << "output = out/site_model.csv\n";
            config << "\n[AUXILIARY]\n";
            config << "; regressions\n";
            config << "z1pt0 = true\n";
            config << "z2pt5 = yes\n";
            config << "vs30measured = on\n";
            config << "z2pt5_model = CB14_JAPAN\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFileFails) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ReadValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_DOUBLE_EQ(reader.getDouble("SITE_MODEL", "grid_spacing", 0.0), 10.0);
    EXPECT_EQ(reader.getString("SITE_MODEL", "output"), "out/site_model.csv");
    EXPECT_TRUE(reader.getBool("AUXILIARY", "z2pt5", false));
    EXPECT_TRUE(reader.getBool("AUXILIARY", "vs30measured", false));

    // Inline comment stripped
    EXPECT_EQ(reader.getString("SITE_MODEL", "exposure_files"), "exposure.csv");
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getString("nonexistent", "key", "fallback"), "fallback");
    EXPECT_DOUBLE_EQ(reader.getDouble("nonexistent", "key", 3.14), 3.14);
    EXPECT_FALSE(reader.getBool("SITE_MODEL", "output", false));
}

TEST_F(ConfigReaderTest, StringArray) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto files = reader.getStringArray("SITE_MODEL", "vs30_files");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "usgs.csv");
    EXPECT_EQ(files[1], "local.csv");
}

TEST_F(ConfigReaderTest, HasSectionAndKey) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("SITE_MODEL"));
    EXPECT_TRUE(reader.hasSection("AUXILIARY"));
    EXPECT_FALSE(reader.hasSection("nonexistent"));

    EXPECT_TRUE(reader.hasKey("SITE_MODEL", "grid_spacing"));
    EXPECT_FALSE(reader.hasKey("SITE_MODEL", "site_files"));
    EXPECT_FALSE(reader.hasKey("nonexistent", "grid_spacing"));
}

TEST_F(ConfigReaderTest, ParseSiteModelConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    SiteModelConfig config;
    ASSERT_TRUE(reader.parseSiteModelConfig(config));

    ASSERT_EQ(config.vs30_files.size(), 2u);
    ASSERT_EQ(config.measured_files.size(), 1u);
    EXPECT_EQ(config.measured_files[0], "local.csv");
    ASSERT_EQ(config.exposure_files.size(), 1u);
    EXPECT_TRUE(config.site_files.empty());
    EXPECT_DOUBLE_EQ(config.grid_spacing_km, 10.0);
    EXPECT_DOUBLE_EQ(config.assoc_distance_km, 2.5);
    EXPECT_EQ(config.output_file, "out/site_model.csv");
    EXPECT_EQ(config.mode(), SiteSourceMode::GRID);

    EXPECT_TRUE(config.derive_z1pt0);
    EXPECT_TRUE(config.derive_z2pt5);
    EXPECT_TRUE(config.derive_vs30measured);
    EXPECT_EQ(config.z1pt0_model, "CHIOU_YOUNGS_2014");
    EXPECT_EQ(config.z2pt5_model, "CB14_JAPAN");

    // Untouched keys keep their defaults
    EXPECT_EQ(config.input_crs, "EPSG:4326");
    EXPECT_FALSE(config.vs30measured_default);
}

TEST_F(ConfigReaderTest, ValidateLoadedFile) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, ValidateWithoutSiteModelSection) {
    ConfigReader reader;
    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.errors.empty());
}

TEST(ConfigValidationTest, RejectsBadValues) {
    SiteModelConfig config;
    config.vs30_files = {"vs30.csv"};
    config.exposure_files = {"exposure.csv"};
    EXPECT_TRUE(ConfigReader::validateConfig(config).valid);

    SiteModelConfig bad = config;
    bad.grid_spacing_km = -1.0;
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);

    bad = config;
    bad.assoc_distance_km = 0.0;
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);

    bad = config;
    bad.vs30_files.clear();
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);

    bad = config;
    bad.exposure_files.clear();
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);

    bad = config;
    bad.derive_z1pt0 = true;
    bad.z1pt0_model = "NOT_A_MODEL";
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);

    // A z2pt5 regression cannot fill the z1pt0 column
    bad = config;
    bad.derive_z1pt0 = true;
    bad.z1pt0_model = "CAMPBELL_BOZORGNIA_2014";
    EXPECT_FALSE(ConfigReader::validateConfig(bad).valid);
}

TEST(ConfigValidationTest, WarnsOnUnknownMeasuredFile) {
    SiteModelConfig config;
    config.vs30_files = {"vs30.csv"};
    config.site_files = {"sites.csv"};
    config.derive_vs30measured = true;
    config.measured_files = {"other.csv"};

    auto result = ConfigReader::validateConfig(config);
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.warnings.empty());
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValidLayout) {
    const std::string tmpl = "test_template_" + std::to_string(rank) + ".config";
    ConfigReader::generateTemplate(tmpl);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(tmpl));

    SiteModelConfig config;
    ASSERT_TRUE(reader.parseSiteModelConfig(config));
    EXPECT_EQ(config.vs30_files.size(), 2u);
    EXPECT_TRUE(config.measured_files.empty());
    EXPECT_DOUBLE_EQ(config.grid_spacing_km, 0.0);
    EXPECT_DOUBLE_EQ(config.assoc_distance_km, 5.0);
    EXPECT_TRUE(reader.validate().valid);

    std::remove(tmpl.c_str());
}
