/**
 * @file test_site_model_writer.cpp
 * @brief Unit tests for the site model CSV writer
 */

#include <gtest/gtest.h>
#include "SiteModelWriter.hpp"
#include "SiteModelErrors.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace GSMP;

class SiteModelWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        // One file per rank so ranks never share an output
        output_file = "test_site_model_r" + std::to_string(rank) + ".csv";
    }

    void TearDown() override {
        std::remove(output_file.c_str());
        std::remove((output_file + ".tmp").c_str());
    }

    static bool exists(const std::string& path) {
        std::ifstream f(path);
        return f.good();
    }

    // Files in the destination directory named `<path>.<suffix>`
    static int siblings(const std::string& path) {
        namespace fs = std::filesystem;
        const fs::path target(path);
        const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
        const std::string prefix = target.filename().string() + ".";

        std::error_code ec;
        int n = 0;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().filename().string().rfind(prefix, 0) == 0) n++;
        }
        return n;
    }

    static std::vector<std::string> readLines(const std::string& path) {
        std::ifstream f(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(f, line)) lines.push_back(line);
        return lines;
    }

    static SiteRecord record(double lon, double lat, double vs30) {
        SiteRecord r;
        r.lon = lon;
        r.lat = lat;
        r.vs30 = vs30;
        r.z1pt0 = 41.5;
        r.z2pt5 = 0.6;
        r.vs30measured = true;
        return r;
    }

    std::string output_file;
    int rank;
};

TEST_F(SiteModelWriterTest, HeaderFollowsColumns) {
    SiteModelColumns c;
    EXPECT_EQ(SiteModelWriter(c).header(), "lon,lat,vs30");

    c.z1pt0 = true;
    EXPECT_EQ(SiteModelWriter(c).header(), "lon,lat,vs30,z1pt0");

    c.z1pt0 = false;
    c.vs30measured = true;
    EXPECT_EQ(SiteModelWriter(c).header(), "lon,lat,vs30,vs30measured");

    c.z1pt0 = true;
    c.z2pt5 = true;
    EXPECT_EQ(SiteModelWriter(c).header(), "lon,lat,vs30,z1pt0,z2pt5,vs30measured");
}

TEST_F(SiteModelWriterTest, RowHasOnlyRequestedFields) {
    SiteModelColumns c;
    c.z2pt5 = true;
    EXPECT_EQ(SiteModelWriter(c).formatRecord(record(10.0, 45.0, 300.0)), "10,45,300,0.59999999999999998");

    c.z2pt5 = false;
    c.vs30measured = true;
    EXPECT_EQ(SiteModelWriter(c).formatRecord(record(10.0, 45.0, 300.0)), "10,45,300,true");
}

TEST_F(SiteModelWriterTest, CoordinatesRoundTripExactly) {
    const double lon = 10.123456789012345;
    const double lat = -0.1;

    SiteModelColumns c;
    std::string row = SiteModelWriter(c).formatRecord(record(lon, lat, 312.7));

    std::stringstream ss(row);
    std::string field;
    std::getline(ss, field, ',');
    EXPECT_EQ(std::strtod(field.c_str(), nullptr), lon);
    std::getline(ss, field, ',');
    EXPECT_EQ(std::strtod(field.c_str(), nullptr), lat);
    std::getline(ss, field, ',');
    EXPECT_EQ(std::strtod(field.c_str(), nullptr), 312.7);
}

TEST_F(SiteModelWriterTest, WriteFile) {
    SiteModelColumns c;
    c.z1pt0 = true;
    SiteModelWriter writer(c);

    writer.write(output_file, {record(10.0, 45.0, 300.0), record(11.0, 46.0, 760.0)});

    auto lines = readLines(output_file);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "lon,lat,vs30,z1pt0");
    EXPECT_EQ(lines[1], "10,45,300,41.5");
    EXPECT_EQ(lines[2], "11,46,760,41.5");
    EXPECT_EQ(siblings(output_file), 0);
}

TEST_F(SiteModelWriterTest, EmptyModelWritesHeader) {
    SiteModelWriter writer(SiteModelColumns{});
    writer.write(output_file, {});

    auto lines = readLines(output_file);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "lon,lat,vs30");
}

TEST_F(SiteModelWriterTest, ReplacesExistingFile) {
    SiteModelWriter writer(SiteModelColumns{});
    writer.write(output_file, {record(1.0, 2.0, 3.0), record(4.0, 5.0, 6.0)});
    writer.write(output_file, {record(7.0, 8.0, 9.0)});

    auto lines = readLines(output_file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "7,8,9");
}

TEST_F(SiteModelWriterTest, UnrelatedFileBesideOutputSurvives) {
    const std::string user_file = output_file + ".tmp";
    {
        std::ofstream f(user_file);
        f << "user data\n";
    }

    SiteModelWriter writer(SiteModelColumns{});
    writer.write(output_file, {});
    writer.write(output_file, {record(1.0, 2.0, 3.0)});

    auto kept = readLines(user_file);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], "user data");

    // The user file is the only sibling left
    EXPECT_EQ(siblings(output_file), 1);
    EXPECT_EQ(readLines(output_file).size(), 2u);
}

TEST_F(SiteModelWriterTest, TemporaryPatternIsBesideDestination) {
    EXPECT_EQ(SiteModelWriter::temporaryPattern("out/site_model.csv"),
              "out/site_model.csv.XXXXXX");
}

TEST_F(SiteModelWriterTest, UnwritableDestinationLeavesNothing) {
    const std::string bad = "no_such_directory_r" + std::to_string(rank) + "/site_model.csv";
    SiteModelWriter writer(SiteModelColumns{});

    EXPECT_THROW(writer.write(bad, {record(1.0, 2.0, 3.0)}), OutputWriteError);
    EXPECT_FALSE(exists(bad));
    EXPECT_EQ(siblings(bad), 0);

    EXPECT_THROW(writer.write("", {}), OutputWriteError);
}
