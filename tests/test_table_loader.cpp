#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

#include "sph_basis.hpp"
#include "table_loader.hpp"
#include "time_utils.hpp"

using namespace dbforecast;

class TableLoaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "dbforecast_table_loader_test";
    std::filesystem::create_directories(dir_);

    std::ofstream st(dir_ / "stations.txt");
    st << "# time station mlt colat dbn dbe\n"
       << "2015-03-17T04:01:00 0 6.0 20.0 -110.0 35.0\n"
       << "2015-03-17T04:00:00 0 5.9 20.0 -100.0 30.0\n"
       << "2015-03-17T04:00:00 2 18.0 30.0 12.0 -4.0\n"
       << "garbage row\n"
       << "2015-03-17 04:02:00 1 12.0 25.0 0.0 0.0\n";
    st.close();

    std::ofstream sw(dir_ / "solar_wind.txt");
    sw << "2015-03-17T04:00:00 400.0 -5.0 3.1\n"
       << "2015-03-17T04:01:00 410.0 -6.0 3.3\n";
    sw.close();

    scalers_.set("dbn", Scaler{-50.0, 50.0});
    scalers_.set("dbe", Scaler{10.0, 20.0});
  }

  void TearDown() override {
    std::filesystem::remove_all(dir_);
  }

  std::filesystem::path dir_;
  ScalerSet scalers_;
};

TEST_F(TableLoaderTest, LoadsStationRows) {
  std::vector<StationRow> rows;
  ASSERT_TRUE(loadStationTable(dir_ / "stations.txt", rows));
  ASSERT_EQ(4u, rows.size());
  EXPECT_EQ(2, rows[2].station);
  EXPECT_DOUBLE_EQ(18.0, rows[2].mlt_hours);
  EXPECT_DOUBLE_EQ(-4.0, rows[2].dbe_nT);

  ASSERT_TRUE(loadStationTable(dir_ / "stations.txt", rows, 2));
  EXPECT_EQ(2u, rows.size());

  EXPECT_FALSE(loadStationTable(dir_ / "missing.txt", rows));
}

TEST_F(TableLoaderTest, LoadsSolarWindRows) {
  std::vector<SolarWindRow> rows;
  ASSERT_TRUE(loadSolarWindTable(dir_ / "solar_wind.txt", rows));
  ASSERT_EQ(2u, rows.size());
  EXPECT_EQ(3u, rows[1].values.size());
  EXPECT_DOUBLE_EQ(410.0, rows[1].values[0]);
}

TEST_F(TableLoaderTest, RaggedSolarWindIsRejected) {
  std::ofstream sw(dir_ / "ragged.txt");
  sw << "2015-03-17T04:00:00 1 2 3\n"
     << "2015-03-17T04:01:00 1 2\n";
  sw.close();
  std::vector<SolarWindRow> rows;
  EXPECT_FALSE(loadSolarWindTable(dir_ / "ragged.txt", rows));
}

TEST_F(TableLoaderTest, BuildsChronologicalNaNPaddedTable) {
  std::vector<StationRow> st;
  std::vector<SolarWindRow> sw;
  ASSERT_TRUE(loadStationTable(dir_ / "stations.txt", st));
  ASSERT_TRUE(loadSolarWindTable(dir_ / "solar_wind.txt", sw));

  StationTable table;
  ASSERT_TRUE(buildStationTable(st, sw, scalers_, table));

  ASSERT_EQ(3u, table.times.size());
  EXPECT_LT(table.times[0], table.times[1]);
  EXPECT_LT(table.times[1], table.times[2]);
  ASSERT_EQ(3, table.azimuth.cols());
  ASSERT_EQ(3, table.solar_wind.cols());

  // 04:00 has stations 0 and 2
  EXPECT_NEAR(mltToAzimuth(5.9), table.azimuth(0, 0), 1e-12);
  EXPECT_TRUE(std::isnan(table.azimuth(0, 1)));
  EXPECT_NEAR(colatitudeToPolar(30.0), table.polar(0, 2), 1e-12);
  EXPECT_DOUBLE_EQ((-100.0 + 50.0) / 50.0, table.targets.at("dbn")(0, 0));
  EXPECT_DOUBLE_EQ((-4.0 - 10.0) / 20.0, table.targets.at("dbe")(0, 2));

  // 04:02 has only station 1 and no solar-wind row
  EXPECT_TRUE(std::isnan(table.targets.at("dbn")(2, 0)));
  EXPECT_DOUBLE_EQ(1.0, table.targets.at("dbn")(2, 1));
  EXPECT_TRUE(std::isnan(table.solar_wind(2, 0)));
  EXPECT_DOUBLE_EQ(-6.0, table.solar_wind(1, 1));

  EXPECT_NO_THROW(validateBatch(table));
}

TEST_F(TableLoaderTest, BuildNeedsScalersAndStations) {
  std::vector<StationRow> st;
  ASSERT_TRUE(loadStationTable(dir_ / "stations.txt", st));
  StationTable table;

  ScalerSet dbn_only;
  dbn_only.set("dbn", Scaler{});
  EXPECT_FALSE(buildStationTable(st, {}, dbn_only, table));
  EXPECT_FALSE(buildStationTable({}, {}, scalers_, table));

  st[0].station = -1;
  EXPECT_FALSE(buildStationTable(st, {}, scalers_, table));
}

TEST(TimeUtils, ParsesIsoTimestamps) {
  DateTime t;
  ASSERT_TRUE(parseIsoTimestamp("2015-03-17T04:05:06.25", t));
  EXPECT_EQ(2015, t.year);
  EXPECT_EQ(3, t.month);
  EXPECT_EQ(17, t.day);
  EXPECT_EQ(4, t.hour);
  EXPECT_EQ(5, t.minute);
  EXPECT_DOUBLE_EQ(6.25, t.second);

  EXPECT_TRUE(parseIsoTimestamp(" 2016-02-29 23:59:59Z ", t));
  EXPECT_FALSE(parseIsoTimestamp("2015-02-29T00:00:00", t));
  EXPECT_FALSE(parseIsoTimestamp("2015-13-01T00:00:00", t));
  EXPECT_FALSE(parseIsoTimestamp("17 Mar 2015 04:00:00", t));
}

TEST(TimeUtils, JulianDateRoundTrip) {
  DateTime t;
  ASSERT_TRUE(parseIsoTimestamp("2015-01-01T00:00:00", t));
  EXPECT_DOUBLE_EQ(2457023.5, toJulianDateUTC(t));

  ASSERT_TRUE(parseIsoTimestamp("2017-09-07T23:59:30", t));
  const DateTime back = fromJulianDateUTC(toJulianDateUTC(t));
  EXPECT_EQ("2017-09-07T23:59:30", formatIsoTimestamp(back));
  EXPECT_EQ(julianMillis(toJulianDateUTC(t)), julianMillis(toJulianDateUTC(back)));
}
