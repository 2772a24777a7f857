#include <gtest/gtest.h>
#include <BrambleLossy.hpp>
#include <Database.hpp>
#include <RunLengthEncoding.hpp>
#include <errors.hpp>
#include <testUtils.hpp>
#include <algorithm>
#include <filesystem>
#include <random>

namespace {
	bramble::Database randomDatabase(size_t files, size_t keys, uint32_t seed) {
		std::mt19937 rng(seed);
		bramble::Database database;
		database.possibleKmers = 1u << 20;
		for (size_t pos = 0; pos < files; ++pos) {
			database.files.push_back("ref" + std::to_string(pos) + ".fa");
			database.taxids.push_back(pos + 1);
		}
		uint32_t key = 0;
		for (size_t idx = 0; idx < keys; ++idx) {
			key += 1 + rng() % 50;
			std::vector<uint32_t> positions;
			for (uint32_t pos = 0; pos < files; ++pos) {
				if (rng() % 5 == 0) {
					positions.push_back(pos);
				}
			}
			if (positions.empty()) {
				positions.push_back(static_cast<uint32_t>(rng() % files));
			}
			database.append(key, bramble::toRanges(positions));
		}
		database.recomputeKmerCounts();
		return database;
	}
}

TEST(LossyTest, WidenRangesMergesSmallGaps) {
	std::vector<bramble::PositionRange> ranges = { { 0, 2 }, { 3, 1 }, { 6, 2 }, { 20, 1 } };
	// level 1 allows a one position gap
	std::vector<bramble::PositionRange> levelOne = { { 0, 4 }, { 6, 2 }, { 20, 1 } };
	EXPECT_EQ(BrambleLossy::widenRanges(ranges, 1), levelOne);
	// level 2 allows gaps up to three
	std::vector<bramble::PositionRange> levelTwo = { { 0, 8 }, { 20, 1 } };
	EXPECT_EQ(BrambleLossy::widenRanges(ranges, 2), levelTwo);
	std::vector<bramble::PositionRange> levelFour = { { 0, 21 } };
	EXPECT_EQ(BrambleLossy::widenRanges(ranges, 4), levelFour);
	EXPECT_TRUE(BrambleLossy::widenRanges({}, 3).empty());
	EXPECT_EQ(BrambleLossy::maxGap(1), 1u);
	EXPECT_EQ(BrambleLossy::maxGap(31), (1ull << 31) - 1);
}

TEST(LossyTest, RecompressionYieldsSupersets) {
	auto exact = randomDatabase(300, 500, 7);
	for (uint32_t level : { 1u, 3u }) {
		auto lossy = BrambleLossy::recompress(exact, level);
		EXPECT_EQ(lossy.lossyLevel, level);
		EXPECT_TRUE(lossy.lossy());
		EXPECT_EQ(lossy.keys, exact.keys);
		EXPECT_EQ(lossy.files, exact.files);
		EXPECT_EQ(lossy.taxids, exact.taxids);
		EXPECT_LE(lossy.blocks.size(), exact.blocks.size());
		for (size_t idx = 0; idx < exact.keyCount(); ++idx) {
			auto before = bramble::decodePositions(exact.membership(idx));
			auto after = bramble::decodePositions(lossy.membership(idx));
			EXPECT_TRUE(std::includes(after.begin(), after.end(), before.begin(), before.end()));
			EXPECT_EQ(after.front(), before.front());
			EXPECT_EQ(after.back(), before.back());
		}
		for (size_t pos = 0; pos < exact.fileCount(); ++pos) {
			EXPECT_GE(lossy.kmerCounts[pos], exact.kmerCounts[pos]);
		}
	}
}

TEST(LossyTest, HigherLevelsNeverShrinkMemberships) {
	auto exact = randomDatabase(200, 200, 11);
	auto low = BrambleLossy::recompress(exact, 1);
	auto high = BrambleLossy::recompress(exact, 4);
	for (size_t idx = 0; idx < exact.keyCount(); ++idx) {
		EXPECT_LE(bramble::memberCount(low.membership(idx)), bramble::memberCount(high.membership(idx)));
	}
}

TEST(LossyTest, RejectsLossyInputAndBadLevels) {
	auto exact = randomDatabase(20, 30, 3);
	EXPECT_THROW(BrambleLossy::recompress(exact, 0), std::invalid_argument);
	EXPECT_THROW(BrambleLossy::recompress(exact, 32), std::invalid_argument);
	auto lossy = BrambleLossy::recompress(exact, 2);
	EXPECT_THROW(BrambleLossy::recompress(lossy, 2), std::invalid_argument);
}

TEST(LossyTest, RunWritesALossyDatabase) {
	testutils::TempDir dir;
	auto exact = randomDatabase(50, 100, 5);
	bramble::saveDatabase(dir.file("exact.db"), exact);

	BrambleLossy::LossyConfig config;
	config.database_file = dir.file("exact.db");
	config.output_file = dir.path().string();
	config.level = 2;
	config.verbose = false;
	BrambleLossy::run(config);

	auto lossy = bramble::loadDatabase(dir.file("bramble.lossy.db"));
	EXPECT_EQ(lossy.lossyLevel, 2u);
	EXPECT_EQ(bramble::readHeader(dir.file("bramble.lossy.db")).lossyLevel, 2u);

	config.database_file = dir.file("bramble.lossy.db");
	config.output_file = dir.file("twice.db");
	EXPECT_THROW(BrambleLossy::run(config), std::invalid_argument);
	EXPECT_FALSE(std::filesystem::exists(dir.file("twice.db")));
}
