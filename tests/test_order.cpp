#include <gtest/gtest.h>
#include <BrambleOrder.hpp>
#include <BrambleDistance.hpp>
#include <errors.hpp>
#include <testUtils.hpp>
#include <algorithm>
#include <cmath>
#include <random>

namespace {
	// References on a line: distance grows with the index difference
	bramble::DistanceMatrix chainMatrix(const std::vector<uint32_t>& linePosition) {
		bramble::DistanceMatrix matrix(linePosition.size());
		for (size_t i = 0; i < linePosition.size(); ++i) {
			for (size_t j = 0; j < i; ++j) {
				float gap = std::abs(static_cast<float>(linePosition[i]) - static_cast<float>(linePosition[j]));
				matrix.set(i, j, std::min(1.0f, gap / 10.0f));
			}
		}
		return matrix;
	}

	bramble::DistanceMatrix randomMatrix(size_t n, uint32_t seed) {
		std::mt19937 rng(seed);
		std::uniform_real_distribution<float> dist(0.0f, 1.0f);
		bramble::DistanceMatrix matrix(n);
		for (size_t i = 0; i < n; ++i) {
			for (size_t j = 0; j < i; ++j) {
				matrix.set(i, j, dist(rng));
			}
		}
		return matrix;
	}
}

TEST(OrderTest, GreedyFollowsAChain) {
	// reference i sits at line position linePosition[i]
	std::vector<uint32_t> linePosition = { 0, 3, 1, 4, 2 };
	auto matrix = chainMatrix(linePosition);
	std::vector<uint32_t> expected = { 0, 2, 4, 1, 3 };
	EXPECT_EQ(BrambleOrder::greedyOrder(matrix, 0), expected);
}

TEST(OrderTest, TiesGoToLowestIndex) {
	bramble::DistanceMatrix matrix(4);
	for (size_t i = 0; i < 4; ++i)
		for (size_t j = 0; j < i; ++j)
			matrix.set(i, j, 0.5f);
	std::vector<uint32_t> expected = { 2, 0, 1, 3 };
	EXPECT_EQ(BrambleOrder::greedyOrder(matrix, 2), expected);
}

TEST(OrderTest, OrderIsAPermutationAndDeterministic) {
	for (uint32_t seed : { 1u, 2u, 3u }) {
		auto matrix = randomMatrix(40, seed);
		auto first = BrambleOrder::greedyOrder(matrix, 0);
		BrambleOrder::refineOrder(matrix, first, 10);
		auto second = BrambleOrder::greedyOrder(matrix, 0);
		BrambleOrder::refineOrder(matrix, second, 10);
		EXPECT_EQ(first, second);
		EXPECT_NO_THROW(BrambleOrder::verifyPermutation(first, 40));
	}
}

TEST(OrderTest, RefinementNeverIncreasesTotalDistance) {
	for (uint32_t seed : { 4u, 5u, 6u }) {
		auto matrix = randomMatrix(30, seed);
		auto order = BrambleOrder::greedyOrder(matrix, 0);
		double before = BrambleOrder::totalAdjacentDistance(matrix, order);
		uint32_t passes = BrambleOrder::refineOrder(matrix, order, 100);
		double after = BrambleOrder::totalAdjacentDistance(matrix, order);
		EXPECT_LE(after, before + 1e-6);
		EXPECT_GE(passes, 1u);
		EXPECT_LE(passes, 100u);
	}
}

TEST(OrderTest, RefinementFixesABadOrder) {
	std::vector<uint32_t> linePosition = { 0, 1, 2, 3, 4, 5 };
	auto matrix = chainMatrix(linePosition);
	std::vector<uint32_t> order = { 0, 1, 4, 3, 2, 5 };
	double before = BrambleOrder::totalAdjacentDistance(matrix, order);
	BrambleOrder::refineOrder(matrix, order, 10);
	double after = BrambleOrder::totalAdjacentDistance(matrix, order);
	EXPECT_LT(after, before);
	EXPECT_NEAR(after, 0.5, 1e-5);
}

TEST(OrderTest, ZeroPassesKeepsTheGreedyOrder) {
	auto matrix = randomMatrix(20, 9);
	auto order = BrambleOrder::greedyOrder(matrix, 0);
	auto copy = order;
	EXPECT_EQ(BrambleOrder::refineOrder(matrix, copy, 0), 0u);
	EXPECT_EQ(copy, order);
}

TEST(OrderTest, SmallInputs) {
	EXPECT_TRUE(BrambleOrder::greedyOrder(bramble::DistanceMatrix(0), 0).empty());
	EXPECT_EQ(BrambleOrder::greedyOrder(bramble::DistanceMatrix(1), 0), std::vector<uint32_t>{ 0 });
	EXPECT_THROW(BrambleOrder::greedyOrder(bramble::DistanceMatrix(3), 3), std::invalid_argument);
}

TEST(OrderTest, VerifyPermutationRejectsBadOrders) {
	EXPECT_THROW(BrambleOrder::verifyPermutation({ 0, 1, 1 }, 3), bramble::InvariantError);
	EXPECT_THROW(BrambleOrder::verifyPermutation({ 0, 1 }, 3), bramble::InvariantError);
	EXPECT_THROW(BrambleOrder::verifyPermutation({ 0, 1, 3 }, 3), bramble::InvariantError);
	EXPECT_NO_THROW(BrambleOrder::verifyPermutation({ 2, 0, 1 }, 3));
}

TEST(OrderTest, RunWritesOrderedFileToTaxid) {
	testutils::TempDir dir;
	BrambleDistance::DistanceArtifact artifact;
	artifact.config.kmerSize = 16;
	artifact.records = { { "a.fa", 1 }, { "b.fa", 2 }, { "c.fa", 3 } };
	artifact.matrix = bramble::DistanceMatrix(3);
	artifact.matrix.set(0, 1, 0.9f);
	artifact.matrix.set(0, 2, 0.1f);
	artifact.matrix.set(1, 2, 0.2f);
	BrambleDistance::saveDistances(dir.file("in.pd"), artifact);

	BrambleOrder::OrderConfig config;
	config.verbose = false;
	config.distance_file = dir.file("in.pd");
	config.output_file = dir.path().string();
	BrambleOrder::run(config);

	auto ordered = bramble::loadFileToTaxid(dir.file("bramble.f2t"));
	ASSERT_EQ(ordered.records.size(), 3u);
	EXPECT_EQ(ordered.records[0].path, "a.fa");
	EXPECT_EQ(ordered.records[1].path, "c.fa");
	EXPECT_EQ(ordered.records[2].path, "b.fa");
	ASSERT_TRUE(ordered.config.has_value());
	EXPECT_EQ(ordered.config->kmerSize, 16);
}
