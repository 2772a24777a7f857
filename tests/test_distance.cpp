#include <gtest/gtest.h>
#include <BrambleDistance.hpp>
#include <errors.hpp>
#include <testUtils.hpp>
#include <filesystem>
#include <fstream>

class DistanceTest : public ::testing::Test {
protected:
	testutils::TempDir dir;
	std::vector<bramble::ReferenceRecord> records;
	BrambleDistance::DistanceConfig config;

	void SetUp() override {
		std::string base = testutils::randomSequence(3000, 100);
		std::string variant = base.substr(0, 2000) + testutils::randomSequence(1000, 101);
		std::string unrelated = testutils::randomSequence(3000, 102);
		records = testutils::writeReferences(dir, { base, variant, unrelated, std::string(10, 'A') });
		config.verbose = false;
	}
};

static roaring::Roaring bitmap(const std::vector<uint32_t>& values) {
	roaring::Roaring result;
	result.addMany(values.size(), values.data());
	return result;
}

TEST_F(DistanceTest, JaccardOfBitmaps) {
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({ 1, 2, 3 }), bitmap({ 1, 2, 3 })), 0.0);
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({ 1, 2, 3 }), bitmap({ 4, 5 })), 1.0);
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({ 1, 2, 3, 4 }), bitmap({ 3, 4, 5, 6 })), 1.0 - 2.0 / 6.0);
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({}), bitmap({ 1 })), 1.0);
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({}), bitmap({})), 1.0);
	// values far apart land in different containers
	EXPECT_DOUBLE_EQ(BrambleDistance::jaccardDistance(bitmap({ 7, 70000, 4000000000u }), bitmap({ 70000, 4000000000u })), 1.0 - 2.0 / 3.0);
}

TEST_F(DistanceTest, MatrixIsSymmetricWithZeroDiagonal) {
	bramble::FileInfo fileInfo;
	auto matrix = BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, fileInfo);
	ASSERT_EQ(matrix.size(), records.size());
	for (size_t i = 0; i < matrix.size(); ++i) {
		EXPECT_EQ(matrix.at(i, i), 0.0f);
		for (size_t j = 0; j < matrix.size(); ++j) {
			EXPECT_EQ(matrix.at(i, j), matrix.at(j, i));
			EXPECT_GE(matrix.at(i, j), 0.0f);
			EXPECT_LE(matrix.at(i, j), 1.0f);
		}
	}
	// the variant shares two thirds of the base, the unrelated reference nothing
	EXPECT_LT(matrix.at(0, 1), 0.8f);
	EXPECT_GT(matrix.at(0, 2), 0.99f);
	EXPECT_LT(matrix.at(0, 1), matrix.at(1, 2));
}

TEST_F(DistanceTest, EmptyReferenceIsAtMaximalDistance) {
	bramble::FileInfo fileInfo;
	auto matrix = BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, fileInfo);
	for (size_t j = 0; j < 3; ++j) {
		EXPECT_EQ(matrix.at(3, j), 1.0f);
	}
	EXPECT_EQ(matrix.at(3, 3), 0.0f);
	EXPECT_EQ(fileInfo.skippedNum, 1u);
}

TEST_F(DistanceTest, SketchesApproximateExactDistances) {
	bramble::FileInfo exactInfo, sketchInfo;
	auto exact = BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, exactInfo);
	config.mode = "hll";
	config.hll_bits = 14;
	auto sketched = BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, sketchInfo);
	for (size_t i = 0; i < exact.size(); ++i) {
		for (size_t j = 0; j < i; ++j) {
			EXPECT_NEAR(sketched.at(i, j), exact.at(i, j), 0.15) << i << "," << j;
		}
	}
}

TEST_F(DistanceTest, UnknownModeIsRejected) {
	bramble::FileInfo fileInfo;
	config.mode = "fast";
	EXPECT_THROW(BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, fileInfo), std::invalid_argument);
}

TEST_F(DistanceTest, ExtensionEqualsFullComputation) {
	bramble::FileInfo fileInfo;
	auto full = BrambleDistance::computeDistances(records, config, bramble::DistanceMatrix(), 0, fileInfo);

	std::vector<bramble::ReferenceRecord> firstTwo(records.begin(), records.begin() + 2);
	auto partial = BrambleDistance::computeDistances(firstTwo, config, bramble::DistanceMatrix(), 0, fileInfo);
	auto extended = BrambleDistance::computeDistances(records, config, partial, 2, fileInfo);

	ASSERT_EQ(extended.size(), full.size());
	for (size_t i = 0; i < full.size(); ++i) {
		for (size_t j = 0; j < full.size(); ++j) {
			EXPECT_EQ(extended.at(i, j), full.at(i, j));
		}
	}
}

TEST_F(DistanceTest, ArtifactRoundTripAndExtend) {
	std::string inputPath = dir.file("first.f2t");
	{
		std::ofstream os(inputPath);
		os << records[0].path << '\t' << records[0].taxid << '\n';
		os << records[1].path << '\t' << records[1].taxid << '\n';
	}
	std::string morePath = dir.file("more.f2t");
	{
		std::ofstream os(morePath);
		os << records[2].path << '\t' << records[2].taxid << '\n';
	}

	config.input_file = inputPath;
	config.output_file = dir.file("first.pd");
	BrambleDistance::run(config);
	auto first = BrambleDistance::loadDistances(config.output_file);
	EXPECT_EQ(first.records.size(), 2u);
	EXPECT_EQ(first.config, bramble::KmerConfig());

	BrambleDistance::DistanceConfig extendConfig;
	extendConfig.verbose = false;
	extendConfig.distance_file = config.output_file;
	extendConfig.input_file = morePath;
	extendConfig.output_file = dir.file("extended.pd");
	BrambleDistance::runExtend(extendConfig);
	auto extended = BrambleDistance::loadDistances(extendConfig.output_file);
	ASSERT_EQ(extended.records.size(), 3u);
	EXPECT_EQ(extended.records[2], records[2]);
	EXPECT_EQ(extended.matrix.at(0, 1), first.matrix.at(0, 1));

	bramble::FileInfo fileInfo;
	std::vector<bramble::ReferenceRecord> firstThree(records.begin(), records.begin() + 3);
	auto full = BrambleDistance::computeDistances(firstThree, config, bramble::DistanceMatrix(), 0, fileInfo);
	EXPECT_EQ(extended.matrix.at(2, 0), full.at(2, 0));
	EXPECT_EQ(extended.matrix.at(2, 1), full.at(2, 1));
}

TEST_F(DistanceTest, ExtendRejectsDifferentConfiguration) {
	std::string inputPath = dir.file("first.f2t");
	std::ofstream(inputPath) << records[0].path << '\t' << records[0].taxid << '\n';
	config.input_file = inputPath;
	config.output_file = dir.file("first.pd");
	BrambleDistance::run(config);

	BrambleDistance::DistanceConfig extendConfig;
	extendConfig.verbose = false;
	extendConfig.distance_file = config.output_file;
	extendConfig.input_file = inputPath;
	extendConfig.output_file = dir.file("extended.pd");
	extendConfig.kmer.kmerSize = 16;
	extendConfig.kmer_given = true;
	EXPECT_THROW(BrambleDistance::runExtend(extendConfig), bramble::ConfigMismatchError);
	EXPECT_FALSE(std::filesystem::exists(extendConfig.output_file));
}

TEST_F(DistanceTest, ExtendResolvesOldReferencesAgainstTheirOwnDirectory) {
	std::filesystem::create_directories(dir.path() / "old");
	std::filesystem::create_directories(dir.path() / "new");
	std::string base = testutils::randomSequence(3000, 100);
	std::string variant = base.substr(0, 2000) + testutils::randomSequence(1000, 101);
	std::string unrelated = testutils::randomSequence(3000, 102);
	testutils::writeFasta(dir.file("old/a.fa"), { { "a", base } });
	testutils::writeFasta(dir.file("old/b.fa"), { { "b", variant } });
	testutils::writeFasta(dir.file("new/c.fa"), { { "c", unrelated } });
	std::ofstream(dir.file("old.f2t")) << "a.fa\t1\nb.fa\t2\n";
	std::ofstream(dir.file("new.f2t")) << "c.fa\t3\n";

	config.input_file = dir.file("old.f2t");
	config.reference_dir = dir.file("old");
	config.output_file = dir.file("old.pd");
	BrambleDistance::run(config);

	BrambleDistance::DistanceConfig extendConfig;
	extendConfig.verbose = false;
	extendConfig.distance_file = config.output_file;
	extendConfig.input_file = dir.file("new.f2t");
	extendConfig.reference_dir = dir.file("new");
	extendConfig.output_file = dir.file("extended.pd");
	// without the old directory a.fa and b.fa are looked up next to c.fa
	EXPECT_THROW(BrambleDistance::runExtend(extendConfig), bramble::ResourceError);
	EXPECT_FALSE(std::filesystem::exists(extendConfig.output_file));

	extendConfig.old_reference_dir = dir.file("old");
	BrambleDistance::runExtend(extendConfig);
	auto extended = BrambleDistance::loadDistances(extendConfig.output_file);
	ASSERT_EQ(extended.records.size(), 3u);
	EXPECT_EQ(extended.records[2].path, "c.fa");

	bramble::FileInfo fileInfo;
	std::vector<bramble::ReferenceRecord> firstThree(records.begin(), records.begin() + 3);
	auto full = BrambleDistance::computeDistances(firstThree, config, bramble::DistanceMatrix(), 0, fileInfo);
	EXPECT_EQ(extended.matrix.at(1, 0), full.at(1, 0));
	EXPECT_EQ(extended.matrix.at(2, 0), full.at(2, 0));
	EXPECT_EQ(extended.matrix.at(2, 1), full.at(2, 1));
	EXPECT_LT(extended.matrix.at(1, 0), 0.8f);
}

TEST_F(DistanceTest, ResolveReferencesSplitsAtTheFirstNewRow) {
	config.reference_dir = "new";
	config.old_reference_dir = "old";
	std::vector<bramble::ReferenceRecord> named = { { "a.fa", 1 }, { "b.fa$c.fa", 2 }, { "d.fa", 3 } };
	auto files = BrambleDistance::resolveReferences(named, config, 2);
	ASSERT_EQ(files.size(), 3u);
	EXPECT_EQ(files[0], std::vector<std::string>{ (std::filesystem::path("old") / "a.fa").string() });
	EXPECT_EQ(files[1].size(), 2u);
	EXPECT_EQ(files[1][1], (std::filesystem::path("old") / "c.fa").string());
	EXPECT_EQ(files[2], std::vector<std::string>{ (std::filesystem::path("new") / "d.fa").string() });

	config.old_reference_dir.clear();
	files = BrambleDistance::resolveReferences(named, config, 2);
	EXPECT_EQ(files[0], std::vector<std::string>{ (std::filesystem::path("new") / "a.fa").string() });
}

TEST_F(DistanceTest, MissingReferenceFailsBeforeComputing) {
	std::string inputPath = dir.file("missing.f2t");
	std::ofstream(inputPath) << dir.file("nope.fa") << "\t1\n";
	config.input_file = inputPath;
	config.output_file = dir.file("out.pd");
	EXPECT_THROW(BrambleDistance::run(config), bramble::ResourceError);
	EXPECT_FALSE(std::filesystem::exists(config.output_file));
}

TEST(DistanceMatrixTest, LowerTriangleIndexing) {
	bramble::DistanceMatrix matrix(4);
	matrix.set(3, 1, 0.25f);
	matrix.set(0, 2, 0.5f);
	EXPECT_EQ(matrix.at(1, 3), 0.25f);
	EXPECT_EQ(matrix.at(2, 0), 0.5f);
	EXPECT_EQ(matrix.at(3, 0), 1.0f);
	EXPECT_EQ(bramble::DistanceMatrix::cellCount(4), 6u);
	EXPECT_THROW(matrix.at(4, 0), std::out_of_range);

	matrix.extend(5);
	EXPECT_EQ(matrix.at(1, 3), 0.25f);
	EXPECT_EQ(matrix.at(4, 2), 1.0f);
	EXPECT_NO_THROW(matrix.validate());
	matrix.set(4, 2, 1.5f);
	EXPECT_THROW(matrix.validate(), bramble::InvariantError);
}
