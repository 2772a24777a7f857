#include <gtest/gtest.h>
#include <KmerIter.hpp>
#include <testUtils.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

using bramble::KmerConfig;

namespace {
	const std::string kSequence = "CGATTAAAGATAGAAATACACGNTGCGAGCAATCAAATT";

	KmerConfig config(uint8_t k, uint8_t s, uint8_t t) {
		KmerConfig cfg;
		cfg.kmerSize = k;
		cfg.smerSize = s;
		cfg.syncmerOffset = t;
		return cfg;
	}
}

TEST(KmerIterTest, CanonicalKmersWithoutSyncmers) {
	// A = 00, C = 01, G = 10, T = 11
	std::vector<uint32_t> expected = {
		0b01'10'00'11'11'00'00'00'10'00'11'00'10'00,
		0b10'00'11'11'00'00'00'10'00'11'00'10'00'00,
		0b00'11'11'00'00'00'10'00'11'00'10'00'00'00,
		0b00'11'11'11'01'11'00'11'01'11'11'11'00'00,
		0b11'00'00'00'10'00'11'00'10'00'00'00'11'00,
		0b00'00'00'10'00'11'00'10'00'00'00'11'00'01,
		0b00'00'10'00'11'00'10'00'00'00'11'00'01'00,
		0b00'10'00'11'00'10'00'00'00'11'00'01'00'01,
		0b01'10'11'10'11'00'11'11'11'01'11'00'11'01,
		0b11'10'01'10'00'10'01'00'00'11'01'00'00'00,
		0b00'11'11'11'10'00'11'11'10'01'11'01'10'01,
		0b00'00'11'11'11'10'00'11'11'10'01'11'01'10,
	};
	EXPECT_EQ(bramble::collectKmers(kSequence, config(14, 14, 0)), expected);
}

TEST(KmerIterTest, SyncmersAtOffsetZero) {
	std::vector<uint32_t> expected = {
		0b00'11'11'00'00'00'10'00'11'00'10'00'00'00,
		0b00'11'11'11'01'11'00'11'01'11'11'11'00'00,
		0b00'00'00'10'00'11'00'10'00'00'00'11'00'01,
		0b00'00'10'00'11'00'10'00'00'00'11'00'01'00,
		0b00'10'00'11'00'10'00'00'00'11'00'01'00'01,
		0b01'10'11'10'11'00'11'11'11'01'11'00'11'01,
		0b00'11'11'11'10'00'11'11'10'01'11'01'10'01,
		0b00'00'11'11'11'10'00'11'11'10'01'11'01'10,
	};
	EXPECT_EQ(bramble::collectKmers(kSequence, config(14, 12, 0)), expected);
}

TEST(KmerIterTest, SyncmersAtOffsetOne) {
	std::vector<uint32_t> expected = {
		0b10'00'11'11'00'00'00'10'00'11'00'10'00'00,
		0b11'00'00'00'10'00'11'00'10'00'00'00'11'00,
	};
	EXPECT_EQ(bramble::collectKmers(kSequence, config(14, 12, 1)), expected);
}

TEST(KmerIterTest, ReverseComplementGivesReversedKmers) {
	for (uint32_t seed : { 1u, 2u, 3u }) {
		std::string sequence = testutils::randomSequence(500, seed);
		sequence[250] = 'N';
		for (const auto& cfg : { config(15, 15, 0), config(15, 9, 3), config(16, 9, 3) }) {
			auto forward = bramble::collectKmers(sequence, cfg);
			auto reverse = bramble::collectKmers(testutils::reverseComplement(sequence), cfg);
			std::reverse(reverse.begin(), reverse.end());
			EXPECT_EQ(forward, reverse) << "seed " << seed << " " << cfg;
		}
	}
}

TEST(KmerIterTest, ReverseComplementOfPackedKmer) {
	// ACGTACGT is its own reverse complement, AAAA maps to TTTT
	uint32_t acgtacgt = 0b00'01'10'11'00'01'10'11;
	EXPECT_EQ(bramble::reverseComplement(acgtacgt, 8), acgtacgt);
	// AACC maps to GGTT
	EXPECT_EQ(bramble::reverseComplement(0b00'00'01'01u, 4), 0b10'10'11'11u);
	EXPECT_EQ(bramble::reverseComplement(0u, 4), 0b11'11'11'11u);
	for (uint32_t kmer : { 12345u, 987654u, 0x3FFFFFFFu }) {
		EXPECT_EQ(bramble::reverseComplement(bramble::reverseComplement(kmer, 15), 15), kmer);
	}
}

TEST(KmerIterTest, ShortSequencesEmitNothing) {
	EXPECT_TRUE(bramble::collectKmers(std::string("ACGTACGTACGTAC"), config(15, 9, 3)).empty());
	EXPECT_TRUE(bramble::collectKmers(std::string(""), config(15, 9, 3)).empty());
	// 20 valid bases split by N into two windows too short for k = 15
	EXPECT_TRUE(bramble::collectKmers(std::string("ACGTACGTACNGTACGTACG"), config(15, 15, 0)).empty());
}

TEST(KmerIterTest, HomopolymerRunsAreNotRepeated) {
	auto kmers = bramble::collectKmers(std::string(100, 'A'), config(15, 15, 0));
	ASSERT_EQ(kmers.size(), 1u);
	EXPECT_EQ(kmers[0], 0u);
}

TEST(KmerIterTest, ViewIsRestartable) {
	std::string sequence = testutils::randomSequence(300, 7);
	auto view = bramble::canonicalKmers(sequence, config(15, 9, 3));
	std::vector<uint32_t> first, second;
	for (uint32_t kmer : view) first.push_back(kmer);
	for (uint32_t kmer : view) second.push_back(kmer);
	EXPECT_FALSE(first.empty());
	EXPECT_EQ(first, second);
}

TEST(KmerIterTest, Dna5InputMatchesCharInput) {
	using seqan3::operator""_dna5;
	std::string text = "ACGTNACGTTGCAAGGCTTACGATCGATCGGCTAGCTAGGATCCAT";
	std::vector<seqan3::dna5> dna = "ACGTNACGTTGCAAGGCTTACGATCGATCGGCTAGCTAGGATCCAT"_dna5;
	EXPECT_EQ(bramble::collectKmers(text, config(15, 9, 3)), bramble::collectKmers(dna, config(15, 9, 3)));
}

TEST(KmerIterTest, SyncmersSubsampleTheKmers) {
	std::string sequence = testutils::randomSequence(20000, 11);
	size_t all = bramble::collectKmers(sequence, config(15, 15, 0)).size();
	size_t sync = bramble::collectKmers(sequence, config(15, 9, 3)).size();
	// open syncmer density is 1 / (k - s + 1) = 1 / 7
	EXPECT_GT(sync, all / 14);
	EXPECT_LT(sync, all / 4);
}

TEST(KmerIterTest, PossibleKmersWithoutSyncmers) {
	EXPECT_EQ(bramble::possibleKmers(config(15, 15, 0)), 536870912u);
	EXPECT_EQ(bramble::possibleKmers(config(16, 16, 0)), 2147516416u);
	EXPECT_EQ(bramble::possibleKmers(config(4, 4, 0)), 136u);
}

TEST(KmerIterTest, PossibleKmersMatchEnumeratedSyncmers) {
	const std::string letters = "ACGT";
	for (uint8_t offset = 0; offset <= 4; ++offset) {
		KmerConfig small = config(8, 4, offset);
		std::set<uint32_t> seen;
		for (uint32_t code = 0; code < (1u << 16); ++code) {
			std::string kmer(8, 'A');
			for (int i = 0; i < 8; ++i) {
				kmer[i] = letters[(code >> (2 * (7 - i))) & 3u];
			}
			for (uint32_t value : bramble::collectKmers(kmer, small)) {
				seen.insert(value);
			}
		}
		EXPECT_EQ(bramble::possibleKmers(small), seen.size()) << small.toString();
	}
	EXPECT_NE(bramble::possibleKmers(config(8, 4, 0)), bramble::possibleKmers(config(8, 4, 2)));
}

TEST(KmerIterTest, PossibleKmersOfTheDefaultConfiguration) {
	const uint64_t canonical = bramble::possibleKmers(config(15, 15, 0));
	const uint64_t count = bramble::possibleKmers(config(15, 9, 3));
	// fewer than the 1 / (k - s + 1) share a uniform open syncmer density would give
	EXPECT_LT(count, canonical / 7);
	EXPECT_GT(count, canonical / 10);
	EXPECT_EQ(bramble::possibleKmers(config(15, 9, 3)), count);
}

TEST(KmerIterTest, ConfigValidation) {
	EXPECT_NO_THROW(config(15, 9, 3).validate());
	EXPECT_NO_THROW(config(16, 16, 0).validate());
	EXPECT_THROW(config(17, 9, 3).validate(), std::invalid_argument);
	EXPECT_THROW(config(15, 16, 0).validate(), std::invalid_argument);
	EXPECT_THROW(config(15, 9, 7).validate(), std::invalid_argument);
	EXPECT_EQ(config(15, 9, 3).toString(), "k=15 s=9 t=3");
}
