/*
 * -----------------------------------------------------------------------------
 * Filename:      Database.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-14
 *
 * Last Modified: 2026-10-08
 *
 * Description:
 *  The k-mer database: a sorted table of canonical k-mers, each with the
 *  run-length encoded set of reference positions containing it.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef DATABASE_HPP
#define DATABASE_HPP
#include <RunLengthEncoding.hpp>
#include <artifact.hpp>
#include <kmerConfig.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bramble {
	struct Database {
		KmerConfig config;
		// 0 for an exact database
		uint32_t lossyLevel{ 0 };
		// canonical k-mers passing the syncmer test, the universe of the classifier's null model
		uint64_t possibleKmers{ 0 };
		// per reference position
		std::vector<std::string> files;
		std::vector<uint64_t> taxids;
		std::vector<uint64_t> kmerCounts;
		// per key, blocks of keys[i] are blocks[offsets[i] .. offsets[i + 1])
		std::vector<uint32_t> keys;
		std::vector<uint64_t> offsets{ 0 };
		std::vector<uint16_t> blocks;

		size_t fileCount() const { return files.size(); }
		size_t keyCount() const { return keys.size(); }
		bool lossy() const { return lossyLevel > 0; }

		std::span<const uint16_t> membership(size_t keyIndex) const {
			return std::span<const uint16_t>(blocks.data() + offsets[keyIndex], offsets[keyIndex + 1] - offsets[keyIndex]);
		}

		/**
		 * Binary search for kmer. Returns the blocks of its membership set, std::nullopt if it is not a key.
		 */
		std::optional<std::span<const uint16_t>> find(uint32_t kmer) const;

		/**
		 * Append a key with its membership set. Keys must be appended in ascending order.
		 */
		void append(uint32_t kmer, const std::vector<PositionRange>& ranges);

		/**
		 * Count, for every reference position, the keys whose membership set holds it.
		 */
		void recomputeKmerCounts();

		/**
		 * Throw InvariantError if keys are unsorted or duplicated, offsets are not monotonic,
		 * a membership set is empty or names a position >= fileCount(), or there are more keys
		 * than possible k-mers.
		 */
		void validate() const;

		template <class Archive>
		void serialize(Archive& archive) {
			archive(possibleKmers, files, taxids, kmerCounts, keys, offsets, blocks);
		}
	};

	std::ostream& operator<<(std::ostream& os, const Database& database);

	/**
	 * Validate and write a database atomically.
	 */
	void saveDatabase(const std::string& path, const Database& database);

	Database loadDatabase(const std::string& path);
}

#endif // DATABASE_HPP
