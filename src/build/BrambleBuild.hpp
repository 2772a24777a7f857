/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleBuild.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-15
 *
 * Last Modified: 2026-10-10
 *
 * Description:
 *  Sharded construction of the k-mer database
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#include <buildConfig.hpp>
#include <Database.hpp>
#include <fileToTaxid.hpp>
#include <interrupt.hpp>
#include <timeUtil.hpp>
#include <robin_hood.h>
#include <omp.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace BrambleBuild {
	/**
	 * Shard owning key: shards split the key space into equal, ordered ranges.
	 */
	inline uint32_t shardOf(uint32_t key, uint32_t shards, uint8_t kmerSize) {
		return static_cast<uint32_t>((static_cast<uint64_t>(key) * shards) >> (2u * kmerSize));
	}

	void createOrResetDirectory(const std::string& dir, bool verbose);

	/**
	 * Read the k-mers of one shard from a spill file: shards + 1 uint64_t offsets, then the sorted uint32_t k-mers.
	 * Throws ResourceError when the file is missing, truncated or its shard offsets are inconsistent.
	 */
	void readSpilledShard(const std::string& path, uint32_t shard, uint32_t shards, std::vector<uint32_t>& kmers);

	/**
	 * Build a database from references already in database order.
	 *
	 * @param records The references, record i becomes position i.
	 * @param config The build configuration, tmp_dir must be set.
	 * @param fileInfo Extraction statistics, updated.
	 * @return The validated database.
	 */
	bramble::Database buildDatabase(const std::vector<bramble::ReferenceRecord>& records,
		const BuildConfig& config,
		bramble::FileInfo& fileInfo);

	/**
	 * Build a database placing records[ordering[pos]] at position pos.
	 * Throws InvariantError unless ordering is a permutation of the records.
	 */
	bramble::Database buildDatabase(const std::vector<bramble::ReferenceRecord>& records,
		const std::vector<uint32_t>& ordering,
		const BuildConfig& config,
		bramble::FileInfo& fileInfo);

	void run(BuildConfig config);
}
