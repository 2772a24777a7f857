/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleBuild.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-15
 *
 * Last Modified: 2026-10-10
 *
 * Description:
 *  The main program of BrambleBuild.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <BrambleBuild.hpp>
#include <BrambleOrder.hpp>
#include <artifact.hpp>
#include <errors.hpp>
#include <algorithm>
#include <exception>
#include <iomanip>
#include <stdexcept>

namespace BrambleBuild {
	// Membership sets of one shard, keys sorted, offsets local to blocks
	struct ShardResult {
		std::vector<uint32_t> keys;
		std::vector<uint64_t> offsets{ 0 };
		std::vector<uint16_t> blocks;
	};

	// Removes the spill directory however the build ends
	class TmpDirGuard {
		std::string dir;
	public:
		explicit TmpDirGuard(std::string dir) : dir(std::move(dir)) {}
		~TmpDirGuard() {
			std::error_code ec;
			std::filesystem::remove_all(dir, ec);
		}
		TmpDirGuard(const TmpDirGuard&) = delete;
		TmpDirGuard& operator=(const TmpDirGuard&) = delete;
	};

	/**
	* Create or reset the directory specified by the dir parameter.
	*
	* @param dir The directory path.
	* @param verbose Report what was done.
	*/
	void createOrResetDirectory(const std::string& dir, bool verbose) {
		std::filesystem::path directoryPath = dir;
		std::error_code ec;

		// Check if the directory exists
		if (std::filesystem::exists(directoryPath)) {
			if (!std::filesystem::is_directory(directoryPath)) {
				throw bramble::ResourceError("'" + dir + "' exists but is not a directory, can't be replaced.");
			}
			std::filesystem::remove_all(directoryPath, ec);
			if (ec) {
				throw bramble::ResourceError("Failed to remove directory '" + dir + "': " + ec.message());
			}
			if (verbose) {
				std::cout << "Directory '" << dir << "' existed and was removed." << std::endl;
			}
		}

		if (!std::filesystem::create_directories(directoryPath, ec) || ec) {
			throw bramble::ResourceError("Failed to create directory '" + dir + "'.");
		}
	}

	static std::string spillPath(const std::string& dir, size_t position) {
		return (std::filesystem::path(dir) / (std::to_string(position) + ".kmers")).string();
	}

	/**
	 * Extract the sorted k-mers of every reference and write them to the spill directory,
	 * each file prefixed by the offsets of the shards inside it.
	 */
	static void spillKmers(const std::vector<bramble::ReferenceRecord>& records,
		const BuildConfig& config,
		bramble::FileInfo& fileInfo)
	{
		std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic)
		for (size_t pos = 0; pos < records.size(); ++pos)
		{
			if (bramble::interrupted())
				continue;
			try {
				bramble::FileInfo localFileInfo;
				roaring::Roaring bitmap = bramble::referenceKmerBitmap(
					bramble::referencePaths(records[pos], config.reference_dir), config.kmer, localFileInfo);
				// bitmap iteration order is ascending, so the shards are contiguous
				std::vector<uint32_t> kmers(bitmap.cardinality());
				bitmap.toUint32Array(kmers.data());

				std::vector<uint64_t> shardOffsets(config.shards + 1, 0);
				for (uint32_t shard = 1; shard <= config.shards; ++shard) {
					auto it = std::partition_point(kmers.begin(), kmers.end(), [&](uint32_t key) {
						return shardOf(key, config.shards, config.kmer.kmerSize) < shard;
						});
					shardOffsets[shard] = static_cast<uint64_t>(it - kmers.begin());
				}

				std::string output_filename = spillPath(config.tmp_dir, pos);
				std::ofstream ofile(output_filename, std::ios::binary);
				if (!ofile.is_open()) {
					throw bramble::ResourceError("Unable to write the k-mer file: " + output_filename);
				}
				ofile.write(reinterpret_cast<const char*>(shardOffsets.data()), shardOffsets.size() * sizeof(uint64_t));
				ofile.write(reinterpret_cast<const char*>(kmers.data()), kmers.size() * sizeof(uint32_t));
				if (!ofile.good()) {
					throw bramble::ResourceError("Unable to write the k-mer file: " + output_filename);
				}

#pragma omp critical(build_file_info)
				fileInfo += localFileInfo;
			}
			catch (const std::exception&) {
#pragma omp critical(build_failure)
				{
					if (!failure)
						failure = std::current_exception();
				}
			}
		}

		if (failure) {
			std::rethrow_exception(failure);
		}
		bramble::throwIfInterrupted("k-mer extraction");
	}

	void readSpilledShard(const std::string& path, uint32_t shard, uint32_t shards, std::vector<uint32_t>& kmers) {
		std::ifstream ifile(path, std::ios::binary);
		if (!ifile.is_open()) {
			throw bramble::ResourceError("Unable to open the k-mer file: " + path);
		}
		uint64_t range[2] = { 0, 0 };
		ifile.seekg(static_cast<std::streamoff>(shard * sizeof(uint64_t)));
		ifile.read(reinterpret_cast<char*>(range), sizeof(range));
		if (!ifile || range[1] < range[0]) {
			throw bramble::ResourceError("Corrupt shard offsets in the k-mer file: " + path);
		}
		kmers.resize(range[1] - range[0]);
		ifile.seekg(static_cast<std::streamoff>((static_cast<uint64_t>(shards) + 1) * sizeof(uint64_t) + range[0] * sizeof(uint32_t)));
		ifile.read(reinterpret_cast<char*>(kmers.data()), static_cast<std::streamsize>(kmers.size() * sizeof(uint32_t)));
		if (!ifile.good()) {
			throw bramble::ResourceError("Truncated k-mer file: " + path);
		}
	}

	/**
	 * Accumulate the membership sets of the keys of one shard, reading the references in position order.
	 */
	static ShardResult buildShard(uint32_t shard, size_t fileCount, const BuildConfig& config) {
		robin_hood::unordered_flat_map<uint32_t, uint32_t> keyIndex;
		std::vector<bramble::RangeBuilder> builders;
		std::vector<uint32_t> keys;
		std::vector<uint32_t> kmers;

		for (size_t pos = 0; pos < fileCount; ++pos) {
			readSpilledShard(spillPath(config.tmp_dir, pos), shard, config.shards, kmers);
			for (uint32_t kmer : kmers) {
				auto [it, inserted] = keyIndex.try_emplace(kmer, static_cast<uint32_t>(builders.size()));
				if (inserted) {
					builders.emplace_back();
					keys.push_back(kmer);
				}
				builders[it->second].add(static_cast<uint32_t>(pos));
			}
		}

		std::vector<uint32_t> sortedKeys = keys;
		std::sort(sortedKeys.begin(), sortedKeys.end());
		ShardResult result;
		result.keys.reserve(sortedKeys.size());
		result.offsets.reserve(sortedKeys.size() + 1);
		for (uint32_t key : sortedKeys) {
			result.keys.push_back(key);
			bramble::encodeRanges(builders[keyIndex.at(key)].get(), result.blocks);
			result.offsets.push_back(result.blocks.size());
		}
		return result;
	}

	bramble::Database buildDatabase(const std::vector<bramble::ReferenceRecord>& records,
		const BuildConfig& config,
		bramble::FileInfo& fileInfo)
	{
		if (records.empty()) {
			throw bramble::InvariantError("Cannot build a database from an empty reference set");
		}
		if (config.shards == 0) {
			throw std::invalid_argument("Shard count must be at least 1");
		}
		config.kmer.validate();
		createOrResetDirectory(config.tmp_dir, config.verbose);
		TmpDirGuard guard(config.tmp_dir);

		auto extract_start = bramble::timer_clock::now();
		std::cout << "Extracting k-mers..." << std::endl;
		spillKmers(records, config, fileInfo);
		if (config.verbose) {
			std::cout << "Extract time: ";
			bramble::printTime(bramble::elapsedMs(extract_start));
		}

		auto shard_start = bramble::timer_clock::now();
		std::cout << "Building " << config.shards << " shards..." << std::endl;
		std::vector<ShardResult> shards(config.shards);
		std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic)
		for (uint32_t shard = 0; shard < config.shards; ++shard)
		{
			if (bramble::interrupted())
				continue;
			try {
				shards[shard] = buildShard(shard, records.size(), config);
			}
			catch (const std::exception&) {
#pragma omp critical(build_failure)
				{
					if (!failure)
						failure = std::current_exception();
				}
			}
		}
		if (failure) {
			std::rethrow_exception(failure);
		}
		bramble::throwIfInterrupted("shard accumulation");
		if (config.verbose) {
			std::cout << "Shard time: ";
			bramble::printTime(bramble::elapsedMs(shard_start));
		}

		// shards own disjoint, ascending key ranges
		bramble::Database database;
		database.config = config.kmer;
		database.possibleKmers = bramble::possibleKmers(config.kmer);
		for (const auto& record : records) {
			database.files.push_back(record.path);
			database.taxids.push_back(record.taxid);
		}
		size_t keyTotal = 0, blockTotal = 0;
		for (const auto& shard : shards) {
			keyTotal += shard.keys.size();
			blockTotal += shard.blocks.size();
		}
		database.keys.reserve(keyTotal);
		database.offsets.reserve(keyTotal + 1);
		database.blocks.reserve(blockTotal);
		for (auto& shard : shards) {
			uint64_t base = database.blocks.size();
			database.keys.insert(database.keys.end(), shard.keys.begin(), shard.keys.end());
			for (size_t idx = 1; idx < shard.offsets.size(); ++idx) {
				database.offsets.push_back(base + shard.offsets[idx]);
			}
			database.blocks.insert(database.blocks.end(), shard.blocks.begin(), shard.blocks.end());
			shard = ShardResult();
		}
		database.recomputeKmerCounts();
		database.validate();
		return database;
	}

	bramble::Database buildDatabase(const std::vector<bramble::ReferenceRecord>& records,
		const std::vector<uint32_t>& ordering,
		const BuildConfig& config,
		bramble::FileInfo& fileInfo)
	{
		BrambleOrder::verifyPermutation(ordering, records.size());
		std::vector<bramble::ReferenceRecord> ordered;
		ordered.reserve(records.size());
		for (uint32_t reference : ordering) {
			ordered.push_back(records[reference]);
		}
		return buildDatabase(ordered, config, fileInfo);
	}

	void run(BuildConfig config) {
		auto build_start = bramble::timer_clock::now();

		std::cout << "Reading input files..." << std::endl;
		bramble::FileToTaxid input = bramble::loadFileToTaxid(config.input_file);
		if (input.config) {
			if (config.kmer_given) {
				bramble::checkConfig(*input.config, config.kmer, config.input_file);
			}
			config.kmer = *input.config;
		}
		else {
			std::cerr << config.input_file << " has no #bramble configuration line, using " << config.kmer << std::endl;
		}
		config.kmer.validate();
		if (input.records.empty()) {
			throw bramble::ResourceError("No reference files listed in " + config.input_file);
		}
		bramble::requireReferences(input.records, config.reference_dir);
		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.db");
		bramble::ensureWritable(config.output_file);
		if (config.tmp_dir.empty()) {
			config.tmp_dir = config.output_file + ".parts";
		}
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		omp_set_num_threads(config.threads);
		bramble::FileInfo fileInfo;
		fileInfo.invalidNum += input.invalidNum;
		bramble::Database database = buildDatabase(input.records, config, fileInfo);

		std::cout << "Writing database..." << std::endl;
		bramble::saveDatabase(config.output_file, database);

		if (config.verbose) {
			std::cout << "File information:" << std::endl;
			std::cout << fileInfo << std::endl;
			std::cout << database;
			std::cout << std::left << std::setw(20) << "Database size:"
				<< bramble::formatFileSize(std::filesystem::file_size(config.output_file)) << std::endl << std::endl;
			std::cout << "Total build time: ";
			bramble::printTime(bramble::elapsedMs(build_start));
		}
		std::cout << "Database written to " << config.output_file << std::endl;
	}
}
