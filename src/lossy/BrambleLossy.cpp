/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleLossy.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-20
 *
 * Last Modified: 2026-09-30
 *
 * Description:
 *  The main program of BrambleLossy.
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#include <BrambleLossy.hpp>
#include <artifact.hpp>
#include <interrupt.hpp>
#include <timeUtil.hpp>
#include <omp.h>
#include <filesystem>
#include <stdexcept>

namespace BrambleLossy {
	std::vector<bramble::PositionRange> widenRanges(const std::vector<bramble::PositionRange>& ranges, uint32_t level) {
		std::vector<bramble::PositionRange> widened;
		const uint64_t gapLimit = maxGap(level);
		for (const auto& range : ranges) {
			if (!widened.empty()) {
				bramble::PositionRange& last = widened.back();
				if (static_cast<uint64_t>(range.start) - last.end() <= gapLimit) {
					last.length = range.end() - last.start;
					continue;
				}
			}
			widened.push_back(range);
		}
		return widened;
	}

	bramble::Database recompress(const bramble::Database& exact, uint32_t level) {
		if (exact.lossy()) {
			throw std::invalid_argument("Database is already lossy (level " + std::to_string(exact.lossyLevel)
				+ "), recompress the exact database instead");
		}
		if (level < 1 || level > MAX_LOSSY_LEVEL) {
			throw std::invalid_argument("Lossy level must be in [1, 31], got " + std::to_string(level));
		}

		// Widen in parallel into per-key block lists, then concatenate in key order
		std::vector<std::vector<uint16_t>> widenedBlocks(exact.keyCount());

#pragma omp parallel for schedule(dynamic, 4096)
		for (size_t idx = 0; idx < exact.keyCount(); ++idx)
		{
			if (bramble::interrupted())
				continue;
			auto ranges = widenRanges(bramble::decodeRanges(exact.membership(idx)), level);
			bramble::encodeRanges(ranges, widenedBlocks[idx]);
		}
		bramble::throwIfInterrupted("lossy recompression");

		bramble::Database lossy;
		lossy.config = exact.config;
		lossy.lossyLevel = level;
		lossy.possibleKmers = exact.possibleKmers;
		lossy.files = exact.files;
		lossy.taxids = exact.taxids;
		lossy.keys = exact.keys;
		lossy.offsets.reserve(exact.keyCount() + 1);
		for (auto& blocks : widenedBlocks) {
			lossy.blocks.insert(lossy.blocks.end(), blocks.begin(), blocks.end());
			lossy.offsets.push_back(lossy.blocks.size());
			std::vector<uint16_t>().swap(blocks);
		}
		lossy.recomputeKmerCounts();
		lossy.validate();
		return lossy;
	}

	static uint64_t totalMembers(const bramble::Database& database) {
		uint64_t total = 0;
		for (uint64_t count : database.kmerCounts) {
			total += count;
		}
		return total;
	}

	void run(LossyConfig config) {
		auto lossy_start = bramble::timer_clock::now();
		if (config.level < 1 || config.level > MAX_LOSSY_LEVEL) {
			throw std::invalid_argument("Lossy level must be in [1, 31], got " + std::to_string(config.level));
		}
		bramble::requireFile(config.database_file);
		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.lossy.db");
		bramble::ensureWritable(config.output_file);
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		bramble::ArtifactHeader header = bramble::readHeader(config.database_file);
		if (header.kind != bramble::kDatabaseArtifact) {
			throw std::runtime_error(config.database_file + " holds " + bramble::artifactKindName(header.kind) + ", expected a database");
		}
		if (header.lossyLevel > 0) {
			throw std::invalid_argument(config.database_file + " is already lossy (level " + std::to_string(header.lossyLevel) + ")");
		}

		std::cout << "Loading database..." << std::endl;
		bramble::Database exact = bramble::loadDatabase(config.database_file);

		omp_set_num_threads(config.threads);
		std::cout << "Recompressing at level " << config.level << "..." << std::endl;
		bramble::Database lossy = recompress(exact, config.level);

		std::cout << "Writing database..." << std::endl;
		bramble::saveDatabase(config.output_file, lossy);

		if (config.verbose) {
			std::cout << "Blocks before: " << exact.blocks.size() << std::endl;
			std::cout << "Blocks after: " << lossy.blocks.size() << std::endl;
			std::cout << "Memberships before: " << totalMembers(exact) << std::endl;
			std::cout << "Memberships after: " << totalMembers(lossy) << std::endl;
			std::cout << "Database size: " << bramble::formatFileSize(std::filesystem::file_size(config.output_file)) << std::endl;
			std::cout << "Lossy time: ";
			bramble::printTime(bramble::elapsedMs(lossy_start));
			std::cout << std::endl;
		}
		std::cout << "Lossy database written to " << config.output_file << std::endl;
	}
}
