/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleDistance.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-06
 *
 * Last Modified: 2026-10-05
 *
 * Description:
 *  The main program of BrambleDistance.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <BrambleDistance.hpp>
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace BrambleDistance {
	double jaccardDistance(const roaring::Roaring& a, const roaring::Roaring& b) {
		if (a.isEmpty() || b.isEmpty()) {
			return 1.0;
		}
		uint64_t shared = a.and_cardinality(b);
		uint64_t unionSize = a.or_cardinality(b);
		return 1.0 - static_cast<double>(shared) / static_cast<double>(unionSize);
	}

	std::vector<std::vector<std::string>> resolveReferences(const std::vector<bramble::ReferenceRecord>& records,
		const DistanceConfig& config,
		size_t firstNewRow)
	{
		const std::string& oldDir = config.old_reference_dir.empty() ? config.reference_dir : config.old_reference_dir;
		std::vector<std::vector<std::string>> files;
		files.reserve(records.size());
		for (size_t idx = 0; idx < records.size(); ++idx) {
			files.push_back(bramble::referencePaths(records[idx], idx < firstNewRow ? oldDir : config.reference_dir));
		}
		return files;
	}

	std::vector<roaring::Roaring> computeKmerSets(const std::vector<std::vector<std::string>>& files,
		const bramble::KmerConfig& kmer,
		bramble::FileInfo& fileInfo)
	{
		std::vector<roaring::Roaring> sets(files.size());
		std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic)
		for (size_t idx = 0; idx < files.size(); ++idx)
		{
			if (bramble::interrupted())
				continue;
			try {
				bramble::FileInfo localFileInfo;
				sets[idx] = bramble::referenceKmerBitmap(files[idx], kmer, localFileInfo);
#pragma omp critical(distance_file_info)
				fileInfo += localFileInfo;
			}
			catch (const std::exception&) {
#pragma omp critical(distance_failure)
				{
					if (!failure)
						failure = std::current_exception();
				}
			}
		}
		if (failure)
			std::rethrow_exception(failure);
		bramble::throwIfInterrupted("k-mer extraction");
		return sets;
	}

	std::vector<bramble::HyperLogLog> computeSketches(const std::vector<std::vector<std::string>>& files,
		const bramble::KmerConfig& kmer,
		uint8_t hllBits,
		bramble::FileInfo& fileInfo)
	{
		std::vector<bramble::HyperLogLog> sketches(files.size(), bramble::HyperLogLog(hllBits));
		std::exception_ptr failure;

#pragma omp parallel for schedule(dynamic)
		for (size_t idx = 0; idx < files.size(); ++idx)
		{
			if (bramble::interrupted())
				continue;
			try {
				bramble::FileInfo localFileInfo;
				bramble::HyperLogLog& sketch = sketches[idx];
				bramble::forEachReferenceKmer(files[idx], kmer, localFileInfo,
					[&sketch, &localFileInfo](uint32_t value) {
						sketch.add(value);
						localFileInfo.kmerNum++;
					});
#pragma omp critical(distance_file_info)
				fileInfo += localFileInfo;
			}
			catch (const std::exception&) {
#pragma omp critical(distance_failure)
				{
					if (!failure)
						failure = std::current_exception();
				}
			}
		}
		if (failure)
			std::rethrow_exception(failure);
		bramble::throwIfInterrupted("sketching");
		return sketches;
	}

	void fillDistances(bramble::DistanceMatrix& matrix, const std::vector<roaring::Roaring>& sets, size_t firstRow) {
		if (sets.size() != matrix.size()) {
			throw std::invalid_argument("Number of k-mer sets does not match the matrix size");
		}
		firstRow = std::max<size_t>(firstRow, 1);

#pragma omp parallel for schedule(dynamic)
		for (size_t i = firstRow; i < matrix.size(); ++i)
		{
			if (bramble::interrupted())
				continue;
			for (size_t j = 0; j < i; ++j)
			{
				matrix.set(i, j, static_cast<float>(jaccardDistance(sets[i], sets[j])));
			}
		}
		bramble::throwIfInterrupted("distance computation");
	}

	void fillDistances(bramble::DistanceMatrix& matrix, const std::vector<bramble::HyperLogLog>& sketches, size_t firstRow) {
		if (sketches.size() != matrix.size()) {
			throw std::invalid_argument("Number of sketches does not match the matrix size");
		}
		firstRow = std::max<size_t>(firstRow, 1);

#pragma omp parallel for schedule(dynamic)
		for (size_t i = firstRow; i < matrix.size(); ++i)
		{
			if (bramble::interrupted())
				continue;
			for (size_t j = 0; j < i; ++j)
			{
				matrix.set(i, j, static_cast<float>(bramble::sketchDistance(sketches[i], sketches[j])));
			}
		}
		bramble::throwIfInterrupted("distance computation");
	}

	bramble::DistanceMatrix computeDistances(const std::vector<bramble::ReferenceRecord>& records,
		const DistanceConfig& config,
		const bramble::DistanceMatrix& previous,
		size_t firstRow,
		bramble::FileInfo& fileInfo)
	{
		if (firstRow > records.size() || previous.size() != firstRow) {
			throw std::invalid_argument("Previous distance matrix has " + std::to_string(previous.size())
				+ " rows, expected " + std::to_string(firstRow));
		}
		bramble::DistanceMatrix matrix = previous;
		matrix.extend(records.size());
		auto files = resolveReferences(records, config, firstRow);

		if (config.mode == "exact") {
			auto sets = computeKmerSets(files, config.kmer, fileInfo);
			fillDistances(matrix, sets, firstRow);
		}
		else if (config.mode == "hll") {
			auto sketches = computeSketches(files, config.kmer, config.hll_bits, fileInfo);
			fillDistances(matrix, sketches, firstRow);
		}
		else {
			throw std::invalid_argument("Unknown distance mode: " + config.mode);
		}
		return matrix;
	}

	void saveDistances(const std::string& path, const DistanceArtifact& artifact) {
		artifact.matrix.validate();
		if (artifact.matrix.size() != artifact.records.size()) {
			throw bramble::InvariantError("Distance matrix size does not match the number of references");
		}
		bramble::ArtifactHeader header;
		header.kind = bramble::kDistanceArtifact;
		header.config = artifact.config;
		header.fileCount = artifact.records.size();
		bramble::writeAtomically(path, [&](std::ostream& os) {
			bramble::writeHeader(os, header);
			cereal::BinaryOutputArchive archive(os);
			archive(artifact);
			});
	}

	DistanceArtifact loadDistances(const std::string& path) {
		std::ifstream is(path, std::ios::binary);
		if (!is.is_open()) {
			throw bramble::ResourceError("Failed to open file: " + path);
		}
		bramble::ArtifactHeader header = bramble::readHeader(is, path);
		if (header.kind != bramble::kDistanceArtifact) {
			throw std::runtime_error(path + " holds " + bramble::artifactKindName(header.kind) + ", expected pairwise distances");
		}
		DistanceArtifact artifact;
		cereal::BinaryInputArchive archive(is);
		archive(artifact);
		artifact.config = header.config;
		if (artifact.records.size() != header.fileCount || artifact.matrix.size() != header.fileCount) {
			throw bramble::InvariantError("Distance artifact " + path + " declares " + std::to_string(header.fileCount)
				+ " references but holds " + std::to_string(artifact.matrix.size()));
		}
		artifact.matrix.validate();
		return artifact;
	}

	static void printReport(const DistanceConfig& config, const bramble::FileInfo& fileInfo, size_t computedRows, long long ms) {
		if (!config.verbose)
			return;
		std::cout << "File information:" << std::endl;
		std::cout << fileInfo;
		std::cout << "Computed rows: " << computedRows << std::endl;
		std::cout << "Distance time: ";
		bramble::printTime(ms);
		std::cout << std::endl;
	}

	void run(DistanceConfig config) {
		auto distance_start = bramble::timer_clock::now();
		config.kmer.validate();
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		std::cout << "Reading input files..." << std::endl;
		bramble::FileToTaxid input = bramble::loadFileToTaxid(config.input_file);
		if (input.records.empty()) {
			throw bramble::ResourceError("No reference files listed in " + config.input_file);
		}
		bramble::requireReferences(input.records, config.reference_dir);
		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.pd");
		bramble::ensureWritable(config.output_file);

		omp_set_num_threads(config.threads);
		std::cout << "Computing pairwise distances..." << std::endl;
		bramble::FileInfo fileInfo;
		fileInfo.invalidNum += input.invalidNum;

		DistanceArtifact artifact;
		artifact.config = config.kmer;
		artifact.records = input.records;
		artifact.mode = config.mode;
		artifact.hllBits = config.hll_bits;
		artifact.matrix = computeDistances(artifact.records, config, bramble::DistanceMatrix(), 0, fileInfo);

		saveDistances(config.output_file, artifact);
		printReport(config, fileInfo, artifact.records.size(), bramble::elapsedMs(distance_start));
		std::cout << "Distances written to " << config.output_file << std::endl;
	}

	void runExtend(DistanceConfig config) {
		auto extend_start = bramble::timer_clock::now();

		std::cout << "Loading distance file..." << std::endl;
		DistanceArtifact artifact = loadDistances(config.distance_file);
		if (config.kmer_given) {
			bramble::checkConfig(artifact.config, config.kmer, config.distance_file);
		}
		config.kmer = artifact.config;
		config.mode = artifact.mode;
		config.hll_bits = artifact.hllBits;
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		std::cout << "Reading input files..." << std::endl;
		bramble::FileToTaxid input = bramble::loadFileToTaxid(config.input_file);
		if (input.records.empty()) {
			throw bramble::ResourceError("No reference files listed in " + config.input_file);
		}
		size_t firstNewRow = artifact.records.size();
		std::vector<bramble::ReferenceRecord> records = artifact.records;
		records.insert(records.end(), input.records.begin(), input.records.end());
		for (const auto& files : resolveReferences(records, config, firstNewRow)) {
			for (const auto& file : files) {
				bramble::requireFile(file);
			}
		}
		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.pd");
		bramble::ensureWritable(config.output_file);

		omp_set_num_threads(config.threads);
		std::cout << "Computing distances of " << input.records.size() << " new references..." << std::endl;
		bramble::FileInfo fileInfo;
		fileInfo.invalidNum += input.invalidNum;
		artifact.matrix = computeDistances(records, config, artifact.matrix, firstNewRow, fileInfo);
		artifact.records = std::move(records);

		saveDistances(config.output_file, artifact);
		printReport(config, fileInfo, artifact.records.size() - firstNewRow, bramble::elapsedMs(extend_start));
		std::cout << "Distances written to " << config.output_file << std::endl;
	}
}
