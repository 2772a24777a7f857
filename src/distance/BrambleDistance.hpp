/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleDistance.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-06
 *
 * Last Modified: 2026-10-05
 *
 * Description:
 *  Pairwise Jaccard distances between reference files
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BRAMBLEDISTANCE_HPP
#define BRAMBLEDISTANCE_HPP
#include <distanceConfig.hpp>
#include <DistanceMatrix.hpp>
#include <HyperLogLog.hpp>
#include <artifact.hpp>
#include <fileToTaxid.hpp>
#include <interrupt.hpp>
#include <timeUtil.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <roaring/roaring.hh>
#include <omp.h>
#include <cstdint>
#include <string>
#include <vector>

namespace BrambleDistance {
	struct DistanceArtifact {
		bramble::KmerConfig config;
		std::vector<bramble::ReferenceRecord> records;
		std::string mode{ "exact" };
		uint8_t hllBits{ 12 };
		bramble::DistanceMatrix matrix;

		template <class Archive>
		void serialize(Archive& archive) {
			archive(records, mode, hllBits, matrix);
		}
	};

	/**
	 * Jaccard distance of two k-mer bitmaps.
	 * Returns 1 when either bitmap is empty.
	 */
	double jaccardDistance(const roaring::Roaring& a, const roaring::Roaring& b);

	/**
	 * The FASTA files of every record. Rows before firstNewRow are resolved against
	 * config.old_reference_dir when it is set, all others against config.reference_dir.
	 */
	std::vector<std::vector<std::string>> resolveReferences(const std::vector<bramble::ReferenceRecord>& records,
		const DistanceConfig& config,
		size_t firstNewRow);

	std::vector<roaring::Roaring> computeKmerSets(const std::vector<std::vector<std::string>>& files,
		const bramble::KmerConfig& kmer,
		bramble::FileInfo& fileInfo);

	std::vector<bramble::HyperLogLog> computeSketches(const std::vector<std::vector<std::string>>& files,
		const bramble::KmerConfig& kmer,
		uint8_t hllBits,
		bramble::FileInfo& fileInfo);

	/**
	 * Fill the rows firstRow .. n - 1 of matrix. Each row is computed by a single thread,
	 * so every cell is written exactly once.
	 *
	 * @param matrix The matrix to fill, sized for every reference.
	 * @param sets The k-mer bitmap of every reference, in matrix order.
	 * @param firstRow The first row to compute, 0 for a full matrix.
	 */
	void fillDistances(bramble::DistanceMatrix& matrix, const std::vector<roaring::Roaring>& sets, size_t firstRow = 0);
	void fillDistances(bramble::DistanceMatrix& matrix, const std::vector<bramble::HyperLogLog>& sketches, size_t firstRow = 0);

	/**
	 * Compute the rows firstRow .. n - 1 of the distance matrix of records.
	 * The cells of earlier rows are taken from previous, which may be empty when firstRow is 0.
	 */
	bramble::DistanceMatrix computeDistances(const std::vector<bramble::ReferenceRecord>& records,
		const DistanceConfig& config,
		const bramble::DistanceMatrix& previous,
		size_t firstRow,
		bramble::FileInfo& fileInfo);

	void saveDistances(const std::string& path, const DistanceArtifact& artifact);
	DistanceArtifact loadDistances(const std::string& path);

	void run(DistanceConfig config);

	/**
	 * Append the references of config.input_file to the distance artifact config.distance_file.
	 */
	void runExtend(DistanceConfig config);
}

#endif // BRAMBLEDISTANCE_HPP
