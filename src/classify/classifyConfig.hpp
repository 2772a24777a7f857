/*
 * -----------------------------------------------------------------------------
 * Filename:      classifyConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-22
 *
 * Last Modified: 2026-10-12
 *
 * Description:
 *  Configuration and result types of the read classifier
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef CLASSIFYCONFIG_HPP
#define CLASSIFYCONFIG_HPP
#include <kmerConfig.hpp>
#include <dna5_traits.hpp>
#include <iostream>
#include <vector>
#include <string>
#include <iomanip>
#include <cstdint>

namespace BrambleClassify {
	inline constexpr double DEFAULT_EXPONENT = 9.0;
	inline constexpr uint32_t DEFAULT_TRIALS = 100;

	struct ClassifyConfig {
		std::vector<std::string> readFiles;
		std::string outputFile;
		std::string dbFile;
		double exponent{ DEFAULT_EXPONENT };
		uint32_t trials{ DEFAULT_TRIALS };
		size_t batchSize{ 4096 };
		// batches held in memory at once, 0 for 4 per thread
		size_t batchesPerChunk{ 0 };
		bramble::KmerConfig kmer;
		bool kmer_given = false;
		uint16_t threads{ 1 };
		bool verbose = true;
	};

	inline std::ostream& operator<<(std::ostream& os, const ClassifyConfig& config) {
		os << std::string(40, '=') << std::endl;
		os << " Classify Configuration " << std::endl;
		os << std::string(40, '=') << std::endl;

		os << std::left
			<< std::setw(20) << "Read files:" << std::endl;
		for (const auto& file : config.readFiles) {
			os << std::setw(20) << "" << file << std::endl;
		}
		os << std::setw(20) << "Output file:" << config.outputFile << std::endl
			<< std::setw(20) << "Database file:" << config.dbFile << std::endl
			<< std::setw(20) << "Exponent:" << config.exponent << std::endl
			<< std::setw(20) << "Trials:" << config.trials << std::endl
			<< std::setw(20) << "Batch size:" << config.batchSize << std::endl;
		if (config.kmer_given) {
			os << std::setw(20) << "Requested kmers:" << config.kmer << std::endl;
		}
		os << std::setw(20) << "Threads:" << config.threads << std::endl
			<< std::setw(20) << "Verbose:" << config.verbose << std::endl;

		os << std::string(40, '=') << std::endl;

		return os;
	}

	struct FileInfo {
		size_t fileNum{ 0 };
		size_t invalidNum{ 0 };
		size_t sequenceNum{ 0 };
		size_t classifiedNum{ 0 };
		size_t unclassifiedNum{ 0 };
		size_t bpLength{ 0 };
	};

	struct batchReads {
		size_t index{ 0 };
		std::vector< std::string >                 ids;
		std::vector< std::vector< seqan3::dna5 > > seqs;
	};

	struct ClassificationRecord {
		bool classified{ false };
		std::string readId;
		uint64_t taxid{ 0 };
		std::string file{ "none" };

		bool operator==(const ClassificationRecord& other) const = default;
	};

	inline std::ostream& operator<<(std::ostream& os, const ClassificationRecord& record) {
		return os << (record.classified ? 'C' : 'U') << '\t' << record.readId << '\t' << record.taxid << '\t' << record.file;
	}
}
#endif // !CLASSIFYCONFIG_HPP
