/*
 * -----------------------------------------------------------------------------
 * Filename:      distanceConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-06
 *
 * Last Modified: 2026-10-03
 *
 * Description:
 *  Configuration of the pairwise distance module
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef DISTANCECONFIG_HPP
#define DISTANCECONFIG_HPP
#include <kmerConfig.hpp>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace BrambleDistance {
	struct DistanceConfig {
		std::string input_file;
		std::string reference_dir;
		std::string output_file;
		// previous distances and where their references live, only used when extending
		std::string distance_file;
		std::string old_reference_dir;
		std::string mode{ "exact" };
		uint8_t hll_bits{ 12 };
		bramble::KmerConfig kmer;
		// set when -k, -s or -O appeared on the command line
		bool kmer_given = false;
		uint16_t threads{ 1 };
		bool verbose = true;
	};

	inline std::ostream& operator<<(std::ostream& os, const DistanceConfig& config) {
		os << std::string(50, '=') << std::endl;
		os << " Distance Configuration " << std::endl;
		os << std::string(50, '=') << std::endl;

		os << std::left
			<< std::setw(25) << "Input file:" << config.input_file << std::endl;
		if (!config.distance_file.empty()) {
			os << std::setw(25) << "Distance file:" << config.distance_file << std::endl;
		}
		if (!config.old_reference_dir.empty()) {
			os << std::setw(25) << "Old reference directory:" << config.old_reference_dir << std::endl;
		}
		os << std::setw(25) << "Reference directory:" << (config.reference_dir.empty() ? "." : config.reference_dir) << std::endl
			<< std::setw(25) << "Output file:" << config.output_file << std::endl
			<< std::setw(25) << "Mode:" << config.mode << std::endl
			<< std::setw(25) << "HLL bits:" << (int)config.hll_bits << std::endl
			<< std::setw(25) << "Kmer size:" << (int)config.kmer.kmerSize << std::endl
			<< std::setw(25) << "Smer size:" << (int)config.kmer.smerSize << std::endl
			<< std::setw(25) << "Syncmer offset:" << (int)config.kmer.syncmerOffset << std::endl
			<< std::setw(25) << "Threads:" << config.threads << std::endl
			<< std::setw(25) << "Verbose:" << config.verbose << std::endl;

		os << std::string(50, '=') << std::endl;

		return os;
	}
}

#endif // DISTANCECONFIG_HPP
