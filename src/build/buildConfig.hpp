/*
 * -----------------------------------------------------------------------------
 * Filename:      buildConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-15
 *
 * Last Modified: 2026-10-10
 *
 * Description:
 *  Configuration of the database builder
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BUILDCONFIG_HPP
#define BUILDCONFIG_HPP
#include <kmerConfig.hpp>
#include <iostream>
#include <iomanip>
#include <cstdint>
#include <string>

namespace BrambleBuild {
	struct BuildConfig {
		std::string input_file;
		std::string reference_dir;
		std::string output_file;
		// spill directory, "<output>.parts" when empty
		std::string tmp_dir;
		bramble::KmerConfig kmer;
		bool kmer_given = false;
		uint32_t shards{ 64 };
		uint16_t threads{ 1 };
		bool verbose = true;
	};

	inline std::ostream& operator<<(std::ostream& os, const BuildConfig& config) {
		os << std::string(50, '=') << std::endl;
		os << " Build Configuration " << std::endl;
		os << std::string(50, '=') << std::endl;

		os << std::left
			<< std::setw(25) << "Input file:" << config.input_file << std::endl
			<< std::setw(25) << "Reference directory:" << (config.reference_dir.empty() ? "." : config.reference_dir) << std::endl
			<< std::setw(25) << "Output file:" << config.output_file << std::endl
			<< std::setw(25) << "Temporary directory:" << config.tmp_dir << std::endl
			<< std::setw(25) << "Kmer size:" << (int)config.kmer.kmerSize << std::endl
			<< std::setw(25) << "Smer size:" << (int)config.kmer.smerSize << std::endl
			<< std::setw(25) << "Syncmer offset:" << (int)config.kmer.syncmerOffset << std::endl
			<< std::setw(25) << "Shards:" << config.shards << std::endl
			<< std::setw(25) << "Threads:" << config.threads << std::endl
			<< std::setw(25) << "Verbose:" << config.verbose << std::endl;

		os << std::string(50, '=') << std::endl;

		return os;
	}
}

#endif // BUILDCONFIG_HPP
