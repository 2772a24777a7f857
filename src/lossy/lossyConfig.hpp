/*
 * -----------------------------------------------------------------------------
 * Filename:      lossyConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-20
 *
 * Last Modified: 2026-09-30
 *
 * Description:
 *  Configuration of the lossy recompressor
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef LOSSYCONFIG_HPP
#define LOSSYCONFIG_HPP
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace BrambleLossy {
	inline constexpr uint32_t MAX_LOSSY_LEVEL = 31;

	struct LossyConfig {
		std::string database_file;
		std::string output_file;
		uint32_t level{ 1 };
		uint16_t threads{ 1 };
		bool verbose = true;
	};

	inline std::ostream& operator<<(std::ostream& os, const LossyConfig& config) {
		os << std::string(50, '=') << std::endl;
		os << " Lossy Configuration " << std::endl;
		os << std::string(50, '=') << std::endl;

		os << std::left
			<< std::setw(25) << "Database file:" << config.database_file << std::endl
			<< std::setw(25) << "Output file:" << config.output_file << std::endl
			<< std::setw(25) << "Level:" << config.level << std::endl
			<< std::setw(25) << "Threads:" << config.threads << std::endl
			<< std::setw(25) << "Verbose:" << config.verbose << std::endl;

		os << std::string(50, '=') << std::endl;

		return os;
	}
}

#endif // LOSSYCONFIG_HPP
