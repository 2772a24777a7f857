/*
 * -----------------------------------------------------------------------------
 * Filename:      databaseConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-10-02
 *
 * Last Modified: 2026-10-02
 *
 * Description:
 *  Configuration of the database maintenance commands
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef DATABASECONFIG_HPP
#define DATABASECONFIG_HPP
#include <cstdint>
#include <string>

namespace BrambleDatabase {
	struct RetaxidConfig {
		std::string database_file;
		std::string output_file;
		std::string file;
		uint64_t taxid{ 0 };
		bool verbose = true;
	};
}

#endif // DATABASECONFIG_HPP
