/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleDatabase.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-10-02
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  Maintenance of existing artifacts
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#include <BrambleDatabase.hpp>
#include <artifact.hpp>
#include <fileToTaxid.hpp>
#include <timeUtil.hpp>
#include <array>
#include <iomanip>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace BrambleDatabase {
	size_t retaxid(bramble::Database& database, const std::string& fileName, uint64_t taxid) {
		size_t changed = 0;
		for (size_t pos = 0; pos < database.fileCount(); ++pos) {
			if (database.files[pos] == fileName) {
				database.taxids[pos] = taxid;
				++changed;
			}
		}
		if (changed == 0) {
			throw std::invalid_argument("No reference named " + fileName + " in the database");
		}
		return changed;
	}

	void runRetaxid(RetaxidConfig config) {
		auto start = bramble::timer_clock::now();
		bramble::requireFile(config.database_file);
		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.fixed.db");
		bramble::ensureWritable(config.output_file);

		std::cout << "Loading database..." << std::endl;
		bramble::Database database = bramble::loadDatabase(config.database_file);
		size_t changed = retaxid(database, config.file, config.taxid);

		std::cout << "Writing database..." << std::endl;
		bramble::saveDatabase(config.output_file, database);
		if (config.verbose) {
			std::cout << "Positions updated: " << changed << std::endl;
			std::cout << "Retaxid time: ";
			bramble::printTime(bramble::elapsedMs(start));
		}
		std::cout << "Database written to " << config.output_file << std::endl;
	}

	void printInfo(const std::string& path, std::ostream& os) {
		bramble::requireFile(path);
		std::array<char, 8> magic{};
		{
			std::ifstream is(path, std::ios::binary);
			is.read(magic.data(), static_cast<std::streamsize>(magic.size()));
		}
		os << std::left << std::setw(20) << "File:" << path << std::endl
			<< std::setw(20) << "Size:" << bramble::formatFileSize(std::filesystem::file_size(path)) << std::endl;
		if (magic == bramble::kArtifactMagic) {
			os << bramble::readHeader(path);
			return;
		}

		bramble::FileToTaxid mapping = bramble::loadFileToTaxid(path);
		os << std::setw(20) << "Artifact:" << "file2taxid mapping" << std::endl
			<< std::setw(20) << "References:" << mapping.records.size() << std::endl;
		if (mapping.config) {
			os << std::setw(20) << "Ordered under:" << *mapping.config << std::endl;
		}
		else {
			os << std::setw(20) << "Ordered under:" << "none (unordered)" << std::endl;
		}
	}
}
