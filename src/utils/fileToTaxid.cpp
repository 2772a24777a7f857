/*
 * -----------------------------------------------------------------------------
 * Filename:      fileToTaxid.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-04
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  File-to-taxid mappings and reference k-mer bitmaps
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <fileToTaxid.hpp>
#include <artifact.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace bramble {
	std::ostream& operator<<(std::ostream& os, const FileInfo& fileInfo) {
		os << "Number of files: " << fileInfo.fileNum << std::endl;
		os << "Number of invalid files: " << fileInfo.invalidNum << std::endl;
		os << "Number of sequences: " << fileInfo.sequenceNum << std::endl;
		os << "Number of skipped sequences: " << fileInfo.skippedNum << std::endl;
		os << "Total base pairs: " << fileInfo.bpLength << std::endl;
		os << "Total kmers: " << fileInfo.kmerNum << std::endl;
		return os;
	}

	std::optional<ReferenceRecord> parseFileToTaxidLine(const std::string& line) {
		size_t tab = line.find('\t');
		if (tab == std::string::npos || tab == 0) {
			return std::nullopt;
		}
		std::string taxidStr = line.substr(tab + 1);
		// Tolerate Windows line endings and trailing columns
		size_t endOfTaxid = taxidStr.find_first_of("\t\r ");
		if (endOfTaxid != std::string::npos) {
			taxidStr.resize(endOfTaxid);
		}
		if (taxidStr.empty() || !std::all_of(taxidStr.begin(), taxidStr.end(), [](char c) { return c >= '0' && c <= '9'; })) {
			return std::nullopt;
		}
		ReferenceRecord record;
		record.path = line.substr(0, tab);
		try {
			record.taxid = std::stoull(taxidStr);
		}
		catch (const std::out_of_range&) {
			return std::nullopt;
		}
		return record;
	}

	std::string configComment(const KmerConfig& config) {
		std::ostringstream oss;
		oss << "#bramble\tk=" << static_cast<int>(config.kmerSize)
			<< "\ts=" << static_cast<int>(config.smerSize)
			<< "\tt=" << static_cast<int>(config.syncmerOffset);
		return oss.str();
	}

	std::optional<KmerConfig> parseConfigComment(const std::string& line) {
		std::istringstream iss(line);
		std::string tag;
		if (!(iss >> tag) || tag != "#bramble") {
			return std::nullopt;
		}
		KmerConfig config;
		bool seenK = false, seenS = false, seenT = false;
		std::string field;
		while (iss >> field) {
			size_t eq = field.find('=');
			if (eq == std::string::npos) {
				return std::nullopt;
			}
			int value = 0;
			try {
				value = std::stoi(field.substr(eq + 1));
			}
			catch (const std::exception&) {
				return std::nullopt;
			}
			if (value < 0 || value > 255) {
				return std::nullopt;
			}
			std::string key = field.substr(0, eq);
			if (key == "k") {
				config.kmerSize = static_cast<uint8_t>(value);
				seenK = true;
			}
			else if (key == "s") {
				config.smerSize = static_cast<uint8_t>(value);
				seenS = true;
			}
			else if (key == "t") {
				config.syncmerOffset = static_cast<uint8_t>(value);
				seenT = true;
			}
		}
		if (!(seenK && seenS && seenT)) {
			return std::nullopt;
		}
		return config;
	}

	FileToTaxid loadFileToTaxid(const std::string& path) {
		std::ifstream inputFile(path);
		if (!inputFile.is_open()) {
			throw ResourceError("Failed to open file2taxid file: " + path);
		}
		FileToTaxid result;
		std::string line;
		size_t lineNum = 0;
		while (std::getline(inputFile, line)) {
			++lineNum;
			if (line.empty()) {
				continue;
			}
			if (line[0] == '#') {
				if (auto config = parseConfigComment(line)) {
					result.config = config;
				}
				continue;
			}
			auto record = parseFileToTaxidLine(line);
			if (!record) {
				std::cerr << "Line " << lineNum << " of " << path << " is malformed, skipping: " << line << std::endl;
				result.invalidNum++;
				continue;
			}
			result.records.push_back(std::move(*record));
		}
		return result;
	}

	void saveFileToTaxid(const std::string& path, const std::vector<ReferenceRecord>& records, const KmerConfig& config) {
		writeAtomically(path, [&](std::ostream& os) {
			os << configComment(config) << '\n';
			for (const auto& record : records) {
				os << record.path << '\t' << record.taxid << '\n';
			}
			});
	}

	std::vector<std::string> referencePaths(const ReferenceRecord& record, const std::string& referenceDir) {
		std::vector<std::string> paths;
		std::istringstream iss(record.path);
		std::string file;
		while (std::getline(iss, file, '$')) {
			if (file.empty()) {
				continue;
			}
			if (referenceDir.empty()) {
				paths.push_back(file);
			}
			else {
				paths.push_back((std::filesystem::path(referenceDir) / file).string());
			}
		}
		return paths;
	}

	void requireReferences(const std::vector<ReferenceRecord>& records, const std::string& referenceDir) {
		for (const auto& record : records) {
			for (const auto& file : referencePaths(record, referenceDir)) {
				requireFile(file);
			}
		}
	}

	roaring::Roaring referenceKmerBitmap(const std::vector<std::string>& files,
		const KmerConfig& config,
		FileInfo& fileInfo)
	{
		roaring::Roaring bitmap;
		forEachReferenceKmer(files, config, fileInfo, [&bitmap](uint32_t kmer) {
			bitmap.add(kmer);
			});
		bitmap.runOptimize();
		bitmap.shrinkToFit();
		fileInfo.kmerNum += bitmap.cardinality();
		return bitmap;
	}
}
