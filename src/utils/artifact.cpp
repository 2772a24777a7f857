/*
 * -----------------------------------------------------------------------------
 * Filename:      artifact.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-03
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  Bramble artifact IO helpers
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <artifact.hpp>
#include <iomanip>
#include <sstream>

namespace bramble {
	std::string artifactKindName(uint8_t kind) {
		switch (kind) {
		case kDistanceArtifact:
			return "pairwise distances";
		case kDatabaseArtifact:
			return "database";
		default:
			return "unknown (" + std::to_string(kind) + ")";
		}
	}

	std::ostream& operator<<(std::ostream& os, const ArtifactHeader& header) {
		os << std::left
			<< std::setw(20) << "Artifact:" << artifactKindName(header.kind) << std::endl
			<< std::setw(20) << "Format version:" << header.version << std::endl
			<< std::setw(20) << "Kmer size:" << static_cast<int>(header.config.kmerSize) << std::endl
			<< std::setw(20) << "Smer size:" << static_cast<int>(header.config.smerSize) << std::endl
			<< std::setw(20) << "Syncmer offset:" << static_cast<int>(header.config.syncmerOffset) << std::endl
			<< std::setw(20) << "Files:" << header.fileCount << std::endl;
		if (header.kind == kDatabaseArtifact) {
			os << std::setw(20) << "Lossy level:";
			if (header.lossyLevel == 0) {
				os << "exact" << std::endl;
			}
			else {
				os << header.lossyLevel << std::endl;
			}
		}
		return os;
	}

	void writeHeader(std::ostream& os, const ArtifactHeader& header) {
		os.write(kArtifactMagic.data(), static_cast<std::streamsize>(kArtifactMagic.size()));
		if (!os.good()) {
			throw ResourceError("Failed to write artifact header");
		}
		cereal::BinaryOutputArchive archive(os);
		archive(header);
	}

	ArtifactHeader readHeader(std::istream& is, const std::string& path) {
		std::array<char, 8> magic{};
		is.read(magic.data(), static_cast<std::streamsize>(magic.size()));
		if (!is.good() || magic != kArtifactMagic) {
			throw std::runtime_error("Not a Bramble artifact (missing magic header): " + path);
		}
		ArtifactHeader header;
		cereal::BinaryInputArchive archive(is);
		archive(header);
		if (header.version != kArtifactVersion) {
			throw std::runtime_error("Unsupported artifact version " + std::to_string(header.version) + " in " + path);
		}
		return header;
	}

	ArtifactHeader readHeader(const std::string& path) {
		std::ifstream is(path, std::ios::binary);
		if (!is.is_open()) {
			throw ResourceError("Failed to open file: " + path);
		}
		return readHeader(is, path);
	}

	void checkConfig(const KmerConfig& stored, const KmerConfig& requested, const std::string& what) {
		if (!(stored == requested)) {
			throw ConfigMismatchError("Configuration mismatch: " + what + " was built with " + stored.toString()
				+ " but " + requested.toString() + " was requested");
		}
	}

	std::string resolveOutputPath(const std::string& output, const std::string& defaultName) {
		std::filesystem::path outputPath = output.empty() ? std::filesystem::path(".") : std::filesystem::path(output);
		if (std::filesystem::is_directory(outputPath)) {
			return (outputPath / defaultName).string();
		}
		return outputPath.string();
	}

	void ensureWritable(const std::string& path) {
		std::filesystem::path outputPath(path);
		std::filesystem::path parent = outputPath.parent_path();
		if (!parent.empty() && !std::filesystem::is_directory(parent)) {
			throw ResourceError("Output directory does not exist: " + parent.string());
		}
		const std::string scratch = path + ".tmp";
		{
			std::ofstream os(scratch, std::ios::binary);
			if (!os.is_open()) {
				throw ResourceError("Output location is not writable: " + path);
			}
		}
		std::error_code ec;
		std::filesystem::remove(scratch, ec);
	}

	void requireFile(const std::string& path) {
		if (!std::filesystem::is_regular_file(path)) {
			throw ResourceError("Required file does not exist: " + path);
		}
	}

	std::string formatFileSize(std::uintmax_t fileSize) {
		std::ostringstream oss;
		// Output the file size, formatted as KB, MB, or GB
		if (fileSize >= 1024 * 1024 * 1024) {
			oss << std::fixed << std::setprecision(2) << static_cast<double>(fileSize) / (1024 * 1024 * 1024) << " GB";
		}
		else if (fileSize >= 1024 * 1024) {
			oss << std::fixed << std::setprecision(2) << static_cast<double>(fileSize) / (1024 * 1024) << " MB";
		}
		else if (fileSize >= 1024) {
			oss << std::fixed << std::setprecision(2) << static_cast<double>(fileSize) / 1024 << " KB";
		}
		else {
			oss << fileSize << " bytes";
		}
		return oss.str();
	}
}
