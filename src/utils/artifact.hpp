/*
 * -----------------------------------------------------------------------------
 * Filename:      artifact.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-03
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  Bramble artifact IO helpers.
 *
 *  Every binary artifact starts with a raw 8 byte magic, followed by a cereal
 *  archive whose first object is an ArtifactHeader. The header can be read
 *  without touching the payload, so stages can check the k-mer configuration
 *  of an input before loading it.
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef ARTIFACT_HPP
#define ARTIFACT_HPP

#include <errors.hpp>
#include <kmerConfig.hpp>

#include <cereal/archives/binary.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace bramble {
	inline constexpr std::array<char, 8> kArtifactMagic{ {'B', 'R', 'A', 'M', 'B', 'L', 'E', '1'} };
	inline constexpr uint16_t kArtifactVersion = 2;

	inline constexpr uint8_t kDistanceArtifact = 1;
	inline constexpr uint8_t kDatabaseArtifact = 2;

	struct ArtifactHeader {
		uint8_t kind{ 0 };
		uint16_t version{ kArtifactVersion };
		KmerConfig config{};
		uint64_t fileCount{ 0 };
		// 0 for exact databases and distance matrices
		uint32_t lossyLevel{ 0 };

		template <class Archive>
		void serialize(Archive& archive) {
			archive(kind, version, config, fileCount, lossyLevel);
		}
	};

	std::string artifactKindName(uint8_t kind);

	std::ostream& operator<<(std::ostream& os, const ArtifactHeader& header);

	/**
	 * Write the magic and the header. The payload must follow in a cereal archive on the same stream.
	 */
	void writeHeader(std::ostream& os, const ArtifactHeader& header);

	/**
	 * Read the magic and the header from a stream positioned at the start of an artifact.
	 * Throws std::runtime_error when the magic or the format version is wrong.
	 */
	ArtifactHeader readHeader(std::istream& is, const std::string& path);

	/**
	 * Read only the header of the artifact at path.
	 */
	ArtifactHeader readHeader(const std::string& path);

	/**
	 * Check that a stored configuration equals the requested one.
	 * Throws ConfigMismatchError naming both configurations otherwise.
	 */
	void checkConfig(const KmerConfig& stored, const KmerConfig& requested, const std::string& what);

	/**
	 * Resolve the output location: a directory gets defaultName appended, anything else is used as given.
	 */
	std::string resolveOutputPath(const std::string& output, const std::string& defaultName);

	/**
	 * Fail with ResourceError unless a file can be created at path.
	 */
	void ensureWritable(const std::string& path);

	/**
	 * Fail with ResourceError unless path is an existing regular file.
	 */
	void requireFile(const std::string& path);

	std::string formatFileSize(std::uintmax_t fileSize);

	/**
	 * Write through a temporary file and rename it to path once the writer returned.
	 * A failing writer leaves nothing behind at path.
	 */
	template <typename Writer>
	void writeAtomically(const std::string& path, Writer&& writer) {
		const std::string tmpPath = path + ".tmp";
		try {
			{
				std::ofstream os(tmpPath, std::ios::binary);
				if (!os.is_open()) {
					throw ResourceError("Failed to open file: " + tmpPath);
				}
				writer(os);
				os.flush();
				if (!os.good()) {
					throw ResourceError("Failed to write file: " + tmpPath);
				}
			}
			std::filesystem::rename(tmpPath, path);
		}
		catch (...) {
			std::error_code ec;
			std::filesystem::remove(tmpPath, ec);
			throw;
		}
	}
}

#endif // ARTIFACT_HPP
