/*
 * -----------------------------------------------------------------------------
 * Filename:      Bramble.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-02
 *
 * Last Modified: 2026-10-12
 *
 * Description:
 *  This is the main entry for Bramble
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <CLI11.hpp>
#include <BrambleDistance.hpp>
#include <BrambleOrder.hpp>
#include <BrambleBuild.hpp>
#include <BrambleLossy.hpp>
#include <BrambleClassify.hpp>
#include <BrambleDatabase.hpp>
#include <interrupt.hpp>
#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>

#ifdef BRAMBLE_VERSION
#define VERSION_INFO BRAMBLE_VERSION
#else
#define VERSION_INFO "unknown"
#endif

/**
 * Add -k, -s and -O to a subcommand.
 *
 * @return The options, to tell afterwards whether any was given.
 */
static std::vector<CLI::Option*> addKmerOptions(CLI::App* sub, bramble::KmerConfig& kmer) {
	std::vector<CLI::Option*> options;
	options.push_back(sub->add_option("-k,--kmer", kmer.kmerSize, "Kmer size")
		->default_val(bramble::DEFAULT_KMER_SIZE)
		->check(CLI::Range(15, 16)));
	options.push_back(sub->add_option("-s,--smer", kmer.smerSize, "Smer size of the open syncmers, equal to the kmer size to keep every kmer")
		->default_val(bramble::DEFAULT_SMER_SIZE)
		->check(CLI::Range(1, 16)));
	options.push_back(sub->add_option("-O,--offset", kmer.syncmerOffset, "Position of the minimal smer in an open syncmer")
		->default_val(bramble::DEFAULT_SYNCMER_OFFSET)
		->check(CLI::Range(0, 15)));
	return options;
}

static bool anyGiven(const std::vector<CLI::Option*>& options) {
	for (auto* option : options) {
		if (option->count() > 0)
			return true;
	}
	return false;
}

int main(int argc, char** argv)
{
	// Create the main application object
	CLI::App app{ "Bramble - k-mer indexing and classification of sequencing reads" };
	BrambleDistance::DistanceConfig distanceConfig;
	BrambleDistance::DistanceConfig extendConfig;
	BrambleOrder::OrderConfig orderConfig;
	BrambleBuild::BuildConfig buildConfig;
	BrambleLossy::LossyConfig lossyConfig;
	BrambleClassify::ClassifyConfig classifyConfig;
	BrambleDatabase::RetaxidConfig retaxidConfig;
	std::string infoFile;

	bool show_version = false;
	app.add_flag("-v,--version", show_version, "Show version information");
	// Create subcommands
	auto distance = app.add_subcommand("distance", "Compute pairwise distances between reference files");
	auto extend = app.add_subcommand("extend", "Add reference files to a pairwise distance file");
	auto order = app.add_subcommand("order", "Order reference files from their pairwise distances");
	auto build = app.add_subcommand("build", "Build a database from an ordered file2taxid file");
	auto lossy = app.add_subcommand("lossy", "Recompress a database lossily");
	auto classify = app.add_subcommand("classify", "Classify sequences");
	auto retaxid = app.add_subcommand("retaxid", "Replace the taxid of a reference file in a database");
	auto info = app.add_subcommand("info", "Print the header of a Bramble file");

	// Distance
	distance->add_option("input", distanceConfig.input_file, "file2taxid (.f2t) file listing the reference files")
		->required()
		->check(CLI::ExistingFile);
	distance->add_option("-r,--reference-dir", distanceConfig.reference_dir, "Directory the reference paths are relative to")
		->check(CLI::ExistingDirectory);
	distance->add_option("-o,--output", distanceConfig.output_file, "Output file, or directory for bramble.pd")
		->default_val(".");
	distance->add_option("--mode", distanceConfig.mode, "exact kmer sets or hll sketches")
		->default_val("exact")
		->check(CLI::IsMember({ "exact", "hll" }));
	distance->add_option("--hll-bits", distanceConfig.hll_bits, "Register bits of the hll sketches")
		->default_val(12)
		->check(CLI::Range(5, 24));
	auto distanceKmer = addKmerOptions(distance, distanceConfig.kmer);
	distance->add_option("-t,--threads", distanceConfig.threads, "Number of threads")
		->default_val(32);
	distance->add_flag("-q,--quiet", distanceConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Extend
	extend->add_option("distances", extendConfig.distance_file, "Pairwise distance (.pd) file to extend")
		->required()
		->check(CLI::ExistingFile);
	extend->add_option("input", extendConfig.input_file, "file2taxid (.f2t) file listing the new reference files")
		->required()
		->check(CLI::ExistingFile);
	extend->add_option("-r,--reference-dir", extendConfig.reference_dir, "Directory the new reference paths are relative to")
		->check(CLI::ExistingDirectory);
	extend->add_option("--old-reference-dir", extendConfig.old_reference_dir, "Directory the already computed reference paths are relative to, defaults to --reference-dir")
		->check(CLI::ExistingDirectory);
	extend->add_option("-o,--output", extendConfig.output_file, "Output file, or directory for bramble.pd")
		->default_val(".");
	auto extendKmer = addKmerOptions(extend, extendConfig.kmer);
	extend->add_option("-t,--threads", extendConfig.threads, "Number of threads")
		->default_val(32);
	extend->add_flag("-q,--quiet", extendConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Order
	order->add_option("distances", orderConfig.distance_file, "Pairwise distance (.pd) file")
		->required()
		->check(CLI::ExistingFile);
	order->add_option("-o,--output", orderConfig.output_file, "Output file, or directory for bramble.f2t")
		->default_val(".");
	order->add_option("--seed", orderConfig.seed, "Reference placed first")
		->default_val(0);
	order->add_option("--max-passes", orderConfig.max_passes, "Maximum number of swap refinement passes")
		->default_val(16);
	order->add_flag("-q,--quiet", orderConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Build
	build->add_option("input", buildConfig.input_file, "Ordered file2taxid (.f2t) file")
		->required()
		->check(CLI::ExistingFile);
	build->add_option("-r,--reference-dir", buildConfig.reference_dir, "Directory the reference paths are relative to")
		->check(CLI::ExistingDirectory);
	build->add_option("-o,--output", buildConfig.output_file, "Output file, or directory for bramble.db")
		->default_val(".");
	build->add_option("--tmp-dir", buildConfig.tmp_dir, "Directory for intermediate kmer files");
	build->add_option("--shards", buildConfig.shards, "Number of key space shards")
		->default_val(64)
		->check(CLI::Range(1, 65536));
	auto buildKmer = addKmerOptions(build, buildConfig.kmer);
	build->add_option("-t,--threads", buildConfig.threads, "Number of threads for building")
		->default_val(32);
	build->add_flag("-q,--quiet", buildConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Lossy
	lossy->add_option("database", lossyConfig.database_file, "Exact database (.db) file")
		->required()
		->check(CLI::ExistingFile);
	lossy->add_option("-o,--output", lossyConfig.output_file, "Output file, or directory for bramble.lossy.db")
		->default_val(".");
	lossy->add_option("-l,--level", lossyConfig.level, "Lossy level, gaps up to 2^level - 1 references are closed")
		->default_val(1)
		->check(CLI::Range(1u, BrambleLossy::MAX_LOSSY_LEVEL));
	lossy->add_option("-t,--threads", lossyConfig.threads, "Number of threads")
		->default_val(32);
	lossy->add_flag("-q,--quiet", lossyConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Classify
	classify->add_option("database", classifyConfig.dbFile, "Database file for classifying")
		->required()
		->check(CLI::ExistingFile);
	classify->add_option("reads", classifyConfig.readFiles, "FASTA/FASTQ read files")
		->required()
		->check(CLI::ExistingFile);
	classify->add_option("-o,--output", classifyConfig.outputFile, "Output file, or directory for bramble.tsv")
		->default_val(".");
	classify->add_option("-e,--exponent", classifyConfig.exponent, "Reads are classified when the tail probability is below 10^-exponent")
		->default_val(BrambleClassify::DEFAULT_EXPONENT)
		->check(CLI::NonNegativeNumber);
	classify->add_option("-n,--trials", classifyConfig.trials, "Fixed number of trials of the binomial")
		->default_val(BrambleClassify::DEFAULT_TRIALS)
		->check(CLI::Range(1u, 100000u));
	classify->add_option("-b,--batch-size", classifyConfig.batchSize, "Batch size for classifying")
		->default_val(4096)
		->check(CLI::PositiveNumber);
	auto classifyKmer = addKmerOptions(classify, classifyConfig.kmer);
	classify->add_option("-t,--threads", classifyConfig.threads, "Number of threads for classifying")
		->default_val(32);
	classify->add_flag("-q,--quiet", classifyConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Retaxid
	retaxid->add_option("database", retaxidConfig.database_file, "Database (.db) file")
		->required()
		->check(CLI::ExistingFile);
	retaxid->add_option("file", retaxidConfig.file, "Reference file to give the new taxid, as listed in the database")
		->required();
	retaxid->add_option("taxid", retaxidConfig.taxid, "The replacement taxid")
		->required();
	retaxid->add_option("-o,--output", retaxidConfig.output_file, "Output file, or directory for bramble.fixed.db")
		->default_val(".");
	retaxid->add_flag("-q,--quiet", retaxidConfig.verbose, "Quiet output")->default_val(true)->disable_flag_override();

	// Info
	info->add_option("file", infoFile, "A .pd, .db or .f2t file")
		->required()
		->check(CLI::ExistingFile);

	if (argc == 1) {
		std::cout << app.help() << std::endl;
		return 0;
	}

	CLI11_PARSE(app, argc, argv);

	if (show_version) {
		std::cout << "======================================" << std::endl;
		std::cout << "        Bramble - Metagenomic Tool" << std::endl;
		std::cout << "======================================" << std::endl;
		std::cout << "Version      : " << VERSION_INFO << std::endl;
		std::cout << "Build Date   : " << __DATE__ << " " << __TIME__ << std::endl;
		std::cout << "Compiled with: " << "GCC " << __VERSION__ << std::endl;
		std::cout << "======================================" << std::endl;
		std::cout << "Team         : MalabZ" << std::endl;
		std::cout << "======================================" << std::endl;
		return 0;
	}

	bramble::installInterruptHandler();

	try {
		if (*distance) {
			distanceConfig.kmer_given = anyGiven(distanceKmer);
			BrambleDistance::run(distanceConfig);
		}
		else if (*extend) {
			extendConfig.kmer_given = anyGiven(extendKmer);
			BrambleDistance::runExtend(extendConfig);
		}
		else if (*order) {
			BrambleOrder::run(orderConfig);
		}
		else if (*build) {
			buildConfig.kmer_given = anyGiven(buildKmer);
			BrambleBuild::run(buildConfig);
		}
		else if (*lossy) {
			BrambleLossy::run(lossyConfig);
		}
		else if (*classify) {
			classifyConfig.kmer_given = anyGiven(classifyKmer);
			BrambleClassify::run(classifyConfig);
		}
		else if (*retaxid) {
			BrambleDatabase::runRetaxid(retaxidConfig);
		}
		else if (*info) {
			BrambleDatabase::printInfo(infoFile, std::cout);
		}
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
