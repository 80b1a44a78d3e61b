#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "orchestrator/orchestrator.h"

namespace {

void PrintSummary(const Lockstep::Orchestrator& orchestrator) {
	const Lockstep::RunState& state = orchestrator.state();
	absl::btree_map<Lockstep::AgentId, double> totals;
	for (const auto& record : state.history) {
		for (const auto& [agent_id, reward] : record.transition.rewards) {
			totals[agent_id] += reward;
		}
	}

	std::cout << orchestrator.status().ToString() << std::endl;
	for (const auto& [agent_id, total] : totals) {
		std::cout << "  " << agent_id << ": cumulative reward " << total << std::endl;
	}
	for (const auto& [delegate, done] : state.delegate_done) {
		std::cout << "  delegate " << delegate << (done ? " done" : " running") << std::endl;
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	// Parse command line arguments
	cxxopts::Options options("lockstep_run", "Lockstep multi-agent orchestration over composite simulators");

	options.add_options()
		("c,config", "Configuration file (YAML)", cxxopts::value<std::string>())
		("s,steps", "Override run.max_steps", cxxopts::value<int>())
		("seed", "Override run.seed", cxxopts::value<size_t>())
		("w,workers", "Override run.proposal_workers", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		std::cerr << e.what() << std::endl << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (!arguments.count("config")) {
		LOG(ERROR) << "--config is required";
		std::cerr << options.help() << std::endl;
		return EXIT_FAILURE;
	}

	// *************** Load configuration **********************
	Lockstep::Configuration configuration;
	if (!configuration.loadFromFile(arguments["config"].as<std::string>())) {
		std::cout << "Aborted [configuration]: " << configuration.last_error() << std::endl;
		return EXIT_FAILURE;
	}

	Lockstep::LockstepConfig& config = configuration.config();
	if (arguments.count("steps")) {
		config.run.max_steps.set(arguments["steps"].as<int>());
	}
	if (arguments.count("seed")) {
		config.run.seed.set(arguments["seed"].as<size_t>());
	}
	if (arguments.count("workers")) {
		config.run.proposal_workers.set(arguments["workers"].as<int>());
	}
	if (!configuration.validate()) {
		for (const std::string& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	// *************** Build and run **********************
	auto sink = std::make_shared<Lockstep::LoggingTelemetrySink>();
	Lockstep::Orchestrator orchestrator(config, nullptr, sink);

	orchestrator.Run(configuration.getMaxSteps());
	PrintSummary(orchestrator);

	LOG(INFO) << "Lockstep terminating";
	return orchestrator.status().phase == Lockstep::RunPhase::kCompleted ? EXIT_SUCCESS : EXIT_FAILURE;
}
