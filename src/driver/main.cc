#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "absl/time/time.h"

#include "common/configuration.h"
#include "common/sim_clock.h"
#include "driver/simulation_driver.h"
#include "driver/workload.h"
#include "queue/order_directory.h"
#include "queue/queue_store.h"
#include "queue/stage_config_repository.h"
#include "scheduler/delivery_date_store.h"
#include "scheduler/optimizer_bridge.h"
#include "scheduler/queue_manager.h"
#include "scheduler/scheduling_log.h"

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("wipflow_sim", "Three-stage WIP release simulation (PAP, PIP, PIPO)");

	options.add_options()
		("config", "Configuration file", cxxopts::value<std::string>()->default_value("config/wipflow.yaml"))
		("workload", "Workload file", cxxopts::value<std::string>()->default_value("config/workload.yaml"))
		("until", "Last simulation minute", cxxopts::value<int64_t>()->default_value("480"))
		("step", "Minutes per tick", cxxopts::value<int64_t>()->default_value("1"))
		("log_file", "Scheduling log (JSON lines); overrides the configuration", cxxopts::value<std::string>())
		("h,help", "Print usage")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"));

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Wipflow::Configuration& configuration = Wipflow::Configuration::getInstance();
	const std::string config_path = arguments["config"].as<std::string>();
	if (!configuration.loadFromFile(config_path)) {
		for (const std::string& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Config: " << error;
		}
		LOG(ERROR) << "Failed to load configuration from " << config_path;
		return EXIT_FAILURE;
	}
	const Wipflow::WipflowConfig& config = configuration.config();

	absl::StatusOr<Wipflow::Workload> workload =
		Wipflow::LoadWorkloadFromFile(arguments["workload"].as<std::string>());
	if (!workload.ok()) {
		LOG(ERROR) << workload.status();
		return EXIT_FAILURE;
	}

	Wipflow::SimClock clock(0);
	if (!config.clock.sim_epoch.get().empty()) {
		absl::Time epoch;
		std::string error;
		if (!absl::ParseTime(absl::RFC3339_full, config.clock.sim_epoch.get(), &epoch, &error)) {
			LOG(ERROR) << "Invalid sim_epoch " << config.clock.sim_epoch.get() << ": " << error;
			return EXIT_FAILURE;
		}
		clock.SetEpoch(epoch);
	}

	// *************** Pipeline components **********************
	Wipflow::InMemoryQueueStore store;
	Wipflow::InMemoryStageConfigRepository configs(Wipflow::StageDefaultsFromConfig(config));
	Wipflow::OrderDirectory orders;
	Wipflow::InMemoryDeliveryDateStore delivery_dates;
	Wipflow::OptimizerBridge bridge(&Wipflow::MakeOptimizer,
			absl::Milliseconds(configuration.getOptimizerTimeoutMs()));

	std::string log_path = config.log.scheduling_log_path.get();
	if (arguments.count("log_file")) {
		log_path = arguments["log_file"].as<std::string>();
	}
	std::unique_ptr<Wipflow::ISchedulingLog> scheduling_log;
	if (log_path.empty()) {
		scheduling_log = std::make_unique<Wipflow::InMemorySchedulingLog>();
	} else {
		scheduling_log = std::make_unique<Wipflow::JsonlSchedulingLog>(log_path, config.log.queue_capacity.get());
	}

	Wipflow::QueueManager::Dependencies deps;
	deps.store = &store;
	deps.configs = &configs;
	deps.orders = &orders;
	deps.delivery_dates = &delivery_dates;
	deps.scheduling_log = scheduling_log.get();
	deps.optimizer_bridge = &bridge;
	deps.clock = &clock;
	deps.batch_policy = Wipflow::BatchPolicyFromConfig(config);
	Wipflow::QueueManager manager(deps);

	Wipflow::SimulationDriver driver(&manager, &clock);
	absl::Status loaded = driver.Load(*workload);
	if (!loaded.ok()) {
		LOG(ERROR) << "Failed to load workload: " << loaded;
		return EXIT_FAILURE;
	}

	for (const Wipflow::FactoryEntry& factory : configuration.getFactories()) {
		absl::StatusOr<Wipflow::QueueConfigUpdate> update = Wipflow::FactoryOverrides(factory);
		if (!update.ok()) {
			LOG(ERROR) << update.status();
			return EXIT_FAILURE;
		}
		if (!manager.RegisterFactory(factory.id).ok() || !manager.UpdateConfig(factory.id, *update).ok()) {
			LOG(ERROR) << "Failed to apply configuration of factory " << factory.id;
			return EXIT_FAILURE;
		}
	}

	// *************** Run **********************
	const int64_t until = arguments["until"].as<int64_t>();
	const int64_t step = arguments["step"].as<int64_t>();
	if (step <= 0) {
		LOG(ERROR) << "--step must be positive";
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Starting simulation until minute " << until << " with step " << step;

	int failures = 0;
	driver.RunUntil(until, step, [&failures](const Wipflow::TickReport& report) {
		failures += report.failures;
		size_t released = report.released[0] + report.released[1] + report.released[2];
		if (released == 0 && report.arrivals == 0) return;
		LOG(INFO) << "t=" << report.now
			<< " arrivals=" << report.arrivals
			<< " released PAP/PIP/PIPO=" << report.released[0] << "/" << report.released[1] << "/" << report.released[2]
			<< " pending=" << report.pending[0] << "/" << report.pending[1] << "/" << report.pending[2]
			<< " completed=" << report.completed;
	});

	std::cout << "Simulation finished at minute " << until << ": " << driver.completed() << " of "
		<< workload->orders.size() << " orders completed, " << failures << " failed operations" << std::endl;
	return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
