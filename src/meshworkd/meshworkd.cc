#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

#include "acl/acl_registry.h"
#include "common/configuration.h"
#include "reactor/reactor.h"
#include "service/mesh_service.h"
#include "trace/trace_sink.h"

namespace {

std::atomic<bool> g_shutdown{false};

void HandleSignal(int) {
	g_shutdown.store(true);
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	// getopt reorders argv, cxxopts may consume it: keep a copy for the
	// configuration overrides.
	std::vector<std::string> arg_storage(argv, argv + argc);
	std::vector<char*> arg_copy;
	for (auto& arg : arg_storage) {
		arg_copy.push_back(&arg[0]);
	}
	arg_copy.push_back(nullptr);

	cxxopts::Options options("meshworkd", "Mesh coordination engine daemon");

	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("acl", "ACL manifest (overrides acl.manifest_path)", cxxopts::value<std::string>())
		("listen", "gRPC listen address", cxxopts::value<std::string>())
		("trace_sink", "File receiving one JSON trace record per line", cxxopts::value<std::string>())
		("cycle_interval_ms", "Reactor cycle interval", cxxopts::value<int>())
		("worker_threads", "Unit execution threads", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Meshwork::Configuration& config = Meshwork::Configuration::getInstance();
	if (arguments.count("config")) {
		if (!config.loadFromFile(arguments["config"].as<std::string>())) {
			for (const auto& error : config.getValidationErrors()) {
				LOG(ERROR) << "config: " << error;
			}
			return EXIT_FAILURE;
		}
	}
	config.overrideFromCommandLine(static_cast<int>(arg_storage.size()), arg_copy.data());
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "config: " << error;
		}
		return EXIT_FAILURE;
	}
	const Meshwork::MeshworkConfig& cfg = config.config();

	// *************** Reactor **********************
	Meshwork::Reactor reactor(Meshwork::ReactorOptions::FromConfig(cfg));

	std::string manifest = arguments.count("acl") ? arguments["acl"].as<std::string>()
		: cfg.acl.manifest_path.get();
	if (!manifest.empty()) {
		std::vector<std::string> errors;
		if (!Meshwork::LoadAclManifestFile(manifest, reactor.acl(), &errors)) {
			for (const auto& error : errors) {
				LOG(ERROR) << "acl manifest " << manifest << ": " << error;
			}
			return EXIT_FAILURE;
		}
	} else {
		LOG(WARNING) << "No ACL manifest, default policy '" << cfg.acl.default_policy.get()
			<< "' governs every key";
	}

	std::string sink_path = cfg.trace.sink_path.get();
	if (!sink_path.empty()) {
		reactor.SetTraceSink(std::make_shared<Meshwork::FileTraceSink>(sink_path));
		LOG(INFO) << "Exporting trace records to " << sink_path;
	}

	reactor.Start();

	// *************** gRPC surface **********************
	Meshwork::MeshServiceImpl service(reactor);
	std::string listen_address = cfg.service.listen_address.get();
	grpc::ServerBuilder builder;
	builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);
	std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
	if (!server) {
		LOG(ERROR) << "Failed to listen on " << listen_address;
		reactor.Stop();
		return EXIT_FAILURE;
	}
	LOG(INFO) << "meshworkd listening on " << listen_address << ". Ready to go";

	std::signal(SIGINT, HandleSignal);
	std::signal(SIGTERM, HandleSignal);

	// *************** Wait until asked to stop **********************
	while (!g_shutdown.load() && !reactor.Halted()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
	}

	LOG(INFO) << "meshworkd terminating" << (reactor.Halted() ? " (reactor halted)" : "");
	server->Shutdown();
	reactor.Stop();
	return reactor.Halted() ? EXIT_FAILURE : EXIT_SUCCESS;
}
