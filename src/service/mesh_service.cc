#include "mesh_service.h"

#include <glog/logging.h>

namespace Meshwork {

ErrorCode ToErrorCode(MeshError err) {
	switch (err) {
		case MeshError::kOk: return meshwork_service::OK;
		case MeshError::kVersionConflict: return meshwork_service::VERSION_CONFLICT;
		case MeshError::kAccessDenied: return meshwork_service::ACCESS_DENIED;
		case MeshError::kTimeout: return meshwork_service::TIMEOUT;
		case MeshError::kTraceSinkUnavailable: return meshwork_service::TRACE_SINK_UNAVAILABLE;
		case MeshError::kPressureExceeded: return meshwork_service::PRESSURE_EXCEEDED;
		case MeshError::kNotFound: return meshwork_service::NOT_FOUND;
		case MeshError::kInvalidArgument: return meshwork_service::INVALID_ARGUMENT;
		case MeshError::kStoreCorruption: return meshwork_service::STORE_CORRUPTION;
		case MeshError::kCancelled: return meshwork_service::CANCELLED;
		case MeshError::kUnitFault: return meshwork_service::UNIT_FAULT;
	}
	return meshwork_service::INVALID_ARGUMENT;
}

Status MeshServiceImpl::SubmitMutation(ServerContext* context, const SubmitMutationRequest* request,
		SubmitMutationResponse* reply) {
	if (request->key().empty()) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, "key must not be empty");
	}
	uint64_t version = 0;
	MeshError err = reactor_.SubmitMutation(request->key(), request->value(),
			request->expected_version(), &version);
	reply->set_error(ToErrorCode(err));
	if (err == MeshError::kOk) {
		reply->set_version(version);
	} else {
		reply->set_message(MeshErrorName(err));
		VLOG(1) << "SubmitMutation " << request->key() << " rejected: " << MeshErrorName(err);
	}
	return Status::OK;
}

Status MeshServiceImpl::DeleteKey(ServerContext* context, const DeleteKeyRequest* request,
		DeleteKeyResponse* reply) {
	if (request->key().empty() || request->expected_version() == 0) {
		return Status(grpc::StatusCode::INVALID_ARGUMENT, "key and expected_version required");
	}
	uint64_t version = 0;
	MeshError err = reactor_.DeleteKey(request->key(), request->expected_version(), &version);
	reply->set_error(ToErrorCode(err));
	if (err == MeshError::kOk) {
		reply->set_version(version);
	} else {
		reply->set_message(MeshErrorName(err));
		VLOG(1) << "DeleteKey " << request->key() << " rejected: " << MeshErrorName(err);
	}
	return Status::OK;
}

Status MeshServiceImpl::Get(ServerContext* context, const GetRequest* request,
		GetResponse* reply) {
	auto value = reactor_.Get(request->key());
	reply->set_found(value.has_value());
	if (value) {
		reply->set_value(value->value);
		reply->set_version(value->version);
	}
	return Status::OK;
}

Status MeshServiceImpl::SetUnitEnabled(ServerContext* context, const SetUnitEnabledRequest* request,
		SetUnitEnabledResponse* reply) {
	UnitId id = request->unit_id();
	if (id == 0) {
		if (request->unit_name().empty()) {
			return Status(grpc::StatusCode::INVALID_ARGUMENT, "unit_id or unit_name required");
		}
		auto found = reactor_.registry().FindByName(request->unit_name());
		if (!found) {
			reply->set_error(meshwork_service::NOT_FOUND);
			return Status::OK;
		}
		id = *found;
	}
	MeshError err = reactor_.SetEnabled(id, request->enabled());
	reply->set_error(ToErrorCode(err));
	reply->set_unit_id(id);
	LOG(INFO) << "Operator " << (request->enabled() ? "enabled" : "disabled") << " unit #" << id
		<< ": " << MeshErrorName(err);
	return Status::OK;
}

Status MeshServiceImpl::ReportPressure(ServerContext* context, const ReportPressureRequest* request,
		ReportPressureResponse* reply) {
	MeshError err = reactor_.ReportPressure(request->pressure());
	reply->set_error(ToErrorCode(err));
	reply->set_effective_pressure(reactor_.throttle().Pressure());
	return Status::OK;
}

Status MeshServiceImpl::GetHealth(ServerContext* context, const HealthRequest* request,
		HealthResponse* reply) {
	HealthReport health = reactor_.GetHealth();
	reply->set_pressure(health.pressure);
	reply->set_external_pressure(health.external_pressure);
	reply->set_mutation_rate(health.mutation_rate);
	reply->set_throttled(health.throttled);
	reply->set_degraded(health.degraded);
	reply->set_halted(health.halted);
	reply->set_cycles(health.cycles);
	reply->set_committed_mutations(health.committed_mutations);
	reply->set_conflicts(health.conflicts);
	reply->set_store_keys(health.store_keys);
	reply->set_running_units(health.running_units);
	reply->set_busy_workers(health.busy_workers);
	reply->set_worker_queue_depth(health.worker_queue_depth);
	for (const auto& depth : health.queue_depths) {
		(*reply->mutable_queue_depths())[depth.first] = depth.second;
	}
	reply->set_deferred(health.deferred);
	reply->set_acl_denials(health.acl_denials);
	reply->set_trace_recorded(health.trace_recorded);
	reply->set_trace_dropped(health.trace_dropped);
	reply->set_trace_exported(health.trace_exported);
	reply->set_trace_sink_failures(health.trace_sink_failures);
	reply->set_trace_sink_available(health.trace_sink_available);
	reply->set_subscriptions(health.subscriptions);
	for (const auto& unit : health.units) {
		auto* out = reply->add_units();
		out->set_unit_id(unit.id);
		out->set_name(unit.name);
		out->set_enabled(unit.enabled);
		out->set_evaluations(unit.stats.evaluations);
		out->set_executions(unit.stats.executions);
		out->set_successes(unit.stats.successes);
		out->set_failures(unit.stats.failures);
		out->set_timeouts(unit.stats.timeouts);
		out->set_conflicts(unit.stats.conflicts);
		out->set_suppressions(unit.stats.suppressions);
		out->set_deferrals(unit.stats.deferrals);
		out->set_quarantines(unit.stats.quarantines);
		out->set_access_denials(unit.stats.access_denials);
		out->set_avg_exec_us(unit.stats.AverageExecMicros());
		out->set_timeout_streak(unit.stats.timeout_streak);
	}
	return Status::OK;
}

} // namespace Meshwork
