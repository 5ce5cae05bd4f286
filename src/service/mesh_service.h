#ifndef MESHWORK_SERVICE_MESH_SERVICE_H_
#define MESHWORK_SERVICE_MESH_SERVICE_H_

#include <grpcpp/grpcpp.h>
#include <meshwork.grpc.pb.h>

#include "common/mesh_error.h"
#include "reactor/reactor.h"

namespace Meshwork {

using grpc::ServerContext;
using grpc::Status;
using meshwork_service::MeshService;
using meshwork_service::ErrorCode;
using meshwork_service::SubmitMutationRequest;
using meshwork_service::SubmitMutationResponse;
using meshwork_service::DeleteKeyRequest;
using meshwork_service::DeleteKeyResponse;
using meshwork_service::GetRequest;
using meshwork_service::GetResponse;
using meshwork_service::SetUnitEnabledRequest;
using meshwork_service::SetUnitEnabledResponse;
using meshwork_service::ReportPressureRequest;
using meshwork_service::ReportPressureResponse;
using meshwork_service::HealthRequest;
using meshwork_service::HealthResponse;

ErrorCode ToErrorCode(MeshError err);

/**
 * gRPC front of a Reactor. Engine errors travel in the response's error
 * field; the gRPC status is only non-OK for malformed requests.
 */
class MeshServiceImpl final : public MeshService::Service {
	public:
		explicit MeshServiceImpl(Reactor& reactor) : reactor_(reactor) {}

		Status SubmitMutation(ServerContext* context, const SubmitMutationRequest* request,
				SubmitMutationResponse* reply) override;

		Status DeleteKey(ServerContext* context, const DeleteKeyRequest* request,
				DeleteKeyResponse* reply) override;

		Status Get(ServerContext* context, const GetRequest* request,
				GetResponse* reply) override;

		Status SetUnitEnabled(ServerContext* context, const SetUnitEnabledRequest* request,
				SetUnitEnabledResponse* reply) override;

		Status ReportPressure(ServerContext* context, const ReportPressureRequest* request,
				ReportPressureResponse* reply) override;

		Status GetHealth(ServerContext* context, const HealthRequest* request,
				HealthResponse* reply) override;

	private:
		Reactor& reactor_;
};

} // namespace Meshwork

#endif // MESHWORK_SERVICE_MESH_SERVICE_H_
