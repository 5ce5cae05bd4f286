#include <gtest/gtest.h>
#include "../../src/service/mesh_service.h"

using namespace Meshwork;

class MeshServiceTest : public ::testing::Test {
protected:
    MeshServiceTest() : reactor_(Options()), service_(reactor_) {}

    static ReactorOptions Options() {
        ReactorOptions options;
        options.worker_threads = 2;
        options.throttle.max_mutation_rate = 0;
        options.acl_default_allow = true;
        return options;
    }

    Reactor reactor_;
    MeshServiceImpl service_;
};

TEST_F(MeshServiceTest, SubmitThenGet) {
    SubmitMutationRequest submit;
    submit.set_key("content:home");
    submit.set_value("<h1>hi</h1>");
    submit.set_expected_version(0);
    SubmitMutationResponse submitted;
    ASSERT_TRUE(service_.SubmitMutation(nullptr, &submit, &submitted).ok());
    EXPECT_EQ(submitted.error(), meshwork_service::OK);
    EXPECT_EQ(submitted.version(), 1u);

    GetRequest get;
    get.set_key("content:home");
    GetResponse got;
    ASSERT_TRUE(service_.Get(nullptr, &get, &got).ok());
    EXPECT_TRUE(got.found());
    EXPECT_EQ(got.value(), "<h1>hi</h1>");
    EXPECT_EQ(got.version(), 1u);

    get.set_key("content:missing");
    ASSERT_TRUE(service_.Get(nullptr, &get, &got).ok());
    EXPECT_FALSE(got.found());
}

TEST_F(MeshServiceTest, ConflictTravelsInResponse) {
    SubmitMutationRequest submit;
    submit.set_key("k");
    submit.set_value("1");
    SubmitMutationResponse reply;
    ASSERT_TRUE(service_.SubmitMutation(nullptr, &submit, &reply).ok());

    SubmitMutationResponse stale;
    ASSERT_TRUE(service_.SubmitMutation(nullptr, &submit, &stale).ok());
    EXPECT_EQ(stale.error(), meshwork_service::VERSION_CONFLICT);
    EXPECT_EQ(stale.message(), "VersionConflict");
}

TEST_F(MeshServiceTest, DeleteLeavesKeyAbsent) {
    SubmitMutationRequest submit;
    submit.set_key("content:draft");
    submit.set_value("wip");
    SubmitMutationResponse submitted;
    ASSERT_TRUE(service_.SubmitMutation(nullptr, &submit, &submitted).ok());
    ASSERT_EQ(submitted.version(), 1u);

    DeleteKeyRequest remove;
    remove.set_key("content:draft");
    remove.set_expected_version(1);
    DeleteKeyResponse removed;
    ASSERT_TRUE(service_.DeleteKey(nullptr, &remove, &removed).ok());
    EXPECT_EQ(removed.error(), meshwork_service::OK);
    EXPECT_EQ(removed.version(), 2u);

    GetRequest get;
    get.set_key("content:draft");
    GetResponse got;
    ASSERT_TRUE(service_.Get(nullptr, &get, &got).ok());
    EXPECT_FALSE(got.found());

    DeleteKeyResponse again;
    ASSERT_TRUE(service_.DeleteKey(nullptr, &remove, &again).ok());
    EXPECT_EQ(again.error(), meshwork_service::VERSION_CONFLICT);

    remove.set_expected_version(0);
    DeleteKeyResponse malformed;
    EXPECT_EQ(service_.DeleteKey(nullptr, &remove, &malformed).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MeshServiceTest, EmptyKeyIsMalformed) {
    SubmitMutationRequest submit;
    SubmitMutationResponse reply;
    Status status = service_.SubmitMutation(nullptr, &submit, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MeshServiceTest, SetUnitEnabledByName) {
    UnitDescriptor descriptor;
    descriptor.name = "indexer";
    descriptor.interests = {"content:*"};
    UnitId id = 0;
    ASSERT_EQ(reactor_.RegisterUnit(descriptor,
                                    MakeUnit([](MeshView&) { return false; }, [](MeshHandle&) {}), &id),
              MeshError::kOk);

    SetUnitEnabledRequest request;
    request.set_unit_name("indexer");
    request.set_enabled(false);
    SetUnitEnabledResponse reply;
    ASSERT_TRUE(service_.SetUnitEnabled(nullptr, &request, &reply).ok());
    EXPECT_EQ(reply.error(), meshwork_service::OK);
    EXPECT_EQ(reply.unit_id(), id);
    EXPECT_FALSE(reactor_.registry().IsEnabled(id));

    request.set_unit_name("");
    request.set_unit_id(id);
    request.set_enabled(true);
    ASSERT_TRUE(service_.SetUnitEnabled(nullptr, &request, &reply).ok());
    EXPECT_TRUE(reactor_.registry().IsEnabled(id));

    request.set_unit_id(0);
    request.set_unit_name("ghost");
    ASSERT_TRUE(service_.SetUnitEnabled(nullptr, &request, &reply).ok());
    EXPECT_EQ(reply.error(), meshwork_service::NOT_FOUND);

    request.set_unit_name("");
    EXPECT_EQ(service_.SetUnitEnabled(nullptr, &request, &reply).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MeshServiceTest, PressureAndHealth) {
    ReportPressureRequest pressure;
    pressure.set_pressure(2.0);
    ReportPressureResponse reply;
    ASSERT_TRUE(service_.ReportPressure(nullptr, &pressure, &reply).ok());
    EXPECT_EQ(reply.error(), meshwork_service::INVALID_ARGUMENT);

    pressure.set_pressure(0.97);
    ASSERT_TRUE(service_.ReportPressure(nullptr, &pressure, &reply).ok());
    EXPECT_EQ(reply.error(), meshwork_service::OK);
    EXPECT_DOUBLE_EQ(reply.effective_pressure(), 0.97);

    UnitDescriptor descriptor;
    descriptor.name = "watcher";
    descriptor.interests = {"x"};
    ASSERT_EQ(reactor_.RegisterUnit(descriptor,
                                    MakeUnit([](MeshView&) { return false; }, [](MeshHandle&) {}),
                                    nullptr),
              MeshError::kOk);

    HealthRequest request;
    HealthResponse health;
    ASSERT_TRUE(service_.GetHealth(nullptr, &request, &health).ok());
    EXPECT_TRUE(health.degraded());
    EXPECT_TRUE(health.throttled());
    EXPECT_FALSE(health.halted());
    ASSERT_EQ(health.units_size(), 1);
    EXPECT_EQ(health.units(0).name(), "watcher");
    EXPECT_TRUE(health.units(0).enabled());
}

TEST(ErrorCodeTest, MapsEveryEngineError) {
    EXPECT_EQ(ToErrorCode(MeshError::kOk), meshwork_service::OK);
    EXPECT_EQ(ToErrorCode(MeshError::kAccessDenied), meshwork_service::ACCESS_DENIED);
    EXPECT_EQ(ToErrorCode(MeshError::kStoreCorruption), meshwork_service::STORE_CORRUPTION);
    EXPECT_EQ(ToErrorCode(MeshError::kUnitFault), meshwork_service::UNIT_FAULT);
}
