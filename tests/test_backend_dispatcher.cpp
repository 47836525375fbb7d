// =============================================================================
// Unit tests for BackendDispatcher and the printer backends
// =============================================================================
#include <gtest/gtest.h>
#include "backend_dispatcher.hpp"
#include "printer_backend.hpp"
#include "test_support.hpp"

using namespace printerhub;
using namespace printerhub::fakes;

namespace {

DeviceDetails withModel(const std::string& model, bool force_legacy = false) {
    DeviceDetails d;
    d.ip_address = "10.0.0.5";
    d.model = model;
    d.force_legacy_api = force_legacy;
    return d;
}

// Captures a completion result for synchronous fakes
template<typename T>
struct Capture {
    std::optional<Result<T>> result;
    Completion<T> fn() {
        return [this](Result<T> r) { result = std::move(r); };
    }
};

class BackendDispatcherTest : public ::testing::Test {
protected:
    std::unique_ptr<BackendInstance> create(const DeviceDetails& details) {
        auto r = dispatcher.createBackend(details);
        EXPECT_TRUE(r.is_ok()) << (r.is_err() ? r.error().describe() : "");
        return r.is_ok() ? std::move(r).value() : nullptr;
    }

    FakeClientFactory factory;
    config::QueueConfig queue;
    BackendDispatcher dispatcher{factory, queue};
};

} // namespace

// ---------------------------------------------------------------------------
// Model detection
// ---------------------------------------------------------------------------
TEST(ModelDetectionTest, ReportedModelNames) {
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("Adventurer 5M Pro")), ModelType::Adventurer5MPro);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("FlashForge ADVENTURER 5M PRO")), ModelType::Adventurer5MPro);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("Adventurer 5M")), ModelType::Adventurer5M);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("AD5X")), ModelType::AD5X);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("Flashforge AD5X")), ModelType::AD5X);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("Adventurer 3")), ModelType::GenericLegacy);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("")), ModelType::GenericLegacy);
}

TEST(ModelDetectionTest, ForceLegacyWins) {
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("Adventurer 5M Pro", true)), ModelType::GenericLegacy);
    EXPECT_EQ(BackendDispatcher::detectModelType(withModel("AD5X", true)), ModelType::GenericLegacy);
}

TEST(ModelDetectionTest, DescriptorTable) {
    const auto& legacy = BackendDispatcher::descriptorFor(ModelType::GenericLegacy);
    EXPECT_STREQ(legacy.model_name, "generic-legacy");
    EXPECT_EQ(legacy.family, BackendFamily::Legacy);
    EXPECT_FALSE(legacy.features.led_control);
    EXPECT_FALSE(legacy.features.material_station);
    EXPECT_TRUE(legacy.features.gcode_commands);

    const auto& pro = BackendDispatcher::descriptorFor(ModelType::Adventurer5MPro);
    EXPECT_STREQ(pro.model_name, "adventurer-5m-pro");
    EXPECT_EQ(pro.family, BackendFamily::DualProtocol);
    EXPECT_TRUE(pro.features.camera);
    EXPECT_TRUE(pro.features.filtration);

    const auto& plain = BackendDispatcher::descriptorFor(ModelType::Adventurer5M);
    EXPECT_FALSE(plain.features.camera);
    EXPECT_TRUE(plain.features.led_control);

    const auto& ad5x = BackendDispatcher::descriptorFor(ModelType::AD5X);
    EXPECT_EQ(ad5x.family, BackendFamily::MultiMaterial);
    EXPECT_TRUE(ad5x.features.material_station);

    EXPECT_EQ(BackendDispatcher::descriptors().size(), 4u);
}

// ---------------------------------------------------------------------------
// Backend creation
// ---------------------------------------------------------------------------
TEST_F(BackendDispatcherTest, LegacyOpensOnlyLegacyChannel) {
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);

    EXPECT_EQ(backend->family(), BackendFamily::Legacy);
    EXPECT_EQ(factory.legacy_opens, 1);
    EXPECT_EQ(factory.modern_opens, 0);
    EXPECT_EQ(backend->capabilities().max_concurrent_requests, 1);
}

TEST_F(BackendDispatcherTest, DualProtocolOpensBothChannels) {
    auto backend = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(backend);

    EXPECT_EQ(backend->family(), BackendFamily::DualProtocol);
    EXPECT_EQ(factory.legacy_opens, 1);
    EXPECT_EQ(factory.modern_opens, 1);
    EXPECT_EQ(backend->capabilities().max_concurrent_requests, queue.modern_concurrency);
    EXPECT_EQ(dispatcher.concurrencyLimit(BackendFamily::MultiMaterial), queue.modern_concurrency);
}

TEST_F(BackendDispatcherTest, ModernFailureClosesLegacyChannel) {
    factory.modern_refused.insert("10.0.0.3");

    auto r = dispatcher.createBackend(modernDevice("10.0.0.3", "SN3"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
    EXPECT_EQ(r.error().code, 401);
    EXPECT_TRUE(factory.legacy("10.0.0.3")->closed);
}

TEST_F(BackendDispatcherTest, UnreachableDevice) {
    factory.unreachable.insert("10.0.0.4");
    auto r = dispatcher.createBackend(legacyDevice("10.0.0.4"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
}

// ---------------------------------------------------------------------------
// Capability gating
// ---------------------------------------------------------------------------
TEST_F(BackendDispatcherTest, LegacyRejectsLedAndMaterialWithoutIo) {
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);

    Capture<void> led;
    backend->setLed(true, led.fn());
    ASSERT_TRUE(led.result.has_value());
    EXPECT_EQ(led.result->error().kind, ErrorKind::UnsupportedOperation);

    Capture<MaterialStationStatus> slots;
    backend->queryMaterialSlots(slots.fn());
    ASSERT_TRUE(slots.result.has_value());
    EXPECT_EQ(slots.result->error().kind, ErrorKind::UnsupportedOperation);

    EXPECT_TRUE(factory.legacy("10.0.0.1")->log.empty());
    EXPECT_FALSE(backend->supports(Operation::SetLed));
    EXPECT_TRUE(backend->supports(Operation::GetThumbnail));
}

TEST_F(BackendDispatcherTest, MaterialMappingsNeedStation) {
    auto backend = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(backend);

    JobStartParams params;
    params.file_name = "multi.3mf";
    params.material_mappings = {{0, 1}};
    Capture<void> started;
    backend->startJob(params, started.fn());

    ASSERT_TRUE(started.result.has_value());
    EXPECT_EQ(started.result->error().kind, ErrorKind::UnsupportedOperation);
    EXPECT_EQ(factory.modern("10.0.0.2")->count("job.start"), 0);
}

TEST_F(BackendDispatcherTest, InvalidArguments) {
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);

    Capture<std::string> cmd;
    backend->sendCommand("", cmd.fn());
    EXPECT_EQ(cmd.result->error().kind, ErrorKind::InvalidArgument);

    Capture<void> job;
    backend->startJob(JobStartParams{}, job.fn());
    EXPECT_EQ(job.result->error().kind, ErrorKind::InvalidArgument);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------
TEST_F(BackendDispatcherTest, DualProtocolRoutesGcodeOverLegacy) {
    auto backend = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(backend);

    Capture<std::string> cmd;
    backend->sendCommand("M115", cmd.fn());
    ASSERT_TRUE(cmd.result.has_value());
    EXPECT_TRUE(cmd.result->is_ok());
    EXPECT_EQ(factory.legacy("10.0.0.2")->count("gcode"), 1);
    EXPECT_EQ(factory.modern("10.0.0.2")->count("gcode"), 0);

    Capture<void> led;
    backend->setLed(false, led.fn());
    EXPECT_TRUE(led.result->is_ok());
    EXPECT_EQ(factory.modern("10.0.0.2")->lastParams("control.light")->at("status").get<std::string>(), "close");
}

TEST_F(BackendDispatcherTest, JobControlVerbs) {
    auto backend = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(backend);
    auto modern = factory.modern("10.0.0.2");

    Capture<void> r1, r2, r3;
    backend->pauseJob(r1.fn());
    EXPECT_EQ(modern->lastParams("job.control")->at("action").get<std::string>(), "pause");
    backend->resumeJob(r2.fn());
    EXPECT_EQ(modern->lastParams("job.control")->at("action").get<std::string>(), "continue");
    backend->cancelJob(r3.fn());
    EXPECT_EQ(modern->lastParams("job.control")->at("action").get<std::string>(), "cancel");
    EXPECT_TRUE(r3.result->is_ok());
}

TEST_F(BackendDispatcherTest, ModernRejectionIsExecutionFailed) {
    factory.modern_responder = [](const std::string&, const json&) -> std::optional<Result<json>> {
        return Result<json>(json{{"code", 3}, {"message", "file not found"}});
    };
    auto backend = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(backend);

    JobStartParams params;
    params.file_name = "missing.gcode";
    Capture<void> started;
    backend->startJob(params, started.fn());

    ASSERT_TRUE(started.result->is_err());
    EXPECT_EQ(started.result->error().kind, ErrorKind::ExecutionFailed);
    EXPECT_EQ(started.result->error().code, 3);
    EXPECT_EQ(started.result->error().message, "file not found");
}

TEST_F(BackendDispatcherTest, MultiMaterialStartAndSlots) {
    factory.stations.insert("10.0.0.6");
    auto backend = create(modernDevice("10.0.0.6", "SN6", "AD5X"));
    ASSERT_TRUE(backend);
    EXPECT_EQ(backend->family(), BackendFamily::MultiMaterial);

    JobStartParams params;
    params.file_name = "dragon.3mf";
    params.material_mappings = {{0, 1}, {1, 2}};
    Capture<void> started;
    backend->startJob(params, started.fn());
    ASSERT_TRUE(started.result->is_ok());

    const json* body = factory.modern("10.0.0.6")->lastParams("job.start");
    ASSERT_NE(body, nullptr);
    EXPECT_TRUE(body->at("useMatlStation").get<bool>());
    ASSERT_EQ(body->at("materialMappings").size(), 2u);
    EXPECT_EQ(body->at("materialMappings")[1].at("slotId").get<int>(), 2);

    Capture<MaterialStationStatus> slots;
    backend->queryMaterialSlots(slots.fn());
    ASSERT_TRUE(slots.result->is_ok());
    const auto& station = slots.result->value();
    EXPECT_EQ(station.slots.size(), 4u);
    EXPECT_EQ(station.active_slot, 2);
    EXPECT_TRUE(station.slots[1].is_active);
    EXPECT_EQ(station.slots[1].material_type, "PETG");
    EXPECT_TRUE(station.slots[2].is_empty);
}

TEST_F(BackendDispatcherTest, EmptyThumbnailIsFailure) {
    factory.legacy_responder = [](const std::string&, const json&) -> std::optional<Result<json>> {
        return Result<json>(json{{"data", ""}});
    };
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);

    Capture<std::string> thumb;
    backend->getThumbnail("cube.gcode", thumb.fn());
    ASSERT_TRUE(thumb.result->is_err());
    EXPECT_EQ(thumb.result->error().kind, ErrorKind::ExecutionFailed);
}

TEST_F(BackendDispatcherTest, GcodeReplyShapes) {
    json next_reply;
    factory.legacy_responder = [&](const std::string&, const json&) -> std::optional<Result<json>> {
        return Result<json>(next_reply);
    };
    auto legacy = create(legacyDevice("10.0.0.1"));
    auto dual = create(modernDevice("10.0.0.2", "SN2"));
    ASSERT_TRUE(legacy);
    ASSERT_TRUE(dual);

    for (BackendInstance* backend : {legacy.get(), dual.get()}) {
        next_reply = json("ok T:25 /0");
        Capture<std::string> echo;
        backend->sendCommand("M105", echo.fn());
        ASSERT_TRUE(echo.result.has_value());
        ASSERT_TRUE(echo.result->is_ok());
        EXPECT_EQ(echo.result->value(), "ok T:25 /0");

        next_reply = json::object();
        Capture<std::string> bare;
        backend->sendCommand("M105", bare.fn());
        ASSERT_TRUE(bare.result.has_value());
        EXPECT_EQ(bare.result->value(), "ok");

        next_reply = json::array({1, 2});
        Capture<std::string> odd;
        backend->sendCommand("M105", odd.fn());
        ASSERT_TRUE(odd.result.has_value());
        EXPECT_EQ(odd.result->error().kind, ErrorKind::ExecutionFailed);

        next_reply = json{{"response", 42}};
        Capture<std::string> numeric;
        backend->sendCommand("M105", numeric.fn());
        ASSERT_TRUE(numeric.result.has_value());
        EXPECT_EQ(numeric.result->error().kind, ErrorKind::ExecutionFailed);
    }
}

TEST_F(BackendDispatcherTest, ClosedBackendFailsWithConnection) {
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);
    backend->close();
    backend->close();
    EXPECT_TRUE(factory.legacy("10.0.0.1")->closed);

    Capture<PrinterStatus> status;
    backend->getStatus(status.fn());
    ASSERT_TRUE(status.result->is_err());
    EXPECT_EQ(status.result->error().kind, ErrorKind::Connection);
}

TEST_F(BackendDispatcherTest, CloseFailsHeldCalls) {
    factory.legacy_responder = holdingResponder();
    auto backend = create(legacyDevice("10.0.0.1"));
    ASSERT_TRUE(backend);

    Capture<PrinterStatus> status;
    backend->getStatus(status.fn());
    EXPECT_FALSE(status.result.has_value());

    backend->close();
    ASSERT_TRUE(status.result.has_value());
    EXPECT_EQ(status.result->error().kind, ErrorKind::Connection);
}

TEST_F(BackendDispatcherTest, CapabilitiesJson) {
    auto backend = create(modernDevice("10.0.0.2", "SN2", "Adventurer 5M Pro"));
    ASSERT_TRUE(backend);

    json j = backend->capabilities();
    EXPECT_EQ(j["modelType"].get<std::string>(), "adventurer-5m-pro");
    EXPECT_EQ(j["family"].get<std::string>(), "dual-protocol");
    EXPECT_EQ(j["maxConcurrentRequests"].get<int>(), 4);
    EXPECT_TRUE(j["features"]["camera"].get<bool>());
    EXPECT_FALSE(j["features"]["materialStation"].get<bool>());
}

// ---------------------------------------------------------------------------
// Response normalization
// ---------------------------------------------------------------------------
TEST(StatusParsingTest, LegacyStatus) {
    auto r = parseLegacyStatus(legacyStatusReply("BUILDING_FROM_SD", "cube.gcode"));
    ASSERT_TRUE(r.is_ok());
    const PrinterStatus& s = r.value();
    EXPECT_EQ(s.state, MachineState::Printing);
    EXPECT_DOUBLE_EQ(s.bed.current, 25.0);
    ASSERT_TRUE(s.job.has_value());
    EXPECT_EQ(s.job->file_name, "cube.gcode");
    EXPECT_DOUBLE_EQ(s.job->percentage, 40.0);
    EXPECT_EQ(s.job->total_layers, 200);
}

TEST(StatusParsingTest, LegacyIdleHasNoJob) {
    auto r = parseLegacyStatus(legacyStatusReply("READY"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().state, MachineState::Ready);
    EXPECT_FALSE(r.value().job.has_value());
}

TEST(StatusParsingTest, ModernProgressIsFraction) {
    auto r = parseModernStatus(modernInfoReply("printing", true));
    ASSERT_TRUE(r.is_ok());
    const PrinterStatus& s = r.value();
    EXPECT_EQ(s.state, MachineState::Printing);
    ASSERT_TRUE(s.job.has_value());
    EXPECT_DOUBLE_EQ(s.job->percentage, 25.0);
    EXPECT_EQ(s.job->elapsed_seconds, 600);
    EXPECT_DOUBLE_EQ(s.extruder.target, 210.0);
    ASSERT_TRUE(s.material_station.has_value());
    EXPECT_EQ(s.material_station->slots.size(), 4u);
}

TEST(StatusParsingTest, ModernRejectionAndMalformed) {
    auto rejected = parseModernStatus(json{{"code", 2}, {"message", "busy"}});
    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error().kind, ErrorKind::ExecutionFailed);

    auto malformed = parseModernStatus(json{{"code", 0}, {"PrintBed", {{"current", "hot"}}}});
    ASSERT_TRUE(malformed.is_err());
    EXPECT_EQ(malformed.error().kind, ErrorKind::ExecutionFailed);
}

TEST(StatusParsingTest, MachineStateWords) {
    EXPECT_EQ(parseMachineState("BUILDING_FROM_SD"), MachineState::Printing);
    EXPECT_EQ(parseMachineState("printing"), MachineState::Printing);
    EXPECT_EQ(parseMachineState("PAUSED"), MachineState::Paused);
    EXPECT_EQ(parseMachineState("ready"), MachineState::Ready);
    EXPECT_EQ(parseMachineState("calibrate_doing"), MachineState::Calibrating);
    EXPECT_STREQ(machineStateName(MachineState::Completed), "Completed");
}
