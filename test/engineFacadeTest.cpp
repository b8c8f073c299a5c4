#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <utility>

#include <boost/asio.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lib/engineFacade.hpp"
#include "mockEngineClient.hpp"

using namespace Retagger;
using namespace Retagger::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {
    EngineErrc errorCode(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const EngineError& e) {
            return e.code();
        } catch (const std::exception& e) {
            ADD_FAILURE() << "not an EngineError: " << e.what();
        }
        return EngineErrc::Unreachable;
    }
}

class EngineFacadeTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    MockEngine engine;
    EngineFacade facade{engine.factory(), ioc};
};

TEST_F(EngineFacadeTest, UsesFourWorkersByDefault) {
    EXPECT_EQ(facade.workers(), 4u);
}

TEST_F(EngineFacadeTest, AcquiresAndReleasesAClientPerCall) {
    EXPECT_CALL(engine.client, ping()).Times(2);
    EXPECT_CALL(engine.client, pull("nginx:latest")).WillOnce(Return(nginxImage()));

    facade.ping();
    facade.ping();
    EXPECT_EQ(facade.pull("nginx:latest").id, nginxImage().id);

    EXPECT_EQ(engine.acquired.load(), 3);
    EXPECT_EQ(engine.live.load(), 0);
}

TEST_F(EngineFacadeTest, ReleasesClientWhenTheCallThrows) {
    EXPECT_CALL(engine.client, pull(_)).WillOnce(Throw(std::runtime_error("connection reset by peer")));

    try {
        facade.pull("nginx:latest");
        FAIL() << "pull should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), EngineErrc::PullFailed);
        EXPECT_EQ(e.detail(), "connection reset by peer");
    }
    EXPECT_EQ(engine.live.load(), 0);
}

TEST_F(EngineFacadeTest, TagsWithTheFullTargetRepository) {
    EXPECT_CALL(engine.client, tag(_, "localhost:5000/library/nginx", "latest"));
    facade.tag(nginxImage(), "localhost:5000", "library", "nginx", "latest");
}

TEST_F(EngineFacadeTest, TagFailureCarriesEngineText) {
    EXPECT_CALL(engine.client, tag(_, _, _))
        .WillOnce(Throw(EngineError(EngineErrc::TagFailed, "HTTP 404: No such image: sha256:4f3b")));
    try {
        facade.tag(nginxImage(), "localhost:5000", "library", "nginx", "latest");
        FAIL() << "tag should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), EngineErrc::TagFailed);
        EXPECT_EQ(e.detail(), "HTTP 404: No such image: sha256:4f3b");
    }
}

TEST_F(EngineFacadeTest, PushForwardsStatusLines) {
    EXPECT_CALL(engine.client, push("localhost:5000/library/nginx:latest", _))
        .WillOnce(Invoke(replay({statusRecord("Preparing"), StatusRecord{}, statusRecord("Pushed")})));

    std::vector<std::string> lines;
    facade.push("localhost:5000/library/nginx:latest", [&lines](const std::string& line) { lines.push_back(line); });
    EXPECT_EQ(lines, (std::vector<std::string>{"Preparing", "Pushed"}));
}

TEST_F(EngineFacadeTest, PushStopsAtFirstErrorRecord) {
    EXPECT_CALL(engine.client, push(_, _))
        .WillOnce(Invoke(replay({statusRecord("Preparing"), errorRecord("denied: requested access to the resource is denied"),
                                 statusRecord("Pushed")})));

    std::vector<std::string> lines;
    try {
        facade.push("localhost:5000/library/nginx:latest", [&lines](const std::string& line) { lines.push_back(line); });
        FAIL() << "push should have thrown";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), EngineErrc::PushFailed);
        EXPECT_EQ(e.detail(), "denied: requested access to the resource is denied");
    }
    EXPECT_EQ(lines, std::vector<std::string>{"Preparing"});
}

TEST_F(EngineFacadeTest, AsyncCompletesOnTheEventLoopThread) {
    const auto loopThread = std::this_thread::get_id();
    std::thread::id workerThread;
    EXPECT_CALL(engine.client, pull("nginx:latest")).WillOnce(Invoke([&workerThread](const std::string&) {
        workerThread = std::this_thread::get_id();
        return nginxImage();
    }));

    bool completed = false;
    facade.pullAsync("nginx:latest", [&](std::exception_ptr error, ImageHandle image) {
        EXPECT_FALSE(error);
        EXPECT_EQ(image.shortId, "sha256:4f3b2c1d0e9f");
        EXPECT_EQ(std::this_thread::get_id(), loopThread);
        completed = true;
    });

    EXPECT_FALSE(completed);
    ioc.run();
    EXPECT_TRUE(completed);
    EXPECT_NE(workerThread, loopThread);
}

TEST_F(EngineFacadeTest, AsyncPushDeliversStatusBeforeCompletion) {
    EXPECT_CALL(engine.client, push(_, _))
        .WillOnce(Invoke(replay({statusRecord("Preparing"), statusRecord("Pushing"), statusRecord("Pushed")})));

    std::vector<std::string> seen;
    facade.pushAsync("localhost:5000/library/nginx:latest",
        [&seen](const std::string& line) { seen.push_back(line); },
        [&seen](std::exception_ptr error) {
            EXPECT_FALSE(error);
            seen.push_back("done");
        });
    ioc.run();

    EXPECT_EQ(seen, (std::vector<std::string>{"Preparing", "Pushing", "Pushed", "done"}));
}

TEST_F(EngineFacadeTest, AsyncFailureArrivesAsExceptionPointer) {
    EXPECT_CALL(engine.client, remove("nginx:latest", true))
        .WillOnce(Throw(EngineError(EngineErrc::RemoveFailed, "conflict: image is being used by running container")));

    std::exception_ptr received;
    facade.removeImageAsync("nginx:latest", true, [&received](std::exception_ptr error) { received = error; });
    ioc.run();

    ASSERT_TRUE(received);
    EXPECT_EQ(errorCode(received), EngineErrc::RemoveFailed);
    EXPECT_EQ(describeError(received), "conflict: image is being used by running container");
}

TEST_F(EngineFacadeTest, ListsImagesAndInfo) {
    EXPECT_CALL(engine.client, listImages()).WillOnce(Return(std::vector<ImageHandle>{nginxImage()}));
    EXPECT_CALL(engine.client, info()).WillOnce(Return(nlohmann::json{{"ServerVersion", "24.0.7"}}));

    std::size_t count = 0;
    std::string version;
    facade.listImagesAsync([&count](std::exception_ptr error, std::vector<ImageHandle> images) {
        EXPECT_FALSE(error);
        count = images.size();
    });
    facade.infoAsync([&version](std::exception_ptr error, nlohmann::json info) {
        EXPECT_FALSE(error);
        version = info.value("ServerVersion", "");
    });
    ioc.run();

    EXPECT_EQ(count, 1u);
    EXPECT_EQ(version, "24.0.7");
}

TEST_F(EngineFacadeTest, ConnectionDiagnosticNeverThrows) {
    EXPECT_CALL(engine.client, ping())
        .WillOnce(Return())
        .WillOnce(Throw(EngineError(EngineErrc::Unreachable, "Connection refused")))
        .WillOnce(Throw(EngineError(EngineErrc::PingFailed, "HTTP 500: server error")));

    EXPECT_EQ(facade.connectionDiagnostic(), "Container engine connection OK");
    EXPECT_THAT(facade.connectionDiagnostic(), ::testing::HasSubstr("not running or refuses connections"));
    EXPECT_THAT(facade.connectionDiagnostic(), ::testing::HasSubstr("HTTP 500: server error"));
}

TEST_F(EngineFacadeTest, TestConnectionReportsReachability) {
    EXPECT_CALL(engine.client, ping())
        .WillOnce(Return())
        .WillOnce(Throw(EngineError(EngineErrc::Unreachable, "Connection refused")));

    EXPECT_TRUE(facade.testConnection());
    EXPECT_FALSE(facade.testConnection());
}

namespace {
    struct Gate {
        std::mutex mutex;
        std::condition_variable changed;
        bool entered = false;
        bool cancelled = false;
    };

    // Pull hangs like a stalled registry transfer until the request is cancelled.
    class StalledClient : public EngineClient {
    public:
        explicit StalledClient(Gate& gate) : gate_(gate) {}

        void ping() override {}
        nlohmann::json info() override { return nlohmann::json::object(); }
        std::vector<ImageHandle> listImages() override { return {}; }
        ImageHandle pull(const std::string&) override {
            std::unique_lock<std::mutex> lock(gate_.mutex);
            gate_.entered = true;
            gate_.changed.notify_all();
            gate_.changed.wait(lock, [this] { return gate_.cancelled; });
            throw EngineError(EngineErrc::Unreachable, "Request was cancelled");
        }
        void tag(const ImageHandle&, const std::string&, const std::string&) override {}
        void push(const std::string&, const RecordHandler&) override {}
        void remove(const std::string&, bool) override {}

        void cancel() override {
            std::lock_guard<std::mutex> lock(gate_.mutex);
            gate_.cancelled = true;
            gate_.changed.notify_all();
        }

    private:
        Gate& gate_;
    };
}

TEST(EngineFacadeShutdownTest, CancelsRequestsInFlightAndDropsQueuedWork) {
    boost::asio::io_context ioc;
    Gate gate;
    std::atomic<int> created{0};
    auto facade = std::make_unique<EngineFacade>([&gate, &created]() -> std::unique_ptr<EngineClient> {
        ++created;
        return std::make_unique<StalledClient>(gate);
    }, ioc, 1);

    std::exception_ptr firstError;
    bool firstDone = false;
    facade->pullAsync("nginx:latest", [&](std::exception_ptr error, ImageHandle) {
        firstDone = true;
        firstError = error;
    });
    facade->pullAsync("redis:7", [](std::exception_ptr, ImageHandle) {});

    {
        std::unique_lock<std::mutex> lock(gate.mutex);
        gate.changed.wait(lock, [&gate] { return gate.entered; });
    }
    facade.reset();

    EXPECT_TRUE(gate.cancelled);
    EXPECT_EQ(created.load(), 1);

    ioc.run();
    ASSERT_TRUE(firstDone);
    EXPECT_EQ(errorCode(firstError), EngineErrc::PullFailed);
}
