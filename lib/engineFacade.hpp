#ifndef RETAGGER_ENGINE_FACADE_HPP
#define RETAGGER_ENGINE_FACADE_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "engineClient.hpp"

namespace Retagger {
    /**
     * Front of the container engine used by the rest of the service.
     *
     * Every operation acquires its own client from the factory and drops it before
     * returning. Each blocking operation has a non-blocking twin ending in Async: it
     * runs the blocking body on a fixed worker pool and invokes the handler on the
     * io_context, so the engine's blocking calls never stall the event loop.
     * Handlers receive a null exception_ptr on success.
     *
     * Destroying the facade cancels the engine requests still in flight, drops
     * the operations not yet started and waits for the workers.
     */
    class EngineFacade {
    public:
        using StatusCallback = std::function<void(const std::string&)>;
        using DoneHandler = std::function<void(std::exception_ptr)>;
        template<typename Result>
        using ResultHandler = std::function<void(std::exception_ptr, Result)>;

        static constexpr std::size_t DEFAULT_WORKERS = 4;

        EngineFacade(EngineClientFactory factory, boost::asio::io_context& ioc, std::size_t workers = DEFAULT_WORKERS);
        ~EngineFacade();

        EngineFacade(const EngineFacade&) = delete;
        EngineFacade& operator=(const EngineFacade&) = delete;

        ImageHandle pull(const std::string& sourceReference);
        void pullAsync(const std::string& sourceReference, ResultHandler<ImageHandle> handler);

        // Tags the image as buildTargetReference(targetDomain, bucket, repository, tag).
        void tag(const ImageHandle& image, const std::string& targetDomain, const std::string& bucket,
                 const std::string& repository, const std::string& tag);
        void tagAsync(const ImageHandle& image, const std::string& targetDomain, const std::string& bucket,
                      const std::string& repository, const std::string& tag, DoneHandler handler);

        // The first error record aborts the push with EngineErrc::PushFailed.
        void push(const std::string& targetReference, const StatusCallback& onStatusLine);
        // Status lines are posted to the io_context, all of them before the handler.
        void pushAsync(const std::string& targetReference, StatusCallback onStatusLine, DoneHandler handler);

        void ping();
        void pingAsync(DoneHandler handler);

        nlohmann::json info();
        void infoAsync(ResultHandler<nlohmann::json> handler);

        std::vector<ImageHandle> listImages();
        void listImagesAsync(ResultHandler<std::vector<ImageHandle>> handler);

        void removeImage(const std::string& reference, bool force);
        void removeImageAsync(const std::string& reference, bool force, DoneHandler handler);

        bool testConnection();
        void testConnectionAsync(ResultHandler<bool> handler);

        // Human readable engine state, never throws.
        std::string connectionDiagnostic();
        void connectionDiagnosticAsync(ResultHandler<std::string> handler);

        std::size_t workers() const { return workers_; }

    private:
        // A client registered for cancellation while an operation uses it.
        class Lease {
        public:
            Lease(EngineFacade& facade, std::unique_ptr<EngineClient> client);
            ~Lease();

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            EngineClient* operator->() const { return client_.get(); }

        private:
            EngineFacade& facade_;
            std::unique_ptr<EngineClient> client_;
        };

        Lease acquire();

        template<typename Result>
        void dispatch(std::function<Result()> operation, ResultHandler<Result> handler);
        void dispatch(std::function<void()> operation, DoneHandler handler);

        EngineClientFactory factory_;
        boost::asio::io_context& ioc_;
        std::size_t workers_;
        std::mutex clientsMutex_;
        std::set<EngineClient*> clients_;
        bool stopping_ = false;
        boost::asio::thread_pool pool_;
    };

    template<typename Result>
    void EngineFacade::dispatch(std::function<Result()> operation, ResultHandler<Result> handler) {
        auto work = boost::asio::make_work_guard(ioc_);
        boost::asio::post(pool_, [this, operation = std::move(operation), handler = std::move(handler),
                                  work = std::move(work)]() mutable {
            std::exception_ptr error;
            Result result{};
            try {
                result = operation();
            } catch (...) {
                error = std::current_exception();
            }
            boost::asio::post(ioc_, [handler = std::move(handler), error, result = std::move(result),
                                     work = std::move(work)]() mutable {
                handler(error, std::move(result));
            });
        });
    }
}

#endif // RETAGGER_ENGINE_FACADE_HPP
