#include "engineFacade.hpp"

#include <boost/format.hpp>

#include "imageReference.hpp"
#include "logger.hpp"

namespace Retagger {
    EngineFacade::EngineFacade(EngineClientFactory factory, boost::asio::io_context& ioc, std::size_t workers)
        : factory_(std::move(factory)), ioc_(ioc), workers_(workers == 0 ? DEFAULT_WORKERS : workers), pool_(workers_) {}

    EngineFacade::~EngineFacade() {
        {
            std::lock_guard<std::mutex> lock(clientsMutex_);
            stopping_ = true;
            for (auto* client : clients_) {
                client->cancel();
            }
        }
        pool_.stop();
        pool_.join();
    }

    EngineFacade::Lease::Lease(EngineFacade& facade, std::unique_ptr<EngineClient> client)
        : facade_(facade), client_(std::move(client)) {
        std::lock_guard<std::mutex> lock(facade_.clientsMutex_);
        if (facade_.stopping_) {
            throw EngineError(EngineErrc::Unreachable, "Engine facade is shutting down");
        }
        facade_.clients_.insert(client_.get());
    }

    EngineFacade::Lease::~Lease() {
        std::lock_guard<std::mutex> lock(facade_.clientsMutex_);
        facade_.clients_.erase(client_.get());
    }

    EngineFacade::Lease EngineFacade::acquire() {
        {
            std::lock_guard<std::mutex> lock(clientsMutex_);
            if (stopping_) {
                throw EngineError(EngineErrc::Unreachable, "Engine facade is shutting down");
            }
        }
        auto client = factory_();
        if (!client) {
            throw EngineError(EngineErrc::Unreachable, "No container engine client available");
        }
        return Lease(*this, std::move(client));
    }

    void EngineFacade::dispatch(std::function<void()> operation, DoneHandler handler) {
        auto work = boost::asio::make_work_guard(ioc_);
        boost::asio::post(pool_, [this, operation = std::move(operation), handler = std::move(handler),
                                  work = std::move(work)]() mutable {
            std::exception_ptr error;
            try {
                operation();
            } catch (...) {
                error = std::current_exception();
            }
            boost::asio::post(ioc_, [handler = std::move(handler), error, work = std::move(work)]() mutable {
                handler(error);
            });
        });
    }

    ImageHandle EngineFacade::pull(const std::string& sourceReference) {
        logMessage("Pulling " + sourceReference, "engine", LogLevel::INFO);
        try {
            return acquire()->pull(sourceReference);
        } catch (const EngineError& e) {
            if (e.code() == EngineErrc::PullFailed) throw;
            throw EngineError(EngineErrc::PullFailed, e.detail());
        } catch (const std::exception& e) {
            throw EngineError(EngineErrc::PullFailed, e.what());
        }
    }

    void EngineFacade::pullAsync(const std::string& sourceReference, ResultHandler<ImageHandle> handler) {
        dispatch<ImageHandle>([this, sourceReference] { return pull(sourceReference); }, std::move(handler));
    }

    void EngineFacade::tag(const ImageHandle& image, const std::string& targetDomain, const std::string& bucket,
                           const std::string& repository, const std::string& tag) {
        auto [targetName, targetTag] = splitNameAndTag(buildTargetReference(targetDomain, bucket, repository, tag));
        logMessage(boost::format("Tagging %s as %s:%s") % image.shortId % targetName % targetTag, "engine", LogLevel::INFO);
        try {
            acquire()->tag(image, targetName, targetTag);
        } catch (const EngineError& e) {
            if (e.code() == EngineErrc::TagFailed) throw;
            throw EngineError(EngineErrc::TagFailed, e.detail());
        } catch (const std::exception& e) {
            throw EngineError(EngineErrc::TagFailed, e.what());
        }
    }

    void EngineFacade::tagAsync(const ImageHandle& image, const std::string& targetDomain, const std::string& bucket,
                                const std::string& repository, const std::string& tag, DoneHandler handler) {
        dispatch([this, image, targetDomain, bucket, repository, tag] {
            this->tag(image, targetDomain, bucket, repository, tag);
        }, std::move(handler));
    }

    void EngineFacade::push(const std::string& targetReference, const StatusCallback& onStatusLine) {
        logMessage("Pushing " + targetReference, "engine", LogLevel::INFO);
        std::string streamError;
        bool failed = false;
        try {
            acquire()->push(targetReference, [&](const StatusRecord& record) {
                if (record.error) {
                    failed = true;
                    streamError = *record.error;
                    return false;
                }
                if (record.status && onStatusLine) {
                    onStatusLine(*record.status);
                }
                return true;
            });
        } catch (const EngineError& e) {
            if (e.code() == EngineErrc::PushFailed) throw;
            throw EngineError(EngineErrc::PushFailed, e.detail());
        } catch (const std::exception& e) {
            throw EngineError(EngineErrc::PushFailed, e.what());
        }
        if (failed) {
            logMessage("Push of " + targetReference + " failed: " + streamError, "engine", LogLevel::ERROR);
            throw EngineError(EngineErrc::PushFailed, streamError);
        }
    }

    void EngineFacade::pushAsync(const std::string& targetReference, StatusCallback onStatusLine, DoneHandler handler) {
        dispatch([this, targetReference, onStatusLine = std::move(onStatusLine)] {
            push(targetReference, [this, &onStatusLine](const std::string& line) {
                if (onStatusLine) {
                    boost::asio::post(ioc_, [onStatusLine, line] { onStatusLine(line); });
                }
            });
        }, std::move(handler));
    }

    void EngineFacade::ping() {
        acquire()->ping();
    }

    void EngineFacade::pingAsync(DoneHandler handler) {
        dispatch([this] { ping(); }, std::move(handler));
    }

    nlohmann::json EngineFacade::info() {
        return acquire()->info();
    }

    void EngineFacade::infoAsync(ResultHandler<nlohmann::json> handler) {
        dispatch<nlohmann::json>([this] { return info(); }, std::move(handler));
    }

    std::vector<ImageHandle> EngineFacade::listImages() {
        return acquire()->listImages();
    }

    void EngineFacade::listImagesAsync(ResultHandler<std::vector<ImageHandle>> handler) {
        dispatch<std::vector<ImageHandle>>([this] { return listImages(); }, std::move(handler));
    }

    void EngineFacade::removeImage(const std::string& reference, bool force) {
        logMessage(boost::format("Removing %s (force=%s)") % reference % (force ? "true" : "false"), "engine", LogLevel::INFO);
        acquire()->remove(reference, force);
    }

    void EngineFacade::removeImageAsync(const std::string& reference, bool force, DoneHandler handler) {
        dispatch([this, reference, force] { removeImage(reference, force); }, std::move(handler));
    }

    bool EngineFacade::testConnection() {
        try {
            ping();
            return true;
        } catch (const std::exception& e) {
            logMessage(std::string("Engine connection test failed: ") + e.what(), "engine", LogLevel::ERROR);
            return false;
        }
    }

    void EngineFacade::testConnectionAsync(ResultHandler<bool> handler) {
        dispatch<bool>([this] { return testConnection(); }, std::move(handler));
    }

    std::string EngineFacade::connectionDiagnostic() {
        try {
            ping();
            return "Container engine connection OK";
        } catch (const EngineError& e) {
            if (e.code() == EngineErrc::Unreachable) {
                return "Container engine is not running or refuses connections: " + e.detail();
            }
            return "Container engine connection failed: " + e.detail();
        } catch (const std::exception& e) {
            return std::string("Container engine connection failed: ") + e.what();
        }
    }

    void EngineFacade::connectionDiagnosticAsync(ResultHandler<std::string> handler) {
        dispatch<std::string>([this] { return connectionDiagnostic(); }, std::move(handler));
    }
}
