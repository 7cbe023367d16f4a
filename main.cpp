#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <drogon/drogon.h>
#include <json/json.h>
#include <nlohmann/json.hpp>

#include "benchmark_runner.hpp"
#include "config.hpp"
#include "context.hpp"
#include "dataset.hpp"
#include "ensemble_router.hpp"
#include "errors.hpp"
#include "history_store.hpp"
#include "kv_store.hpp"
#include "metrics.hpp"
#include "model_adapter.hpp"
#include "result_cache.hpp"
#include "risk_engine.hpp"
#include "validation_harness.hpp"
#include "worker_pool.hpp"

#ifdef HAVE_REDIS
#include "redis_backend.hpp"
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace horizon;

static json fromJsoncpp(const Json::Value &v) {
    switch (v.type()) {
    case Json::nullValue: return nullptr;
    case Json::intValue: return (int64_t)v.asInt64();
    case Json::uintValue: return (uint64_t)v.asUInt64();
    case Json::realValue: return v.asDouble();
    case Json::stringValue: return v.asString();
    case Json::booleanValue: return v.asBool();
    case Json::arrayValue: {
        json out = json::array();
        for (const auto &item : v) out.push_back(fromJsoncpp(item));
        return out;
    }
    case Json::objectValue: {
        json out = json::object();
        for (auto it = v.begin(); it != v.end(); ++it) out[it.name()] = fromJsoncpp(*it);
        return out;
    }
    default:
        return nullptr;
    }
}

static Json::Value toJsoncpp(const json &v) {
    if (v.is_null()) return Json::Value();
    if (v.is_boolean()) return Json::Value(v.get<bool>());
    if (v.is_number_integer()) return Json::Value((Json::Int64)v.get<long long>());
    if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
    if (v.is_number_float()) return Json::Value(v.get<double>());
    if (v.is_string()) return Json::Value(v.get<std::string>());
    if (v.is_array()) {
        Json::Value arr(Json::arrayValue);
        for (const auto &item : v) arr.append(toJsoncpp(item));
        return arr;
    }
    Json::Value obj(Json::objectValue);
    for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
    return obj;
}

struct Services {
    std::shared_ptr<InMemoryMetrics> metrics;
    std::shared_ptr<ValidationHistoryStore> history;
    std::shared_ptr<ModelAdapter> shortModel;
    std::shared_ptr<ModelAdapter> longModel;
    std::shared_ptr<EnsembleRouter> router;
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<RiskEngine> engine;
    std::shared_ptr<ValidationHarness> harness;
    std::shared_ptr<ValidationScheduler> scheduler;
    std::shared_ptr<WorkerPool> assessPool;

    void shutdown() {
        if (assessPool) assessPool->stop();
        if (scheduler) scheduler->stop();
        if (engine) engine->stop();
        if (cache) cache->stop();
        if (history) {
            try {
                history->flush();
            } catch (const std::exception &e) {
                std::cerr << "[Bootstrap] history flush failed: " << e.what() << std::endl;
            }
        }
    }
};

static SharedCachePtr openSharedCache(const Config &config) {
    if (!config.redis.enabled) return nullptr;
#ifdef HAVE_REDIS
    try {
        auto backend = std::make_shared<RedisCacheBackend>(config.redis, config.cache.keyPrefix);
        if (backend->ping()) {
            std::cout << "[Bootstrap] L2 cache: redis " << config.redis.url << std::endl;
            return backend;
        }
        std::cerr << "[Bootstrap] redis ping failed, running L1 only" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "[Bootstrap] redis unavailable (" << e.what() << "), running L1 only" << std::endl;
    }
#else
    std::cerr << "[Bootstrap] built without redis support, running L1 only" << std::endl;
#endif
    return nullptr;
}

static void loadAdapter(const std::shared_ptr<ModelAdapter> &model, const fs::path &path) {
    try {
        model->loadModel(Context::background(), path);
        std::cout << "[Bootstrap] model " << model->id() << "@" << model->version() << " from " << path.string() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "[Bootstrap] model load failed for " << path.string() << ": " << e.what() << std::endl;
    }
}

static std::vector<LabeledSample> loadDataset(const Config &config) {
    if (!config.datasetPath.empty()) return loadJsonLines(config.datasetPath);
    SyntheticDatasetOptions options;
    options.businesses = config.syntheticBusinesses;
    options.horizons = config.validation.horizons;
    options.seed = config.validation.randomSeed;
    return generateSyntheticDataset(options);
}

static Services buildServices(const Config &config) {
    Services s;
    s.metrics = std::make_shared<InMemoryMetrics>();

    try {
        ensureDir(config.storeDir);
        s.history = std::make_shared<ValidationHistoryStore>(openStore("validation_history", config.storeDir, config.lmdbMapSizeBytes));
    } catch (const std::exception &e) {
        std::cerr << "[Bootstrap] history store disabled: " << e.what() << std::endl;
    }

    s.shortModel = std::make_shared<TreeEnsembleAdapter>();
    s.longModel = std::make_shared<SequenceModelAdapter>();
    loadAdapter(s.shortModel, config.shortModelPath);
    loadAdapter(s.longModel, config.longModelPath);

    s.router = std::make_shared<EnsembleRouter>(s.shortModel, s.longModel, config.router, s.metrics);
    s.cache = std::make_shared<ResultCache>(config.cache, openSharedCache(config), s.metrics);
    s.cache->start();
    s.engine = std::make_shared<RiskEngine>(s.router, s.cache, config.engine, config.breaker, s.metrics);

    s.harness = std::make_shared<ValidationHarness>(s.router, s.history, s.metrics);
    std::weak_ptr<RiskEngine> weakEngine = s.engine;
    s.harness->setWeightsSink([weakEngine](std::shared_ptr<const RouterWeights> weights) {
        if (auto engine = weakEngine.lock()) engine->applyWeights(std::move(weights));
    });
    return s;
}

static int runValidate(const Config &config, Services &s) {
    auto dataset = loadDataset(config);
    int code = 0;
    try {
        auto result = s.harness->validateModel(Context::background(), config.validation, dataset);
        std::cout << result.toJson().dump(2) << std::endl;
        if (config.validation.applyRecommendedWeights && result.targetAchieved) s.harness->applyRecommendations(result);
        ValidationHarness::enforceTargets(result);
    } catch (const RiskError &e) {
        std::cerr << "[Validate] " << e.what() << std::endl;
        code = e.code() == ErrorCode::ValidationTargetNotMet ? 2 : 1;
    }
    return code;
}

static int runBenchmark(const Config &config, Services &s) {
    SyntheticDatasetOptions options;
    options.businesses = std::min(config.syntheticBusinesses, 200);
    options.horizons = {config.router.supportedHorizons.front()};
    options.seed = config.validation.randomSeed;
    auto samples = generateSyntheticDataset(options);
    if (samples.empty()) {
        std::cerr << "[Benchmark] no requests to replay" << std::endl;
        return 1;
    }
    std::vector<RiskAssessmentRequest> requests;
    for (auto &sample : samples) {
        auto r = sample.request;
        r.horizons = config.router.supportedHorizons;
        requests.push_back(std::move(r));
    }

    BenchmarkRunner runner(config.benchmark, s.metrics);
    auto engine = s.engine;
    auto result = runner.run(Context::background(), [engine, &requests](const ContextPtr &ctx, int i) {
        engine->assess(ctx, requests[(size_t)i % requests.size()]);
    });
    std::cout << json{{"benchmark", result.toJson()}, {"engine", s.engine->stats()}}.dump(2) << std::endl;
    return result.passed ? 0 : 3;
}

class HttpGateway {
public:
    HttpGateway(Services &services, const Config &config) : services_(services), config_(config) {
        startedAt_ = std::chrono::steady_clock::now();
        setupRoutes();
    }

    void listen() {
        std::cout << "[Gateway] listening on " << config_.host << ":" << config_.port << std::endl;
        drogon::app().setThreadNum((size_t)config_.serverThreads).addListener(config_.host, (uint16_t)config_.port).run();
    }

private:
    using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

    static drogon::HttpStatusCode statusFor(ErrorCode code) {
        switch (code) {
        case ErrorCode::ValidationInput: return drogon::k400BadRequest;
        case ErrorCode::ResourceExhausted: return drogon::k429TooManyRequests;
        case ErrorCode::Timeout: return drogon::k504GatewayTimeout;
        case ErrorCode::CircuitOpen: return drogon::k503ServiceUnavailable;
        case ErrorCode::ModelInvocation: return drogon::k502BadGateway;
        default: return drogon::k500InternalServerError;
        }
    }

    void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
        resp->setStatusCode(code);
        cb(resp);
    }

    void respondError(const Callback &cb, const RiskError &e) {
        json err{{"code", errorCodeName(e.code())}, {"stage", stageName(e.stage())}, {"message", e.detail()}};
        auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(json{{"ok", false}, {"error", err}}));
        resp->setStatusCode(statusFor(e.code()));
        if (e.code() == ErrorCode::ResourceExhausted || e.code() == ErrorCode::CircuitOpen) resp->addHeader("Retry-After", "1");
        cb(resp);
    }

    void setupRoutes() {
        drogon::app().registerHandler("/v1/risk/assess", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            auto payload = req->getJsonObject();
            if (!payload) {
                return respondError(cb, RiskError(ErrorCode::ValidationInput, Stage::Validation, "invalid-json"));
            }
            RiskAssessmentRequest request;
            try {
                request = RiskAssessmentRequest::fromJson(fromJsoncpp(*payload));
            } catch (const RiskError &e) {
                return respondError(cb, e);
            } catch (const std::exception &e) {
                return respondError(cb, RiskError(ErrorCode::ValidationInput, Stage::Validation, e.what()));
            }
            // the engine blocks for up to the request timeout, so it never runs on an IO loop
            auto done = std::make_shared<Callback>(std::move(cb));
            bool queued = services_.assessPool->submit([this, request, done]() {
                try {
                    auto result = services_.engine->assess(Context::background(), request);
                    respondJson(*done, json{{"ok", true}, {"result", result.toJson()}});
                } catch (const RiskError &e) {
                    respondError(*done, e);
                } catch (const std::exception &e) {
                    std::cerr << "[Gateway] assess failed: " << e.what() << std::endl;
                    respondError(*done, RiskError(ErrorCode::Internal, Stage::Router, e.what()));
                }
            });
            if (!queued) {
                respondError(*done, RiskError(ErrorCode::ResourceExhausted, Stage::Admission,
                                              "gateway-queue-full:" + std::to_string(services_.assessPool->capacity())));
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/v1/health", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_).count();
            const auto &breaker = services_.engine->breaker();
            bool modelsUp = services_.shortModel->available() || services_.longModel->available();
            json body{
                {"ok", modelsUp},
                {"uptimeSec", uptime},
                {"breaker", breakerStateName(breaker.state())},
                {"models", json{{"short", services_.shortModel->describe()}, {"long", services_.longModel->describe()}}},
                {"l2", services_.cache->hasL2()}
            };
            respondJson(cb, body, modelsUp ? drogon::k200OK : drogon::k503ServiceUnavailable);
        }, {drogon::Get});

        drogon::app().registerHandler("/v1/stats", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            json body = services_.engine->stats();
            body["metrics"] = services_.metrics->snapshot();
            if (services_.scheduler) body["validation"] = services_.scheduler->status();
            body["gateway"] = json{{"workers", services_.assessPool->workers()},
                                   {"pending", services_.assessPool->pending()},
                                   {"rejected", services_.assessPool->rejected()}};
            if (services_.history) {
                json recent = json::array();
                for (auto &run : services_.history->recent(5)) recent.push_back(run);
                body["validationHistory"] = recent;
            }
            respondJson(cb, body);
        }, {drogon::Get});

        drogon::app().registerHandler("/metrics", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
            resp->setBody(services_.metrics->renderPrometheus());
            cb(resp);
        }, {drogon::Get});
    }

    Services &services_;
    const Config &config_;
    std::chrono::steady_clock::time_point startedAt_;
};

static int runServe(const Config &config, Services &s) {
    s.engine->installPrefetch(config.prefetch);
    if (config.validationInterval.count() > 0) {
        auto provider = [config]() { return loadDataset(config); };
        s.scheduler = std::make_shared<ValidationScheduler>(s.harness, config.validation, provider, config.validationInterval);
        s.scheduler->start();
    }
    s.assessPool = std::make_shared<WorkerPool>("assess", config.gatewayWorkers, (std::size_t)config.gatewayQueue);
    HttpGateway gateway(s, config);
    gateway.listen();
    return 0;
}

int main(int argc, char **argv) {
    const auto config = loadConfig(argc, argv);
    std::cout << "[Bootstrap] mode=" << config.mode << " config=" << config.toJson().dump() << std::endl;

    Services services = buildServices(config);
    int code = 0;
    try {
        if (config.mode == "validate") {
            code = runValidate(config, services);
        } else if (config.mode == "benchmark") {
            code = runBenchmark(config, services);
        } else if (config.mode == "serve") {
            code = runServe(config, services);
        } else {
            std::cerr << "[Bootstrap] unknown mode '" << config.mode << "' (serve|validate|benchmark)" << std::endl;
            code = 64;
        }
    } catch (const std::exception &e) {
        std::cerr << "[Bootstrap] fatal: " << e.what() << std::endl;
        code = 1;
    }
    services.shutdown();
    return code;
}
