#pragma once

#include "http_server.h"
#include "admission_controller.h"
#include "sync_executor.h"
#include "test_runner.h"

namespace capsulerun {

// JSON views of a job record as the HTTP API returns them
Json::Value execution_result_view(const NormalizedResult& result);
Json::Value job_status_view(const Job& job);

// The public HTTP surface. Each handler is callable directly so it can be
// tested without sockets.
class ApiRoutes {
public:
    ApiRoutes(std::shared_ptr<KeyValueStore> store,
              AdmissionController& admission,
              ProgressStore& progress,
              ExecutionQueue& queue,
              CircuitBreaker& circuit,
              SyncExecutor& sync,
              TestRunner& tests,
              int sync_timeout_seconds = DEFAULT_SYNC_TIMEOUT_SECONDS);

    void register_routes(HttpServer& server);

    HttpResponse submit_generation(const HttpRequest& req);
    HttpResponse generation_status(const HttpRequest& req);
    HttpResponse execute_sync(const HttpRequest& req);
    HttpResponse execute_async(const HttpRequest& req);
    HttpResponse job_status(const HttpRequest& req);
    HttpResponse execute_tests(const HttpRequest& req);
    HttpResponse queue_stats(const HttpRequest& req);
    HttpResponse health(const HttpRequest& req);

private:
    std::shared_ptr<KeyValueStore> store_;
    AdmissionController& admission_;
    ProgressStore& progress_;
    ExecutionQueue& queue_;
    CircuitBreaker& circuit_;
    SyncExecutor& sync_;
    TestRunner& tests_;
    int sync_timeout_seconds_;

    HttpResponse status_for(const std::string& job_id);
    AdmissionResult admit_execution(const HttpRequest& req, const Json::Value& body,
                                    int& time_limit, std::string& error);
};

} // namespace capsulerun
