#pragma once

#include <vsearch_deploy/core/process.hpp>

#include <deque>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace vsearch_deploy {
namespace testing {

// ---------------------------------------------------------------------------
// MockCommandRunner — hand-written mock for offline unit testing.
//
// Usage:
//   MockCommandRunner mock;
//   mock.EnqueueOutput(0, "run.googleapis.com\n");
//   auto result = mock.Run({"gcloud", "services", "list"});
//   CHECK(mock.RunCallCount() == 1);
//   CHECK(mock.RunCalls()[0][1] == "services");
//
// Responses are consumed FIFO. If the queue is empty when Run() is called,
// the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------
class MockCommandRunner : public ICommandRunner {
public:
    MockCommandRunner() = default;

    // -- Enqueue canned responses -------------------------------------------

    void Enqueue(Result<CommandOutput, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueOutput(int exit_code, std::string out, std::string err = "") {
        Enqueue(Result<CommandOutput, Error>::Ok(
            CommandOutput{exit_code, std::move(out), std::move(err)}));
    }

    // -- Tool availability ---------------------------------------------------

    void SetAvailable(const std::string& tool, bool available = true) {
        if (available) {
            available_.insert(tool);
        } else {
            available_.erase(tool);
        }
    }

    // Called with every argv before the queued response is returned.
    void OnRun(std::function<void(const std::vector<std::string>&)> hook) {
        on_run_ = std::move(hook);
    }

    // -- Call history accessors ----------------------------------------------

    [[nodiscard]] const std::vector<std::vector<std::string>>& RunCalls() const noexcept {
        return run_calls_;
    }
    [[nodiscard]] size_t RunCallCount() const noexcept {
        return run_calls_.size();
    }
    [[nodiscard]] const std::vector<std::string>& AvailabilityQueries() const noexcept {
        return availability_queries_;
    }

    // -- ICommandRunner ------------------------------------------------------

    [[nodiscard]] Result<CommandOutput, Error> Run(
        const std::vector<std::string>& argv) override {
        run_calls_.push_back(argv);
        if (on_run_) {
            on_run_(argv);
        }
        if (responses_.empty()) {
            return Result<CommandOutput, Error>::Err(Error{
                "MockCommandRunner::Run", argv.empty() ? "" : argv.front(),
                "No response enqueued (call #" + std::to_string(run_calls_.size()) + ")",
                std::nullopt, ErrorCategory::Internal, std::nullopt});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    [[nodiscard]] bool IsAvailable(std::string_view tool) override {
        availability_queries_.emplace_back(tool);
        return available_.count(std::string(tool)) > 0;
    }

private:
    std::deque<Result<CommandOutput, Error>> responses_;
    std::set<std::string> available_;
    std::function<void(const std::vector<std::string>&)> on_run_;
    std::vector<std::vector<std::string>> run_calls_;
    std::vector<std::string> availability_queries_;
};

} // namespace testing
} // namespace vsearch_deploy
