#pragma once

#include <coderun/execute/config.hh>
#include <coderun/execute/execution.hh>
#include <coderun/execute/executor.hh>
#include <coderun/execute/language.hh>
#include <memory>
#include <vector>

namespace coderun::execute {

// One executor per supported language, built at construction and immutable
// afterwards, thus safe to use from many threads at once
class Registry {
    std::vector<std::unique_ptr<Executor>> executors_; // indexed by Language

public:
    explicit Registry(const Config& config);

    // Throws std::runtime_error if @p language is not a supported language
    [[nodiscard]] const Executor& resolve(Language language) const;

    [[nodiscard]] ExecutionResult
    execute(Language language, const ExecutionRequest& request) const {
        return resolve(language).execute(request);
    }
};

// Creates a new executor of @p language
std::unique_ptr<Executor> make_executor(Language language, const Config& config);

} // namespace coderun::execute
