#pragma once

#include <string>
#include "policy/pattern_filter.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace eolfix::runtime {

// Receives progress events from a run. The runner itself never formats or
// prints anything; rendering is the observer's job.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void on_input(const std::string& raw,
                          const protocol::ExtractionResult& extraction) = 0;
    virtual void on_file(const protocol::FileReport& report) = 0;
    virtual void on_summary(const protocol::RunReport& report) = 0;
};

class NullObserver : public RunObserver {
public:
    void on_input(const std::string&, const protocol::ExtractionResult&) override {}
    void on_file(const protocol::FileReport&) override {}
    void on_summary(const protocol::RunReport&) override {}
};

class NewlineRunner {
public:
    protocol::RunReport run(const std::string& raw,
                            const policy::PatternFilter& filter,
                            RunObserver& observer) const;
};

}  // namespace eolfix::runtime
