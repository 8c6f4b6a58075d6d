#pragma once

#include "cowork/observability/observer.hpp"

#include <memory>

namespace cowork::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_agent_start(const std::string &provider, const std::string &model);
void record_agent_end(std::chrono::milliseconds duration, bool success);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_permission_decision(const std::string &permission_type, const std::string &resource,
                                bool allowed);
void record_sandbox_run(const std::string &backend, int exit_code, bool timed_out,
                        std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace cowork::observability
