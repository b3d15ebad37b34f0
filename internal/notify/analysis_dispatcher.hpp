#pragma once

#include <string>

#include "completion_event.hpp"

namespace upload::notify {

/*
  Hand-off point to the analysis side. Dispatch may throw; the worker logs
  the failure and moves on to the next event.
*/
class AnalysisDispatcher {
 public:
  virtual ~AnalysisDispatcher() = default;

  virtual void Dispatch(const CompletionEvent& event) = 0;
};

// Default hook: logs an "analysis requested" record per event.
class LoggingAnalysisDispatcher final : public AnalysisDispatcher {
 public:
  explicit LoggingAnalysisDispatcher(std::string analysis_type = "metadata_extraction");

  void Dispatch(const CompletionEvent& event) override;

 private:
  std::string analysis_type_;
};

} // namespace upload::notify
