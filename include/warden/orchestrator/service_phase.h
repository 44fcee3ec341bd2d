#ifndef WARDEN_ORCHESTRATOR_SERVICE_PHASE_H
#define WARDEN_ORCHESTRATOR_SERVICE_PHASE_H

#include <functional>
#include <memory>
#include <string>

namespace warden {
namespace orchestrator {

/**
 * @brief One named step of startup and shutdown
 *
 * start() throws to abort startup. stop() is only called on phases whose
 * start() returned normally.
 */
class ServicePhase {
 public:
  virtual ~ServicePhase() = default;

  virtual const std::string& name() const = 0;
  virtual void start() = 0;
  virtual void stop() = 0;
};

using ServicePhasePtr = std::shared_ptr<ServicePhase>;

// Phase built from two callables
class FunctionPhase : public ServicePhase {
 public:
  FunctionPhase(std::string name,
                std::function<void()> start_fn,
                std::function<void()> stop_fn = nullptr)
      : name_(std::move(name)),
        start_fn_(std::move(start_fn)),
        stop_fn_(std::move(stop_fn)) {}

  const std::string& name() const override { return name_; }

  void start() override {
    if (start_fn_) {
      start_fn_();
    }
  }

  void stop() override {
    if (stop_fn_) {
      stop_fn_();
    }
  }

 private:
  std::string name_;
  std::function<void()> start_fn_;
  std::function<void()> stop_fn_;
};

/**
 * @brief Storage collaborator opened by the infrastructure phase
 */
class Database {
 public:
  virtual ~Database() = default;

  virtual void open(const std::string& data_root) = 0;
  virtual void close() = 0;
};

using DatabasePtr = std::shared_ptr<Database>;

}  // namespace orchestrator
}  // namespace warden

#endif  // WARDEN_ORCHESTRATOR_SERVICE_PHASE_H
