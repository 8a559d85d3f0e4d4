#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sync_error.hpp"

namespace docsync {

struct TransferEvent {
  enum class Type { Progress, Done, Error };

  Type type = Type::Progress;
  double fraction = 0.0; // 0.0 - 1.0, Progress only
  SyncError error;       // Error only

  static TransferEvent progress(double value) { return {Type::Progress, value, {}}; }
  static TransferEvent done() { return {Type::Done, 1.0, {}}; }
  static TransferEvent failed(SyncError err) { return {Type::Error, 0.0, std::move(err)}; }

  bool is_terminal() const { return type != Type::Progress; }
};

// Per-operation event sink: progress values never go backwards and exactly
// one terminal event is forwarded, after which the channel is silent.
class ProgressChannel {
public:
  using Sink = std::function<void(const TransferEvent&)>;
  using CancelHandler = std::function<void()>;

  explicit ProgressChannel(std::string name, Sink sink = {});

  const std::string& name() const { return name_; }

  bool emit(double fraction);
  bool emit_done();
  bool emit_error(SyncError error);

  bool terminated() const;
  std::optional<double> last_emitted() const;

  // Installed by the operation feeding this channel; run when the consumer
  // cancels. Cleared once it has run.
  void set_cancel_handler(CancelHandler handler);
  void cancel();

private:
  bool emit_terminal(TransferEvent event);

  std::string name_;
  Sink sink_;
  mutable std::mutex m_;
  std::optional<double> last_emitted_;
  bool terminated_ = false;
  CancelHandler cancel_handler_;
};

// Named channels owned by one coordinator.
class ProgressChannelTable {
public:
  std::shared_ptr<ProgressChannel> create(const std::string& name, ProgressChannel::Sink sink);
  std::shared_ptr<ProgressChannel> find(const std::string& name) const;
  void remove(const std::string& name);
  // Runs the channel's cancel handler and forgets it. False if unknown.
  bool cancel(const std::string& name);
  std::size_t size() const;

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, std::shared_ptr<ProgressChannel>> channels_;
};

} // namespace docsync
