#include "progress_channel.hpp"

#include <utility>

namespace docsync {

ProgressChannel::ProgressChannel(std::string name, Sink sink)
  : name_(std::move(name)), sink_(std::move(sink)) {}

bool ProgressChannel::emit(double fraction) {
  Sink sink;
  {
    std::lock_guard lg(m_);
    if(terminated_) return false;
    if(last_emitted_ && fraction <= *last_emitted_) return false;
    last_emitted_ = fraction;
    sink = sink_;
  }
  if(sink) sink(TransferEvent::progress(fraction));
  return true;
}

bool ProgressChannel::emit_done() {
  return emit_terminal(TransferEvent::done());
}

bool ProgressChannel::emit_error(SyncError error) {
  return emit_terminal(TransferEvent::failed(std::move(error)));
}

bool ProgressChannel::emit_terminal(TransferEvent event) {
  Sink sink;
  {
    std::lock_guard lg(m_);
    if(terminated_) return false;
    terminated_ = true;
    sink = std::move(sink_);
    sink_ = nullptr;
    cancel_handler_ = nullptr;
  }
  if(sink) sink(event);
  return true;
}

bool ProgressChannel::terminated() const {
  std::lock_guard lg(m_);
  return terminated_;
}

std::optional<double> ProgressChannel::last_emitted() const {
  std::lock_guard lg(m_);
  return last_emitted_;
}

void ProgressChannel::set_cancel_handler(CancelHandler handler) {
  std::lock_guard lg(m_);
  if(terminated_) return;
  cancel_handler_ = std::move(handler);
}

void ProgressChannel::cancel() {
  CancelHandler handler;
  {
    std::lock_guard lg(m_);
    handler = std::move(cancel_handler_);
    cancel_handler_ = nullptr;
  }
  if(handler) handler();
}

std::shared_ptr<ProgressChannel> ProgressChannelTable::create(const std::string& name,
                                                              ProgressChannel::Sink sink) {
  auto channel = std::make_shared<ProgressChannel>(name, std::move(sink));
  std::lock_guard lg(m_);
  channels_[name] = channel;
  return channel;
}

std::shared_ptr<ProgressChannel> ProgressChannelTable::find(const std::string& name) const {
  std::lock_guard lg(m_);
  auto it = channels_.find(name);
  return it == channels_.end() ? nullptr : it->second;
}

void ProgressChannelTable::remove(const std::string& name) {
  std::lock_guard lg(m_);
  channels_.erase(name);
}

bool ProgressChannelTable::cancel(const std::string& name) {
  std::shared_ptr<ProgressChannel> channel;
  {
    std::lock_guard lg(m_);
    auto it = channels_.find(name);
    if(it == channels_.end()) return false;
    channel = it->second;
    channels_.erase(it);
  }
  channel->cancel();
  return true;
}

std::size_t ProgressChannelTable::size() const {
  std::lock_guard lg(m_);
  return channels_.size();
}

} // namespace docsync
