#include "voxrelay/events/enricher.hpp"

namespace voxrelay::events {

SelectiveEnricher::SelectiveEnricher(std::string session_id, Object metadata)
    : snapshot_(std::make_shared<const Snapshot>(
          Snapshot{.session_id = std::move(session_id), .metadata = std::move(metadata)})) {}

std::shared_ptr<const SelectiveEnricher::Snapshot> SelectiveEnricher::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

OutboundEvent SelectiveEnricher::enrich(OutboundEvent event) const {
  Object *data = event.data();
  if (data == nullptr) {
    return event;
  }
  const auto current = snapshot();
  if (!current->session_id.empty()) {
    data->set("session_id", current->session_id);
  }
  if (!current->metadata.empty()) {
    data->set("metadata", current->metadata);
  }
  return event;
}

void SelectiveEnricher::update_session_id(std::string session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto next = std::make_shared<Snapshot>(*snapshot_);
  next->session_id = std::move(session_id);
  snapshot_ = std::move(next);
}

void SelectiveEnricher::update_metadata(Object metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto next = std::make_shared<Snapshot>(*snapshot_);
  next->metadata = std::move(metadata);
  snapshot_ = std::move(next);
}

void SelectiveEnricher::add_metadata_field(const std::string &key, Value value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto next = std::make_shared<Snapshot>(*snapshot_);
  next->metadata.set(key, std::move(value));
  snapshot_ = std::move(next);
}

void SelectiveEnricher::update_context(const std::string &key, Value value) {
  add_metadata_field(key, std::move(value));
}

std::string SelectiveEnricher::session_id() const { return snapshot()->session_id; }

Object SelectiveEnricher::metadata() const { return snapshot()->metadata; }

GlobalEnricher::GlobalEnricher(Object inject_fields)
    : fields_(std::make_shared<const Object>(std::move(inject_fields))) {}

OutboundEvent GlobalEnricher::enrich(OutboundEvent event) const {
  Object *data = event.data();
  if (data == nullptr) {
    return event;
  }
  std::shared_ptr<const Object> fields;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fields = fields_;
  }
  data->merge(*fields);
  return event;
}

void GlobalEnricher::update_inject_fields(Object inject_fields) {
  auto next = std::make_shared<const Object>(std::move(inject_fields));
  std::lock_guard<std::mutex> lock(mutex_);
  fields_ = std::move(next);
}

void GlobalEnricher::update_context(const std::string &key, Value value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto next = std::make_shared<Object>(*fields_);
  next->set(key, std::move(value));
  fields_ = std::move(next);
}

Object GlobalEnricher::inject_fields() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return *fields_;
}

} // namespace voxrelay::events
