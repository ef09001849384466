#pragma once

#include "voxrelay/events/event.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace voxrelay::events {

/// Injects session-scoped context into the `data` section of outbound events.
/// Events without an object-valued `data` member pass through untouched.
/// Implementations are safe to mutate from any thread; each `enrich` call works on
/// one consistent snapshot of the configuration.
class IEventEnricher {
public:
  virtual ~IEventEnricher() = default;

  [[nodiscard]] virtual OutboundEvent enrich(OutboundEvent event) const = 0;
  [[nodiscard]] virtual std::string_view policy() const = 0;

  /// Runtime update of a single context field. Selective enrichers treat it as a
  /// metadata field, global enrichers as an injected field.
  virtual void update_context(const std::string &key, Value value) = 0;
};

/// Adds `session_id` and `metadata` (each only when non-empty).
class SelectiveEnricher final : public IEventEnricher {
public:
  SelectiveEnricher(std::string session_id, Object metadata);

  [[nodiscard]] OutboundEvent enrich(OutboundEvent event) const override;
  [[nodiscard]] std::string_view policy() const override { return "selective"; }
  void update_context(const std::string &key, Value value) override;

  void update_session_id(std::string session_id);
  void update_metadata(Object metadata);
  void add_metadata_field(const std::string &key, Value value);

  [[nodiscard]] std::string session_id() const;
  [[nodiscard]] Object metadata() const;

private:
  struct Snapshot {
    std::string session_id;
    Object metadata;
  };

  [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
};

/// Merges an arbitrary mapping into every `data` section; injected keys win.
class GlobalEnricher final : public IEventEnricher {
public:
  explicit GlobalEnricher(Object inject_fields);

  [[nodiscard]] OutboundEvent enrich(OutboundEvent event) const override;
  [[nodiscard]] std::string_view policy() const override { return "global"; }
  void update_context(const std::string &key, Value value) override;

  void update_inject_fields(Object inject_fields);
  [[nodiscard]] Object inject_fields() const;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const Object> fields_;
};

} // namespace voxrelay::events
